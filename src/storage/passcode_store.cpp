#include "storage/passcode_store.hpp"
#include "core/logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QSettings>

namespace lanlog::storage {

namespace {

constexpr const char* kGroup = "passcodes";

bool write_bytes_atomic(const QString& path, const QByteArray& bytes) {
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    if (file.write(bytes) != bytes.size()) {
        return false;
    }
    return file.commit();
}

} // namespace

SettingsPasscodeStore::SettingsPasscodeStore(QString settings_path, QString key_path)
    : settings_path_(std::move(settings_path))
    , key_path_(std::move(key_path))
{}

QString SettingsPasscodeStore::settings_key(const QString& name) {
    return QStringLiteral("%1/%2").arg(QString::fromLatin1(kGroup),
                                       QString::fromLatin1(name.toUtf8().toHex()));
}

Result<crypto::SymmetricKey, Error> SettingsPasscodeStore::load_key() const {
    QFile file(key_path_);
    if (!file.exists()) {
        return Result<crypto::SymmetricKey, Error>::err(Error{"Key file does not exist"});
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<crypto::SymmetricKey, Error>::err(
            Error{"Cannot read key file: " + file.errorString().toStdString()});
    }

    const QByteArray bytes = file.readAll();
    crypto::SymmetricKey key;
    if (static_cast<size_t>(bytes.size()) != key.size()) {
        return Result<crypto::SymmetricKey, Error>::err(Error{"Key file has wrong size"});
    }
    std::copy(bytes.begin(), bytes.end(), key.begin());
    return Result<crypto::SymmetricKey, Error>::ok(key);
}

Result<crypto::SymmetricKey, Error> SettingsPasscodeStore::load_or_create_key() {
    if (QFile::exists(key_path_)) {
        // An existing but unreadable key is not replaced: that would orphan
        // every value sealed with it.
        return load_key();
    }

    const auto dir = QFileInfo(key_path_).absolutePath();
    if (!QDir().mkpath(dir)) {
        return Result<crypto::SymmetricKey, Error>::err(
            Error{"Cannot create directory " + dir.toStdString()});
    }

    const auto key = crypto::generate_symmetric_key();
    const QByteArray bytes(reinterpret_cast<const char*>(key.data()),
                           static_cast<qsizetype>(key.size()));
    if (!write_bytes_atomic(key_path_, bytes)) {
        return Result<crypto::SymmetricKey, Error>::err(
            Error{"Cannot write key file " + key_path_.toStdString()});
    }
    QFile::setPermissions(key_path_, QFileDevice::ReadOwner | QFileDevice::WriteOwner);

    qCInfo(lcPasscodes) << "created passcode key" << key_path_;
    return Result<crypto::SymmetricKey, Error>::ok(key);
}

std::optional<QString> SettingsPasscodeStore::get(const QString& name) const {
    QSettings settings(settings_path_, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        qCWarning(lcPasscodes) << "passcode store unreadable:" << settings_path_;
        return std::nullopt;
    }

    const auto stored = settings.value(settings_key(name)).toString();
    if (stored.isEmpty()) {
        return std::nullopt;
    }

    auto key = load_key();
    if (key.is_err()) {
        qCWarning(lcPasscodes) << "passcode key unavailable:"
                               << QString::fromStdString(key.unwrap_err().message);
        return std::nullopt;
    }

    auto sealed = crypto::from_base64(stored.toStdString());
    if (sealed.is_err()) {
        qCWarning(lcPasscodes) << "stored passcode for" << name << "is not valid base64";
        return std::nullopt;
    }

    auto plaintext = crypto::unseal(key.unwrap(), sealed.unwrap());
    if (plaintext.is_err()) {
        qCWarning(lcPasscodes) << "stored passcode for" << name << "cannot be opened:"
                               << QString::fromStdString(plaintext.unwrap_err().message);
        return std::nullopt;
    }

    return QString::fromStdString(plaintext.unwrap());
}

Result<void, Error> SettingsPasscodeStore::set(const QString& name, const QString& passcode) {
    QMutexLocker lock(&write_mutex_);

    auto key = load_or_create_key();
    if (key.is_err()) {
        return Result<void, Error>::err(key.unwrap_err());
    }

    const auto sealed = crypto::seal(key.unwrap(), passcode.toStdString());

    QSettings settings(settings_path_, QSettings::IniFormat);
    settings.setValue(settings_key(name), QString::fromStdString(crypto::to_base64(sealed)));
    settings.sync();
    if (settings.status() != QSettings::NoError) {
        return Result<void, Error>::err(Error{"Cannot write " + settings_path_.toStdString()});
    }

    qCInfo(lcPasscodes) << "stored passcode for" << name;
    return Result<void, Error>::ok();
}

Result<void, Error> SettingsPasscodeStore::remove(const QString& name) {
    QMutexLocker lock(&write_mutex_);

    QSettings settings(settings_path_, QSettings::IniFormat);
    settings.remove(settings_key(name));
    settings.sync();
    if (settings.status() != QSettings::NoError) {
        return Result<void, Error>::err(Error{"Cannot write " + settings_path_.toStdString()});
    }

    qCInfo(lcPasscodes) << "removed passcode for" << name;
    return Result<void, Error>::ok();
}

} // namespace lanlog::storage
