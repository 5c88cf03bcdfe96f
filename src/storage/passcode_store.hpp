#pragma once

#include "core/result.hpp"
#include "crypto/secret.hpp"

#include <QMutex>
#include <QString>
#include <optional>

namespace lanlog::storage {

/**
 * PasscodeStore - passcodes accepted by protected peers, keyed by display name.
 *
 * get() never fails: anything unreadable is reported as "no stored passcode".
 */
class PasscodeStore {
public:
    virtual ~PasscodeStore() = default;

    [[nodiscard]] virtual std::optional<QString> get(const QString& name) const = 0;
    virtual Result<void, Error> set(const QString& name, const QString& passcode) = 0;
    virtual Result<void, Error> remove(const QString& name) = 0;
};

/**
 * SettingsPasscodeStore - INI file of sealed passcodes.
 *
 * Each value is base64(nonce || secretbox ciphertext) under a per-installation
 * key read from `key_path`. The key file is created (owner read/write only) by
 * the first set(). Settings keys are the hex-encoded UTF-8 peer names.
 *
 * Reads may run concurrently; writes are serialized.
 */
class SettingsPasscodeStore final : public PasscodeStore {
public:
    SettingsPasscodeStore(QString settings_path, QString key_path);

    [[nodiscard]] std::optional<QString> get(const QString& name) const override;
    Result<void, Error> set(const QString& name, const QString& passcode) override;
    Result<void, Error> remove(const QString& name) override;

    [[nodiscard]] const QString& settingsPath() const { return settings_path_; }
    [[nodiscard]] const QString& keyPath() const { return key_path_; }

private:
    [[nodiscard]] Result<crypto::SymmetricKey, Error> load_key() const;
    [[nodiscard]] Result<crypto::SymmetricKey, Error> load_or_create_key();

    static QString settings_key(const QString& name);

    QString settings_path_;
    QString key_path_;
    QMutex write_mutex_;
};

} // namespace lanlog::storage
