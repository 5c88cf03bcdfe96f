#include <catch2/catch_test_macros.hpp>

#include <QFile>
#include <QSettings>
#include <QTemporaryDir>

#include "storage/passcode_store.hpp"

using lanlog::storage::SettingsPasscodeStore;

namespace {

struct StoreFixture {
    StoreFixture() {
        REQUIRE(lanlog::crypto::init().is_ok());
        REQUIRE(dir.isValid());
    }

    QString settingsPath() const { return dir.filePath(QStringLiteral("passcodes.ini")); }
    QString keyPath() const { return dir.filePath(QStringLiteral("keys/passcodes.key")); }

    QTemporaryDir dir;
};

} // namespace

TEST_CASE("PasscodeStore: stored passcodes survive a new instance", "[passcodes]") {
    StoreFixture fx;
    {
        SettingsPasscodeStore store(fx.settingsPath(), fx.keyPath());
        REQUIRE_FALSE(store.get(QStringLiteral("Desk")).has_value());
        REQUIRE(store.set(QStringLiteral("Desk"), QStringLiteral("1234")).is_ok());
        REQUIRE(store.set(QStringLiteral("Büro"), QStringLiteral("ß-42")).is_ok());
    }

    SettingsPasscodeStore reopened(fx.settingsPath(), fx.keyPath());
    CHECK(reopened.get(QStringLiteral("Desk")) == QStringLiteral("1234"));
    CHECK(reopened.get(QStringLiteral("Büro")) == QStringLiteral("ß-42"));
    CHECK_FALSE(reopened.get(QStringLiteral("desk")).has_value());
}

TEST_CASE("PasscodeStore: values are not stored in clear text", "[passcodes]") {
    StoreFixture fx;
    SettingsPasscodeStore store(fx.settingsPath(), fx.keyPath());
    REQUIRE(store.set(QStringLiteral("Desk"), QStringLiteral("super-secret")).is_ok());

    QFile file(fx.settingsPath());
    REQUIRE(file.open(QIODevice::ReadOnly));
    CHECK_FALSE(file.readAll().contains("super-secret"));

    CHECK(QFile::permissions(fx.keyPath()).testFlag(QFileDevice::ReadOwner));
    CHECK_FALSE(QFile::permissions(fx.keyPath()).testFlag(QFileDevice::ReadOther));
}

TEST_CASE("PasscodeStore: remove and overwrite", "[passcodes]") {
    StoreFixture fx;
    SettingsPasscodeStore store(fx.settingsPath(), fx.keyPath());

    REQUIRE(store.set(QStringLiteral("Desk"), QStringLiteral("1")).is_ok());
    REQUIRE(store.set(QStringLiteral("Desk"), QStringLiteral("2")).is_ok());
    CHECK(store.get(QStringLiteral("Desk")) == QStringLiteral("2"));

    REQUIRE(store.remove(QStringLiteral("Desk")).is_ok());
    CHECK_FALSE(store.get(QStringLiteral("Desk")).has_value());
    // Removing an absent name is not an error.
    CHECK(store.remove(QStringLiteral("Desk")).is_ok());
}

TEST_CASE("PasscodeStore: corrupt value reads as absent", "[passcodes]") {
    StoreFixture fx;
    SettingsPasscodeStore store(fx.settingsPath(), fx.keyPath());
    REQUIRE(store.set(QStringLiteral("Desk"), QStringLiteral("1234")).is_ok());

    {
        QSettings raw(fx.settingsPath(), QSettings::IniFormat);
        const auto key = QStringLiteral("passcodes/") +
                         QString::fromLatin1(QStringLiteral("Desk").toUtf8().toHex());
        REQUIRE(raw.contains(key));
        raw.setValue(key, QStringLiteral("bm90IHNlYWxlZA=="));
    }

    CHECK_FALSE(store.get(QStringLiteral("Desk")).has_value());
}

TEST_CASE("PasscodeStore: missing or damaged key reads as absent", "[passcodes]") {
    StoreFixture fx;
    SettingsPasscodeStore store(fx.settingsPath(), fx.keyPath());
    REQUIRE(store.set(QStringLiteral("Desk"), QStringLiteral("1234")).is_ok());

    SECTION("key replaced by garbage") {
        QFile::setPermissions(fx.keyPath(), QFileDevice::ReadOwner | QFileDevice::WriteOwner);
        QFile key(fx.keyPath());
        REQUIRE(key.open(QIODevice::WriteOnly | QIODevice::Truncate));
        key.write("short");
        key.close();

        CHECK_FALSE(store.get(QStringLiteral("Desk")).has_value());
        // A damaged key is never silently regenerated.
        CHECK(store.set(QStringLiteral("Other"), QStringLiteral("1")).is_err());
    }

    SECTION("key deleted") {
        REQUIRE(QFile::remove(fx.keyPath()));
        CHECK_FALSE(store.get(QStringLiteral("Desk")).has_value());
    }
}
