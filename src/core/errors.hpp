#pragma once

#include <QMetaType>
#include <QString>

namespace lanlog {

/**
 * DiscoveryErrorKind - why the browser stopped producing results.
 */
enum class DiscoveryErrorKind {
    Unavailable,       // mDNS daemon missing, interface down, socket could not bind
    PermissionDenied,  // local network access refused
    Failure            // anything else the backend reported
};

struct DiscoveryError {
    DiscoveryErrorKind kind = DiscoveryErrorKind::Failure;
    QString message;

    bool operator==(const DiscoveryError&) const = default;
};

/**
 * ConnectionErrorKind - terminal reason of one connect attempt.
 */
enum class ConnectionErrorKind {
    InvalidPasscode,
    PasscodeRequired,
    Timeout,
    Unreachable,
    Rejected,
    Protocol
};

struct ConnectionError {
    ConnectionErrorKind kind = ConnectionErrorKind::Unreachable;
    QString message;

    [[nodiscard]] bool is_passcode_error() const {
        return kind == ConnectionErrorKind::InvalidPasscode ||
               kind == ConnectionErrorKind::PasscodeRequired;
    }

    bool operator==(const ConnectionError&) const = default;
};

[[nodiscard]] const char* to_string(DiscoveryErrorKind kind);
[[nodiscard]] const char* to_string(ConnectionErrorKind kind);

// User-facing one-line descriptions.
[[nodiscard]] QString describe(const DiscoveryError& error);
[[nodiscard]] QString describe(const ConnectionError& error);

} // namespace lanlog

Q_DECLARE_METATYPE(lanlog::DiscoveryError)
Q_DECLARE_METATYPE(lanlog::ConnectionError)
