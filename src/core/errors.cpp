#include "core/errors.hpp"

namespace lanlog {

const char* to_string(DiscoveryErrorKind kind) {
    switch (kind) {
        case DiscoveryErrorKind::Unavailable: return "unavailable";
        case DiscoveryErrorKind::PermissionDenied: return "permission_denied";
        case DiscoveryErrorKind::Failure: return "failure";
    }
    return "failure";
}

const char* to_string(ConnectionErrorKind kind) {
    switch (kind) {
        case ConnectionErrorKind::InvalidPasscode: return "invalid_passcode";
        case ConnectionErrorKind::PasscodeRequired: return "passcode_required";
        case ConnectionErrorKind::Timeout: return "timeout";
        case ConnectionErrorKind::Unreachable: return "unreachable";
        case ConnectionErrorKind::Rejected: return "rejected";
        case ConnectionErrorKind::Protocol: return "protocol";
    }
    return "unreachable";
}

QString describe(const DiscoveryError& error) {
    QString summary;
    switch (error.kind) {
        case DiscoveryErrorKind::Unavailable:
            summary = QStringLiteral("Local network discovery is unavailable");
            break;
        case DiscoveryErrorKind::PermissionDenied:
            summary = QStringLiteral("Local network access was denied");
            break;
        case DiscoveryErrorKind::Failure:
            summary = QStringLiteral("Device discovery failed");
            break;
    }
    if (error.message.isEmpty()) {
        return summary;
    }
    return summary + QStringLiteral(": ") + error.message;
}

QString describe(const ConnectionError& error) {
    QString summary;
    switch (error.kind) {
        case ConnectionErrorKind::InvalidPasscode:
            summary = QStringLiteral("Invalid passcode");
            break;
        case ConnectionErrorKind::PasscodeRequired:
            summary = QStringLiteral("Passcode required");
            break;
        case ConnectionErrorKind::Timeout:
            summary = QStringLiteral("Connection timed out");
            break;
        case ConnectionErrorKind::Unreachable:
            summary = QStringLiteral("Device unreachable");
            break;
        case ConnectionErrorKind::Rejected:
            summary = QStringLiteral("Connection rejected");
            break;
        case ConnectionErrorKind::Protocol:
            summary = QStringLiteral("Unexpected response from device");
            break;
    }
    if (error.message.isEmpty()) {
        return summary;
    }
    return summary + QStringLiteral(": ") + error.message;
}

} // namespace lanlog
