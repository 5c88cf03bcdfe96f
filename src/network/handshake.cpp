#include "network/handshake.hpp"

#include <QJsonDocument>
#include <QJsonObject>

namespace lanlog::network {

namespace {

QByteArray to_bytes(const QJsonObject& obj) {
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

Result<QJsonObject, Error> parse_object(const QByteArray& payload) {
    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(payload, &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        return Result<QJsonObject, Error>::err(Error{"Payload is not a JSON object"});
    }
    return Result<QJsonObject, Error>::ok(doc.object());
}

Result<int, Error> check_version(const QJsonObject& obj) {
    if (!obj.contains("v")) {
        return Result<int, Error>::err(Error{"Missing version"});
    }
    const int version = obj["v"].toInt();
    if (version != kHandshakeVersion) {
        return Result<int, Error>::err(Error{"Unsupported handshake version"});
    }
    return Result<int, Error>::ok(version);
}

} // namespace

const char* to_string(RejectReason reason) {
    switch (reason) {
        case RejectReason::InvalidPasscode: return "invalid_passcode";
        case RejectReason::PasscodeRequired: return "passcode_required";
        case RejectReason::Protocol: return "protocol";
    }
    return "protocol";
}

ConnectionError to_connection_error(RejectReason reason) {
    switch (reason) {
        case RejectReason::InvalidPasscode:
            return ConnectionError{ConnectionErrorKind::InvalidPasscode,
                                   QStringLiteral("The passcode was not accepted")};
        case RejectReason::PasscodeRequired:
            return ConnectionError{ConnectionErrorKind::PasscodeRequired,
                                   QStringLiteral("The server requires a passcode")};
        case RejectReason::Protocol:
            break;
    }
    return ConnectionError{ConnectionErrorKind::Rejected,
                           QStringLiteral("The server rejected the connection")};
}

QByteArray encode(const ClientHello& msg) {
    QJsonObject obj;
    obj["v"] = msg.version;
    obj["id"] = QString::fromStdString(msg.device_id.to_string());
    obj["name"] = msg.name;
    return to_bytes(obj);
}

QByteArray encode(const ServerChallenge& msg) {
    QJsonObject obj;
    obj["v"] = msg.version;
    obj["protected"] = msg.is_protected;
    obj["nonce"] = QString::fromStdString(crypto::to_base64(msg.nonce));
    return to_bytes(obj);
}

QByteArray encode(const ClientProof& msg) {
    QJsonObject obj;
    obj["proof"] = msg.proof.empty() ? QString() : QString::fromStdString(crypto::to_base64(msg.proof));
    return to_bytes(obj);
}

QByteArray encode(const HandshakeAccept& msg) {
    QJsonObject obj;
    obj["name"] = msg.name;
    return to_bytes(obj);
}

QByteArray encode(const HandshakeReject& msg) {
    QJsonObject obj;
    obj["reason"] = QString::fromLatin1(to_string(msg.reason));
    return to_bytes(obj);
}

Result<ClientHello, Error> decode_client_hello(const QByteArray& payload) {
    auto parsed = parse_object(payload);
    if (parsed.is_err()) return Result<ClientHello, Error>::err(parsed.unwrap_err());
    const auto obj = parsed.unwrap();

    auto version = check_version(obj);
    if (version.is_err()) return Result<ClientHello, Error>::err(version.unwrap_err());

    const auto id = Uuid::parse(obj["id"].toString().toStdString());
    if (!id || id->is_nil()) {
        return Result<ClientHello, Error>::err(Error{"Invalid device id"});
    }

    ClientHello hello;
    hello.version = version.unwrap();
    hello.device_id = *id;
    hello.name = obj["name"].toString();
    return Result<ClientHello, Error>::ok(std::move(hello));
}

Result<ServerChallenge, Error> decode_server_challenge(const QByteArray& payload) {
    auto parsed = parse_object(payload);
    if (parsed.is_err()) return Result<ServerChallenge, Error>::err(parsed.unwrap_err());
    const auto obj = parsed.unwrap();

    auto version = check_version(obj);
    if (version.is_err()) return Result<ServerChallenge, Error>::err(version.unwrap_err());

    if (!obj["protected"].isBool()) {
        return Result<ServerChallenge, Error>::err(Error{"Missing protection flag"});
    }

    auto nonce = crypto::from_base64(obj["nonce"].toString().toStdString());
    if (nonce.is_err() || nonce.unwrap().size() != crypto::CHALLENGE_SIZE) {
        return Result<ServerChallenge, Error>::err(Error{"Invalid nonce"});
    }

    ServerChallenge challenge;
    challenge.version = version.unwrap();
    challenge.is_protected = obj["protected"].toBool();
    std::copy(nonce.unwrap().begin(), nonce.unwrap().end(), challenge.nonce.begin());
    return Result<ServerChallenge, Error>::ok(challenge);
}

Result<ClientProof, Error> decode_client_proof(const QByteArray& payload) {
    auto parsed = parse_object(payload);
    if (parsed.is_err()) return Result<ClientProof, Error>::err(parsed.unwrap_err());
    const auto obj = parsed.unwrap();

    if (!obj["proof"].isString()) {
        return Result<ClientProof, Error>::err(Error{"Missing proof"});
    }

    ClientProof proof;
    const auto encoded = obj["proof"].toString();
    if (!encoded.isEmpty()) {
        auto bytes = crypto::from_base64(encoded.toStdString());
        if (bytes.is_err()) {
            return Result<ClientProof, Error>::err(bytes.unwrap_err());
        }
        proof.proof = std::move(bytes).unwrap();
    }
    return Result<ClientProof, Error>::ok(std::move(proof));
}

Result<HandshakeAccept, Error> decode_handshake_accept(const QByteArray& payload) {
    auto parsed = parse_object(payload);
    if (parsed.is_err()) return Result<HandshakeAccept, Error>::err(parsed.unwrap_err());

    HandshakeAccept accept;
    accept.name = parsed.unwrap()["name"].toString();
    return Result<HandshakeAccept, Error>::ok(std::move(accept));
}

Result<HandshakeReject, Error> decode_handshake_reject(const QByteArray& payload) {
    auto parsed = parse_object(payload);
    if (parsed.is_err()) return Result<HandshakeReject, Error>::err(parsed.unwrap_err());

    const auto reason = parsed.unwrap()["reason"].toString();
    HandshakeReject reject;
    if (reason == QLatin1String("invalid_passcode")) {
        reject.reason = RejectReason::InvalidPasscode;
    } else if (reason == QLatin1String("passcode_required")) {
        reject.reason = RejectReason::PasscodeRequired;
    } else {
        // Unknown reasons from newer servers read as a plain rejection.
        reject.reason = RejectReason::Protocol;
    }
    return Result<HandshakeReject, Error>::ok(reject);
}

ClientProof make_proof(const QString& passcode,
                       const ServerChallenge& challenge,
                       const Uuid& device_id) {
    ClientProof proof;
    if (passcode.isEmpty()) {
        return proof;
    }
    const auto mac = crypto::passcode_proof(passcode.toStdString(), challenge.nonce, device_id);
    proof.proof.assign(mac.begin(), mac.end());
    return proof;
}

} // namespace lanlog::network
