#pragma once

#include "core/errors.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "crypto/secret.hpp"

#include <QByteArray>
#include <QString>
#include <vector>

namespace lanlog::network {

/**
 * Pairing handshake payloads (compact JSON inside transport frames).
 *
 *   client                         server
 *   ClientHello {v, id, name}  ->
 *                              <-  ServerChallenge {v, protected, nonce}
 *   ClientProof {proof}        ->
 *                              <-  HandshakeAccept {name} | HandshakeReject {reason}
 *
 * proof = HMAC-SHA-256(BLAKE2b(passcode), nonce || device id), base64; empty
 * when the client has no passcode.
 */
inline constexpr int kHandshakeVersion = 1;

struct ClientHello {
    int version = kHandshakeVersion;
    Uuid device_id;
    QString name;
};

struct ServerChallenge {
    int version = kHandshakeVersion;
    bool is_protected = false;
    crypto::Challenge nonce{};
};

struct ClientProof {
    std::vector<uint8_t> proof;
};

struct HandshakeAccept {
    QString name;
};

enum class RejectReason {
    InvalidPasscode,
    PasscodeRequired,
    Protocol
};

struct HandshakeReject {
    RejectReason reason = RejectReason::Protocol;
};

[[nodiscard]] const char* to_string(RejectReason reason);
[[nodiscard]] ConnectionError to_connection_error(RejectReason reason);

QByteArray encode(const ClientHello& msg);
QByteArray encode(const ServerChallenge& msg);
QByteArray encode(const ClientProof& msg);
QByteArray encode(const HandshakeAccept& msg);
QByteArray encode(const HandshakeReject& msg);

Result<ClientHello, Error> decode_client_hello(const QByteArray& payload);
Result<ServerChallenge, Error> decode_server_challenge(const QByteArray& payload);
Result<ClientProof, Error> decode_client_proof(const QByteArray& payload);
Result<HandshakeAccept, Error> decode_handshake_accept(const QByteArray& payload);
Result<HandshakeReject, Error> decode_handshake_reject(const QByteArray& payload);

/**
 * Proof for `challenge`; empty when `passcode` is empty.
 */
[[nodiscard]] ClientProof make_proof(const QString& passcode,
                                     const ServerChallenge& challenge,
                                     const Uuid& device_id);

} // namespace lanlog::network
