#include <catch2/catch_test_macros.hpp>
#include "network/handshake.hpp"

using namespace lanlog;
using namespace lanlog::network;

TEST_CASE("Handshake: hello carries device identity", "[handshake]") {
    ClientHello hello;
    hello.device_id = Uuid::generate();
    hello.name = QStringLiteral("Laptop");

    auto decoded = decode_client_hello(encode(hello));
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap().device_id == hello.device_id);
    REQUIRE(decoded.unwrap().name == QStringLiteral("Laptop"));
    REQUIRE(decoded.unwrap().version == kHandshakeVersion);
}

TEST_CASE("Handshake: challenge keeps the nonce", "[handshake]") {
    ServerChallenge challenge;
    challenge.is_protected = true;
    challenge.nonce = crypto::random_challenge();

    auto decoded = decode_server_challenge(encode(challenge));
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap().is_protected);
    REQUIRE(decoded.unwrap().nonce == challenge.nonce);
}

TEST_CASE("Handshake: malformed payloads are rejected", "[handshake]") {
    CHECK(decode_client_hello(QByteArray("not json")).is_err());
    CHECK(decode_client_hello(QByteArray("{}")).is_err());
    CHECK(decode_server_challenge(QByteArray(R"({"v":1,"protected":true,"nonce":"AAAA"})")).is_err());
    CHECK(decode_client_proof(QByteArray(R"({"proof":"%%%"})")).is_err());
}

TEST_CASE("Handshake: reject reasons map to connection errors", "[handshake]") {
    for (auto reason : {RejectReason::InvalidPasscode, RejectReason::PasscodeRequired,
                        RejectReason::Protocol}) {
        auto decoded = decode_handshake_reject(encode(HandshakeReject{reason}));
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.unwrap().reason == reason);
    }

    CHECK(to_connection_error(RejectReason::InvalidPasscode).kind ==
          ConnectionErrorKind::InvalidPasscode);
    CHECK(to_connection_error(RejectReason::PasscodeRequired).kind ==
          ConnectionErrorKind::PasscodeRequired);
    CHECK(to_connection_error(RejectReason::Protocol).kind == ConnectionErrorKind::Rejected);

    auto unknown = decode_handshake_reject(QByteArray(R"({"reason":"banned"})"));
    REQUIRE(unknown.is_ok());
    REQUIRE(unknown.unwrap().reason == RejectReason::Protocol);
}

TEST_CASE("Handshake: proof verifies only with the right passcode", "[handshake][crypto]") {
    REQUIRE(crypto::init().is_ok());

    ServerChallenge challenge;
    challenge.is_protected = true;
    challenge.nonce = crypto::random_challenge();
    const auto device = Uuid::generate();

    const auto proof = make_proof(QStringLiteral("1234"), challenge, device);
    REQUIRE(proof.proof.size() == crypto::PROOF_SIZE);

    auto decoded = decode_client_proof(encode(proof));
    REQUIRE(decoded.is_ok());
    const auto& received = decoded.unwrap().proof;

    CHECK(crypto::verify_passcode_proof(received, "1234", challenge.nonce, device));
    CHECK_FALSE(crypto::verify_passcode_proof(received, "0000", challenge.nonce, device));
    CHECK_FALSE(crypto::verify_passcode_proof(received, "1234", crypto::random_challenge(), device));
    CHECK_FALSE(crypto::verify_passcode_proof(received, "1234", challenge.nonce, Uuid::generate()));

    CHECK(make_proof(QString(), challenge, device).proof.empty());
}
