#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <array>
#include <string>
#include <vector>

#include <sodium.h>

namespace lanlog::crypto {

constexpr size_t CHALLENGE_SIZE = 32;
constexpr size_t PROOF_SIZE = crypto_auth_hmacsha256_BYTES;
constexpr size_t SYMMETRIC_KEY_SIZE = crypto_secretbox_KEYBYTES;

using Challenge = std::array<uint8_t, CHALLENGE_SIZE>;
using Proof = std::array<uint8_t, PROOF_SIZE>;
using SymmetricKey = std::array<uint8_t, SYMMETRIC_KEY_SIZE>;

/**
 * Initialize libsodium. Must succeed before any other call in this namespace.
 */
[[nodiscard]] inline Result<void, Error> init() {
    if (sodium_init() < 0) {
        return Result<void, Error>::err(Error{"Failed to initialize libsodium"});
    }
    return Result<void, Error>::ok();
}

/**
 * Fresh random challenge for one handshake.
 */
[[nodiscard]] inline Challenge random_challenge() {
    Challenge challenge;
    randombytes_buf(challenge.data(), challenge.size());
    return challenge;
}

[[nodiscard]] inline SymmetricKey generate_symmetric_key() {
    SymmetricKey key;
    crypto_secretbox_keygen(key.data());
    return key;
}

/**
 * Proof that the client knows the passcode:
 * HMAC-SHA-256(key = BLAKE2b-256(passcode), challenge || device id).
 *
 * The passcode itself never leaves the device.
 */
[[nodiscard]] inline Proof passcode_proof(const std::string& passcode,
                                          const Challenge& challenge,
                                          const Uuid& device_id) {
    std::array<uint8_t, crypto_auth_hmacsha256_KEYBYTES> key;
    crypto_generichash(key.data(), key.size(),
                       reinterpret_cast<const unsigned char*>(passcode.data()),
                       passcode.size(), nullptr, 0);

    std::vector<uint8_t> message(challenge.begin(), challenge.end());
    message.insert(message.end(), device_id.bytes().begin(), device_id.bytes().end());

    Proof proof;
    crypto_auth_hmacsha256(proof.data(), message.data(), message.size(), key.data());
    sodium_memzero(key.data(), key.size());
    return proof;
}

/**
 * Constant-time check of a proof received from a client.
 */
[[nodiscard]] inline bool verify_passcode_proof(const std::vector<uint8_t>& proof,
                                                const std::string& passcode,
                                                const Challenge& challenge,
                                                const Uuid& device_id) {
    if (proof.size() != PROOF_SIZE) {
        return false;
    }
    const auto expected = passcode_proof(passcode, challenge, device_id);
    return sodium_memcmp(proof.data(), expected.data(), PROOF_SIZE) == 0;
}

/**
 * Encrypt and authenticate. Output layout: nonce || ciphertext.
 */
[[nodiscard]] inline std::vector<uint8_t> seal(const SymmetricKey& key,
                                               const std::string& plaintext) {
    std::vector<uint8_t> out(crypto_secretbox_NONCEBYTES +
                             crypto_secretbox_MACBYTES + plaintext.size());
    randombytes_buf(out.data(), crypto_secretbox_NONCEBYTES);
    crypto_secretbox_easy(out.data() + crypto_secretbox_NONCEBYTES,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          plaintext.size(),
                          out.data(),
                          key.data());
    return out;
}

[[nodiscard]] inline Result<std::string, Error> unseal(const SymmetricKey& key,
                                                       const std::vector<uint8_t>& sealed) {
    if (sealed.size() < crypto_secretbox_NONCEBYTES + crypto_secretbox_MACBYTES) {
        return Result<std::string, Error>::err(Error{"Sealed value too short"});
    }
    const size_t cipher_len = sealed.size() - crypto_secretbox_NONCEBYTES;
    std::string plaintext(cipher_len - crypto_secretbox_MACBYTES, '\0');
    if (crypto_secretbox_open_easy(reinterpret_cast<unsigned char*>(plaintext.data()),
                                   sealed.data() + crypto_secretbox_NONCEBYTES,
                                   cipher_len,
                                   sealed.data(),
                                   key.data()) != 0) {
        return Result<std::string, Error>::err(Error{"Authentication failed"});
    }
    return Result<std::string, Error>::ok(std::move(plaintext));
}

[[nodiscard]] inline std::string to_base64(const uint8_t* data, size_t len) {
    const int variant = sodium_base64_VARIANT_ORIGINAL;
    std::string out(sodium_base64_ENCODED_LEN(len, variant), '\0');
    sodium_bin2base64(out.data(), out.size(), data, len, variant);
    out.resize(out.size() - 1);  // drop terminator
    return out;
}

[[nodiscard]] inline std::string to_base64(const std::vector<uint8_t>& data) {
    return to_base64(data.data(), data.size());
}

template<size_t N>
[[nodiscard]] std::string to_base64(const std::array<uint8_t, N>& data) {
    return to_base64(data.data(), data.size());
}

[[nodiscard]] inline Result<std::vector<uint8_t>, Error> from_base64(const std::string& b64) {
    std::vector<uint8_t> out(b64.size() / 4 * 3 + 3);
    size_t out_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(out.data(), out.size(), b64.data(), b64.size(),
                          nullptr, &out_len, &end,
                          sodium_base64_VARIANT_ORIGINAL) != 0 ||
        end != b64.data() + b64.size()) {
        return Result<std::vector<uint8_t>, Error>::err(Error{"Invalid Base64"});
    }
    out.resize(out_len);
    return Result<std::vector<uint8_t>, Error>::ok(std::move(out));
}

} // namespace lanlog::crypto
