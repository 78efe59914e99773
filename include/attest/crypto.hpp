#pragma once

#include "attest/result.hpp"
#include "attest/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace attest {

// ============================================================================
// Digest
// ============================================================================

/**
 * @brief A SHA-256 digest
 *
 * The all-zero digest is reserved as the sentinel for "nothing here yet":
 * the empty tree root and the genesis record's previous hash.
 */
struct Digest {
    static constexpr std::size_t SIZE = 32;

    std::array<std::uint8_t, SIZE> bytes{};

    static Digest zero() { return Digest{}; }
    static Digest filled(std::uint8_t value);

    bool is_zero() const;

    std::string to_hex() const;

    // Parse a 64 character hex string (either case). Reports a bad length
    // or the first non-hex character as INVALID_DIGEST.
    static Result<Digest> from_hex(const std::string& hex);

    bool operator==(const Digest& other) const { return bytes == other.bytes; }
    bool operator!=(const Digest& other) const { return bytes != other.bytes; }
    bool operator<(const Digest& other) const { return bytes < other.bytes; }
};

struct DigestHash {
    std::size_t operator()(const Digest& d) const;
};

// ============================================================================
// Hasher
// ============================================================================

/**
 * @brief Incremental SHA-256 (OpenSSL EVP) with typed updates
 *
 * Integers are appended big-endian and strings/byte blobs are prefixed with
 * their 32-bit big-endian length, so that the encoding of a field sequence
 * is unambiguous. All canonical encodings in attest go through this class.
 */
class Hasher {
public:
    Hasher();
    ~Hasher();

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;

    Hasher& update(const std::uint8_t* data, std::size_t len);
    Hasher& update(const Bytes& data);

    Hasher& update_u8(std::uint8_t v);
    Hasher& update_u32(std::uint32_t v);
    Hasher& update_u64(std::uint64_t v);
    Hasher& update_i64(std::int64_t v);
    Hasher& update_bool(bool v);

    // Length-prefixed
    Hasher& update_string(const std::string& s);
    Hasher& update_blob(const Bytes& b);

    Hasher& update_digest(const Digest& d);

    // Produce the digest. The hasher must not be updated afterwards.
    Digest finish();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

Digest sha256(const Bytes& data);
Digest sha256(const std::string& data);

// ============================================================================
// Keys and Signatures (Ed25519)
// ============================================================================

using Signature = Bytes;

/**
 * @brief Raw Ed25519 public key (32 bytes)
 */
struct PublicKey {
    static constexpr std::size_t SIZE = 32;

    Bytes raw;

    bool empty() const { return raw.empty(); }
    std::string to_hex() const { return bytes_to_hex(raw); }
    static Result<PublicKey> from_hex(const std::string& hex);

    bool operator==(const PublicKey& other) const { return raw == other.raw; }
    bool operator!=(const PublicKey& other) const { return raw != other.raw; }
    bool operator<(const PublicKey& other) const { return raw < other.raw; }
};

/**
 * @brief Ed25519 private key, move-only owner of the native key handle
 *
 * A default-constructed PrivateKey holds no key; signing with it fails with
 * KEY_UNAVAILABLE.
 */
class PrivateKey {
public:
    PrivateKey();
    ~PrivateKey();

    PrivateKey(PrivateKey&&) noexcept;
    PrivateKey& operator=(PrivateKey&&) noexcept;

    PrivateKey(const PrivateKey&) = delete;
    PrivateKey& operator=(const PrivateKey&) = delete;

    static Result<PrivateKey> generate();
    static Result<PrivateKey> from_pem(const std::string& pem);
    static Result<PrivateKey> load_pem_file(const std::string& path);

    Result<std::string> to_pem() const;

    bool valid() const;
    PublicKey public_key() const;

    void* native_handle() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Sign a message. Fails with KEY_UNAVAILABLE if the key is not loaded.
Result<Signature> sign(const PrivateKey& key, const Bytes& message);
Result<Signature> sign(const PrivateKey& key, const Digest& message);

// Verify a signature. Never throws; malformed keys or signatures yield false.
bool verify(const PublicKey& key, const Bytes& message, const Signature& signature);
bool verify(const PublicKey& key, const Digest& message, const Signature& signature);

} // namespace attest
