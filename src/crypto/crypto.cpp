#include "attest/crypto.hpp"

#include <cctype>
#include <cstring>
#include <fstream>
#include <new>
#include <sstream>
#include <stdexcept>

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

namespace attest {

// ============================================================================
// SHA-256 Implementation (using OpenSSL 3.0+ EVP API)
// ============================================================================

namespace {

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

// RAII wrapper for EVP_PKEY
class EvpPkey {
public:
    explicit EvpPkey(EVP_PKEY* pkey = nullptr) : pkey_(pkey) {}
    ~EvpPkey() { if (pkey_) EVP_PKEY_free(pkey_); }

    EvpPkey(const EvpPkey&) = delete;
    EvpPkey& operator=(const EvpPkey&) = delete;

    EVP_PKEY* get() { return pkey_; }
    explicit operator bool() const { return pkey_ != nullptr; }

private:
    EVP_PKEY* pkey_;
};

// RAII wrapper for BIO
class Bio {
public:
    explicit Bio(BIO* bio) : bio_(bio) {}
    ~Bio() { if (bio_) BIO_free(bio_); }

    Bio(const Bio&) = delete;
    Bio& operator=(const Bio&) = delete;

    BIO* get() { return bio_; }
    explicit operator bool() const { return bio_ != nullptr; }

private:
    BIO* bio_;
};

} // namespace

// ============================================================================
// Digest
// ============================================================================

Digest Digest::filled(std::uint8_t value) {
    Digest d;
    d.bytes.fill(value);
    return d;
}

bool Digest::is_zero() const {
    for (auto b : bytes) {
        if (b != 0) return false;
    }
    return true;
}

std::string Digest::to_hex() const {
    return bytes_to_hex(bytes.data(), bytes.size());
}

Result<Digest> Digest::from_hex(const std::string& hex) {
    if (hex.size() != SIZE * 2) {
        return Result<Digest>::err(Error(ErrorCode::INVALID_DIGEST,
            "bad length of digest string; expected 64 chars, found " +
            std::to_string(hex.size())));
    }
    for (char c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return Result<Digest>::err(Error(ErrorCode::INVALID_DIGEST,
                std::string("bad character in digest string; '") + c + "' is not hexadecimal"));
        }
    }
    auto raw = hex_to_bytes(hex);
    if (!raw || raw->size() != SIZE) {
        return Result<Digest>::err(Error(ErrorCode::INVALID_DIGEST, "invalid digest: " + hex));
    }
    Digest d;
    std::memcpy(d.bytes.data(), raw->data(), SIZE);
    return Result<Digest>::ok(d);
}

std::size_t DigestHash::operator()(const Digest& d) const {
    // SHA-256 output is uniformly distributed; the first word is enough
    std::size_t h = 0;
    std::memcpy(&h, d.bytes.data(), sizeof(h));
    return h;
}

// ============================================================================
// Hasher
// ============================================================================

struct Hasher::Impl {
    EvpMdCtx ctx;
};

Hasher::Hasher() : impl_(std::make_unique<Impl>()) {
    // Both calls fail only on allocation failure
    if (!impl_->ctx || EVP_DigestInit_ex(impl_->ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::bad_alloc();
    }
}

Hasher::~Hasher() = default;

Hasher& Hasher::update(const std::uint8_t* data, std::size_t len) {
    if (len > 0 && EVP_DigestUpdate(impl_->ctx.get(), data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return *this;
}

Hasher& Hasher::update(const Bytes& data) {
    return update(data.data(), data.size());
}

Hasher& Hasher::update_u8(std::uint8_t v) {
    return update(&v, 1);
}

Hasher& Hasher::update_u32(std::uint32_t v) {
    std::uint8_t buf[4];
    for (int i = 0; i < 4; ++i) {
        buf[i] = static_cast<std::uint8_t>(v >> (8 * (3 - i)));
    }
    return update(buf, sizeof(buf));
}

Hasher& Hasher::update_u64(std::uint64_t v) {
    std::uint8_t buf[8];
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<std::uint8_t>(v >> (8 * (7 - i)));
    }
    return update(buf, sizeof(buf));
}

Hasher& Hasher::update_i64(std::int64_t v) {
    return update_u64(static_cast<std::uint64_t>(v));
}

Hasher& Hasher::update_bool(bool v) {
    return update_u8(v ? 1 : 0);
}

Hasher& Hasher::update_string(const std::string& s) {
    update_u32(static_cast<std::uint32_t>(s.size()));
    return update(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

Hasher& Hasher::update_blob(const Bytes& b) {
    update_u32(static_cast<std::uint32_t>(b.size()));
    return update(b);
}

Hasher& Hasher::update_digest(const Digest& d) {
    return update(d.bytes.data(), d.bytes.size());
}

Digest Hasher::finish() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx.get(), hash, &hash_len) != 1 || hash_len != Digest::SIZE) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    Digest d;
    std::memcpy(d.bytes.data(), hash, Digest::SIZE);
    return d;
}

Digest sha256(const Bytes& data) {
    Hasher h;
    h.update(data);
    return h.finish();
}

Digest sha256(const std::string& data) {
    Hasher h;
    h.update(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
    return h.finish();
}

// ============================================================================
// Public Key
// ============================================================================

Result<PublicKey> PublicKey::from_hex(const std::string& hex) {
    auto raw = hex_to_bytes(hex);
    if (!raw || raw->size() != SIZE) {
        return Result<PublicKey>::err(Error(ErrorCode::PARSE_ERROR,
            "public key must be 64 hex characters"));
    }
    PublicKey key;
    key.raw = std::move(*raw);
    return Result<PublicKey>::ok(std::move(key));
}

// ============================================================================
// Private Key
// ============================================================================

struct PrivateKey::Impl {
    EVP_PKEY* pkey = nullptr;

    ~Impl() {
        if (pkey) {
            EVP_PKEY_free(pkey);
        }
    }
};

PrivateKey::PrivateKey() : impl_(std::make_unique<Impl>()) {}

PrivateKey::~PrivateKey() = default;

PrivateKey::PrivateKey(PrivateKey&&) noexcept = default;
PrivateKey& PrivateKey::operator=(PrivateKey&&) noexcept = default;

Result<PrivateKey> PrivateKey::generate() {
    EVP_PKEY_CTX* raw_ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
    if (!raw_ctx) {
        return Result<PrivateKey>::err(Error(ErrorCode::KEY_UNAVAILABLE,
            "failed to create Ed25519 context"));
    }
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(raw_ctx, EVP_PKEY_CTX_free);

    if (EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        return Result<PrivateKey>::err(Error(ErrorCode::KEY_UNAVAILABLE,
            "failed to initialize Ed25519 keygen"));
    }

    PrivateKey key;
    if (EVP_PKEY_keygen(ctx.get(), &key.impl_->pkey) <= 0) {
        return Result<PrivateKey>::err(Error(ErrorCode::KEY_UNAVAILABLE,
            "failed to generate Ed25519 key pair"));
    }
    return Result<PrivateKey>::ok(std::move(key));
}

Result<PrivateKey> PrivateKey::from_pem(const std::string& pem) {
    Bio bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return Result<PrivateKey>::err(Error(ErrorCode::KEY_UNAVAILABLE,
            "failed to create BIO from PEM"));
    }

    PrivateKey key;
    key.impl_->pkey = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
    if (!key.impl_->pkey) {
        return Result<PrivateKey>::err(Error(ErrorCode::KEY_UNAVAILABLE,
            "failed to parse private key from PEM"));
    }
    if (EVP_PKEY_id(key.impl_->pkey) != EVP_PKEY_ED25519) {
        return Result<PrivateKey>::err(Error(ErrorCode::KEY_UNAVAILABLE,
            "private key is not Ed25519"));
    }
    return Result<PrivateKey>::ok(std::move(key));
}

Result<PrivateKey> PrivateKey::load_pem_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Result<PrivateKey>::err(Error(ErrorCode::KEY_UNAVAILABLE,
            "failed to open private key file: " + path));
    }
    std::stringstream ss;
    ss << file.rdbuf();
    auto result = from_pem(ss.str());
    if (result.isErr()) {
        result.error().withContext(path);
    }
    return result;
}

Result<std::string> PrivateKey::to_pem() const {
    if (!valid()) {
        return Result<std::string>::err(Error(ErrorCode::KEY_UNAVAILABLE, "no private key loaded"));
    }
    Bio bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        return Result<std::string>::err(Error(ErrorCode::IO_ERROR, "failed to create BIO"));
    }
    if (!PEM_write_bio_PrivateKey(bio.get(), impl_->pkey, nullptr, nullptr, 0, nullptr, nullptr)) {
        return Result<std::string>::err(Error(ErrorCode::IO_ERROR,
            "failed to write private key to PEM"));
    }
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return Result<std::string>::ok(std::string(data, static_cast<std::size_t>(len)));
}

bool PrivateKey::valid() const {
    return impl_ && impl_->pkey != nullptr;
}

PublicKey PrivateKey::public_key() const {
    PublicKey key;
    if (!valid()) return key;

    std::size_t len = PublicKey::SIZE;
    Bytes raw(len);
    if (EVP_PKEY_get_raw_public_key(impl_->pkey, raw.data(), &len) != 1 || len != PublicKey::SIZE) {
        return key;
    }
    key.raw = std::move(raw);
    return key;
}

void* PrivateKey::native_handle() const {
    return impl_ ? impl_->pkey : nullptr;
}

// ============================================================================
// Sign / Verify
// ============================================================================

Result<Signature> sign(const PrivateKey& key, const Bytes& message) {
    if (!key.valid()) {
        return Result<Signature>::err(Error(ErrorCode::KEY_UNAVAILABLE, "no private key loaded"));
    }

    EvpMdCtx ctx;
    if (!ctx) {
        return Result<Signature>::err(Error(ErrorCode::KEY_UNAVAILABLE, "EVP_MD_CTX_new failed"));
    }

    auto* pkey = static_cast<EVP_PKEY*>(key.native_handle());
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey) != 1) {
        return Result<Signature>::err(Error(ErrorCode::KEY_UNAVAILABLE, "EVP_DigestSignInit failed"));
    }

    std::size_t sig_len = 0;
    if (EVP_DigestSign(ctx.get(), nullptr, &sig_len, message.data(), message.size()) != 1) {
        return Result<Signature>::err(Error(ErrorCode::KEY_UNAVAILABLE, "EVP_DigestSign failed"));
    }
    Signature sig(sig_len);
    if (EVP_DigestSign(ctx.get(), sig.data(), &sig_len, message.data(), message.size()) != 1) {
        return Result<Signature>::err(Error(ErrorCode::KEY_UNAVAILABLE, "EVP_DigestSign failed"));
    }
    sig.resize(sig_len);
    return Result<Signature>::ok(std::move(sig));
}

Result<Signature> sign(const PrivateKey& key, const Digest& message) {
    return sign(key, Bytes(message.bytes.begin(), message.bytes.end()));
}

bool verify(const PublicKey& key, const Bytes& message, const Signature& signature) {
    if (key.raw.size() != PublicKey::SIZE || signature.empty()) {
        return false;
    }

    EvpPkey pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                             key.raw.data(), key.raw.size()));
    if (!pkey) return false;

    EvpMdCtx ctx;
    if (!ctx) return false;

    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                            message.data(), message.size()) == 1;
}

bool verify(const PublicKey& key, const Digest& message, const Signature& signature) {
    return verify(key, Bytes(message.bytes.begin(), message.bytes.end()), signature);
}

} // namespace attest
