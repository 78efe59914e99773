#include "attest/certificate.hpp"

namespace attest {

namespace {

constexpr const char* CERT_DOMAIN = "attest.cert.v1";

} // namespace

Digest Certificate::tbs_digest() const {
    Hasher h;
    h.update_string(CERT_DOMAIN);
    h.update_string(subject);
    h.update_string(issuer);
    h.update_blob(subject_key.raw);
    h.update_blob(issuer_key.raw);
    h.update_i64(not_before);
    h.update_i64(not_after);
    h.update_u32(static_cast<std::uint32_t>(capabilities.size()));
    for (const auto& cap : capabilities) {
        h.update_string(cap);
    }
    h.update_bool(is_authority);
    return h.finish();
}

bool Certificate::signature_valid() const {
    return verify(issuer_key, tbs_digest(), signature);
}

Result<Certificate> issue_certificate(const PrivateKey& issuer_key,
                                      const std::string& issuer_name,
                                      Certificate tbs) {
    if (!issuer_key.valid()) {
        return Result<Certificate>::err(Error(ErrorCode::KEY_UNAVAILABLE,
            "issuer key not loaded for " + issuer_name));
    }
    tbs.issuer = issuer_name;
    tbs.issuer_key = issuer_key.public_key();

    auto sig = sign(issuer_key, tbs.tbs_digest());
    if (sig.isErr()) {
        return Result<Certificate>::err(sig.error());
    }
    tbs.signature = std::move(sig.value());
    return Result<Certificate>::ok(std::move(tbs));
}

} // namespace attest
