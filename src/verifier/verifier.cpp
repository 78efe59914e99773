#include "attest/verifier.hpp"

#include <spdlog/spdlog.h>

namespace attest {

namespace {

Result<Grant> deny(ErrorCode code, const std::string& message) {
    spdlog::debug("verifier: {}: {}", error_code_to_string(code), message);
    return Result<Grant>::err(Error(code, message));
}

std::string join_capabilities(const CapabilitySet& caps) {
    std::string out;
    for (const auto& cap : caps) {
        if (!out.empty()) out += ", ";
        out += cap;
    }
    return out;
}

std::string missing_capabilities(const CapabilitySet& requested, const CapabilitySet& granted) {
    CapabilitySet missing;
    for (const auto& cap : requested) {
        if (granted.count(cap) == 0) missing.insert(cap);
    }
    return join_capabilities(missing);
}

} // namespace

Verifier::Verifier(std::vector<TrustAnchor> anchors, MachineIdentity machine)
    : anchors_(std::move(anchors)), machine_(std::move(machine)) {}

bool Verifier::is_trust_anchor(const PublicKey& key) const {
    for (const auto& anchor : anchors_) {
        if (anchor.public_key == key) return true;
    }
    return false;
}

Result<Grant> Verifier::verify(const Binary& binary, Timestamp now) const {
    if (!binary.content.empty() && sha256(binary.content) != binary.hash) {
        return deny(ErrorCode::SIGNATURE_MISMATCH,
                    "content does not hash to declared digest " + binary.hash.to_hex());
    }

    if (!binary.identity) {
        return verify_unsigned(binary);
    }
    if (const auto* entity = std::get_if<EntitySigned>(&*binary.identity)) {
        return verify_entity(binary, *entity, now);
    }
    return verify_dev(binary, std::get<DevSigned>(*binary.identity));
}

Result<Grant> Verifier::verify_entity(const Binary& binary, const EntitySigned& identity,
                                      Timestamp now) const {
    const auto& chain = identity.certificate_chain;
    if (chain.empty()) {
        return deny(ErrorCode::UNTRUSTED_ROOT, "empty certificate chain");
    }

    const Certificate& top = chain.back();
    if (!is_trust_anchor(top.issuer_key)) {
        return deny(ErrorCode::UNTRUSTED_ROOT,
                    "certificate '" + top.subject + "' is not issued by a trust anchor");
    }

    for (const auto& cert : chain) {
        if (!cert.within_validity(now)) {
            return deny(ErrorCode::EXPIRED_CERTIFICATE,
                        "certificate '" + cert.subject + "' valid " +
                        format_timestamp(cert.not_before) + " to " +
                        format_timestamp(cert.not_after));
        }
    }

    for (std::size_t i = 0; i < chain.size(); ++i) {
        const Certificate& cert = chain[i];
        if (!cert.signature_valid()) {
            return deny(ErrorCode::UNTRUSTED_ROOT,
                        "certificate '" + cert.subject + "' signature does not verify");
        }
        if (i + 1 < chain.size()) {
            const Certificate& issuer = chain[i + 1];
            if (issuer.subject_key != cert.issuer_key) {
                return deny(ErrorCode::UNTRUSTED_ROOT,
                            "certificate '" + cert.subject + "' is not issued by '" +
                            issuer.subject + "'");
            }
            if (!issuer.is_authority) {
                return deny(ErrorCode::UNTRUSTED_ROOT,
                            "certificate '" + issuer.subject + "' may not issue certificates");
            }
            // An issuer cannot delegate capabilities it does not hold
            if (!is_capability_subset(cert.capabilities, issuer.capabilities)) {
                return deny(ErrorCode::CAPABILITY_DENIED,
                            "'" + issuer.subject + "' may not delegate: " +
                            missing_capabilities(cert.capabilities, issuer.capabilities));
            }
        }
    }

    const Certificate& leaf = chain.front();
    if (!attest::verify(leaf.subject_key, binary.hash, binary.signature)) {
        return deny(ErrorCode::SIGNATURE_MISMATCH,
                    "binary signature does not verify under '" + leaf.subject + "'");
    }

    if (!is_capability_subset(binary.requested_capabilities, leaf.capabilities)) {
        return deny(ErrorCode::CAPABILITY_DENIED,
                    "'" + leaf.subject + "' is not entitled to: " +
                    missing_capabilities(binary.requested_capabilities, leaf.capabilities));
    }

    Grant grant;
    grant.kind = IdentityKind::EntitySigned;
    grant.principal = identity_principal(binary.identity);
    grant.granted = binary.requested_capabilities;
    return Result<Grant>::ok(std::move(grant));
}

Result<Grant> Verifier::verify_dev(const Binary& binary, const DevSigned& identity) const {
    if (identity.machine_id != machine_.machine_id) {
        return deny(ErrorCode::FOREIGN_MACHINE_IDENTITY,
                    "dev identity from machine '" + identity.machine_id +
                    "' presented on '" + machine_.machine_id + "'");
    }

    if (!attest::verify(machine_.public_key, binary.hash, binary.signature)) {
        return deny(ErrorCode::SIGNATURE_MISMATCH,
                    "binary signature does not verify under the machine key");
    }

    if (!is_capability_subset(binary.requested_capabilities, machine_.local_capabilities)) {
        return deny(ErrorCode::CAPABILITY_DENIED,
                    "not in local capability set: " +
                    missing_capabilities(binary.requested_capabilities,
                                         machine_.local_capabilities));
    }

    Grant grant;
    grant.kind = IdentityKind::DevSigned;
    grant.principal = identity_principal(binary.identity);
    grant.granted = binary.requested_capabilities;
    return Result<Grant>::ok(std::move(grant));
}

Result<Grant> Verifier::verify_unsigned(const Binary& binary) const {
    if (!binary.requested_capabilities.empty()) {
        return deny(ErrorCode::SIGNATURE_REQUIRED,
                    "unsigned binary requests: " +
                    join_capabilities(binary.requested_capabilities));
    }

    Grant grant;
    grant.kind = IdentityKind::Unsigned;
    grant.principal = identity_principal(binary.identity);
    return Result<Grant>::ok(std::move(grant));
}

} // namespace attest
