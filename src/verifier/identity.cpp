#include "attest/identity.hpp"

namespace attest {

IdentityKind identity_kind(const std::optional<Identity>& identity) {
    if (!identity) return IdentityKind::Unsigned;
    if (std::holds_alternative<EntitySigned>(*identity)) return IdentityKind::EntitySigned;
    return IdentityKind::DevSigned;
}

std::string identity_principal(const std::optional<Identity>& identity) {
    if (!identity) return "unsigned";
    if (const auto* entity = std::get_if<EntitySigned>(&*identity)) {
        if (entity->certificate_chain.empty()) return "entity:<empty chain>";
        return "entity:" + entity->certificate_chain.front().subject;
    }
    return "dev:" + std::get<DevSigned>(*identity).machine_id;
}

Binary make_binary(Bytes content, std::string scope, CapabilitySet requested) {
    Binary binary;
    binary.hash = sha256(content);
    binary.content = std::move(content);
    binary.scope = std::move(scope);
    binary.requested_capabilities = std::move(requested);
    return binary;
}

Result<void> sign_binary(Binary& binary, const PrivateKey& key, Identity identity) {
    auto sig = sign(key, binary.hash);
    if (sig.isErr()) {
        return Result<void>::err(sig.error());
    }
    binary.signature = std::move(sig.value());
    binary.identity = std::move(identity);
    return Result<void>::ok();
}

} // namespace attest
