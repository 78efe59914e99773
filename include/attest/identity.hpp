#pragma once

#include "attest/certificate.hpp"
#include "attest/crypto.hpp"
#include "attest/types.hpp"

#include <optional>
#include <string>
#include <variant>

namespace attest {

// ============================================================================
// Identity
// ============================================================================

// Portable identity rooted in an external certificate authority
struct EntitySigned {
    CertificateChain certificate_chain;
};

// Identity valid only on the machine that produced it
struct DevSigned {
    std::string machine_id;
};

using Identity = std::variant<EntitySigned, DevSigned>;

IdentityKind identity_kind(const std::optional<Identity>& identity);

// Human-readable principal: the leaf certificate subject, "dev:<machine>",
// or "unsigned"
std::string identity_principal(const std::optional<Identity>& identity);

// ============================================================================
// Binary
// ============================================================================

/**
 * @brief A candidate executable
 *
 * `hash` is the identity of the binary. `content` may be left empty when a
 * request only refers to an already-installed binary (uninstall); when it
 * is present it must hash to `hash`.
 */
struct Binary {
    Bytes content;
    Digest hash;
    CapabilitySet requested_capabilities;
    Signature signature;  // over `hash`
    std::string scope;
    std::optional<Identity> identity;  // nullopt = unsigned
};

// Build a Binary from its content, computing the hash
Binary make_binary(Bytes content, std::string scope,
                   CapabilitySet requested = {});

// Sign the binary hash with `key` and attach `identity`
Result<void> sign_binary(Binary& binary, const PrivateKey& key, Identity identity);

} // namespace attest
