#pragma once

#include "attest/crypto.hpp"
#include "attest/identity.hpp"
#include "attest/result.hpp"
#include "attest/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace attest {

// ============================================================================
// Trust Inputs
// ============================================================================

// Root-of-trust public key handed over at boot
struct TrustAnchor {
    std::string name;
    PublicKey public_key;
};

/**
 * @brief The local machine as seen by dev-signed identities
 *
 * `private_key` may be null on machines that can verify but not sign;
 * such machines cannot record dev-signed installs.
 */
struct MachineIdentity {
    std::string machine_id;
    PublicKey public_key;
    std::shared_ptr<const PrivateKey> private_key;
    CapabilitySet local_capabilities;
};

// ============================================================================
// Verifier
// ============================================================================

// What a verified binary is entitled to
struct Grant {
    IdentityKind kind = IdentityKind::Unsigned;
    std::string principal;
    CapabilitySet granted;
};

/**
 * @brief Validates a binary's signature and resolves its capabilities
 *
 * Entity-signed binaries are checked against the certificate chain up to a
 * trust anchor, dev-signed binaries against the local machine key, and
 * unsigned binaries may only request the empty capability set.
 *
 * Stateless after construction; safe to share between threads.
 */
class Verifier {
public:
    Verifier(std::vector<TrustAnchor> anchors, MachineIdentity machine);

    Result<Grant> verify(const Binary& binary, Timestamp now) const;

    const std::vector<TrustAnchor>& anchors() const { return anchors_; }
    const MachineIdentity& machine() const { return machine_; }

    bool is_trust_anchor(const PublicKey& key) const;

private:
    Result<Grant> verify_entity(const Binary& binary, const EntitySigned& identity,
                                Timestamp now) const;
    Result<Grant> verify_dev(const Binary& binary, const DevSigned& identity) const;
    Result<Grant> verify_unsigned(const Binary& binary) const;

    std::vector<TrustAnchor> anchors_;
    MachineIdentity machine_;
};

} // namespace attest
