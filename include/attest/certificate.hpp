#pragma once

#include "attest/crypto.hpp"
#include "attest/types.hpp"

#include <string>
#include <vector>

namespace attest {

// ============================================================================
// Certificate
// ============================================================================

/**
 * @brief A capability-bearing certificate binding a subject name to a key
 *
 * The issuer signs tbs_digest(), which covers every field except the
 * signature. Validity bounds are inclusive and expressed in seconds.
 * Only certificates with `is_authority` set may appear above the leaf of
 * a chain.
 */
struct Certificate {
    std::string subject;
    std::string issuer;
    PublicKey subject_key;
    PublicKey issuer_key;
    Timestamp not_before = 0;
    Timestamp not_after = 0;
    CapabilitySet capabilities;
    bool is_authority = false;
    Signature signature;

    // Digest of the to-be-signed fields
    Digest tbs_digest() const;

    bool within_validity(Timestamp now) const {
        return now >= not_before && now <= not_after;
    }

    // True if `signature` verifies under `issuer_key`
    bool signature_valid() const;
};

// Ordered leaf first; the last certificate is issued by a trust anchor
using CertificateChain = std::vector<Certificate>;

/**
 * @brief Sign a certificate with the issuer's private key
 *
 * Fills in issuer_key from the private key and the signature. Fails with
 * KEY_UNAVAILABLE if the issuer key cannot sign.
 */
Result<Certificate> issue_certificate(const PrivateKey& issuer_key,
                                      const std::string& issuer_name,
                                      Certificate tbs);

} // namespace attest
