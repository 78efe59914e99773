#pragma once

#include "attest/crypto.hpp"
#include "attest/identity.hpp"
#include "attest/provenance_chain.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace attest {

/**
 * @brief Resolves the key that signs a provenance record
 *
 * Records are signed by the machine key unless an entity signer has been
 * registered for the subject of the binary's leaf certificate. Dev-signed
 * records always need the machine private key; without it they fail with
 * SIGNING_FAILED.
 *
 * Thread-safe.
 */
class KeyStore {
public:
    KeyStore() = default;
    explicit KeyStore(std::shared_ptr<const PrivateKey> machine_key);

    void set_machine_key(std::shared_ptr<const PrivateKey> key);
    bool has_machine_key() const;

    // Sign records for binaries whose leaf certificate names `subject`
    void register_entity_signer(const std::string& subject,
                                std::shared_ptr<const PrivateKey> key);

    KeySigner machine_signer() const;
    KeySigner signer_for(const std::optional<Identity>& identity) const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const PrivateKey> machine_key_;
    std::map<std::string, std::shared_ptr<const PrivateKey>> entity_signers_;
};

} // namespace attest
