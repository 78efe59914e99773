#pragma once

#include "attest/crypto.hpp"
#include "attest/result.hpp"
#include "attest/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace attest {

// ============================================================================
// Provenance Record
// ============================================================================

/**
 * @brief One block of a scope's provenance chain
 *
 * `signature` is made by `signer_key` over signing_digest(), which covers
 * every field before it. hash() additionally covers the signature and is
 * what the next record links to through `previous_hash`.
 */
struct ProvenanceRecord {
    std::uint64_t index = 0;
    Digest previous_hash;
    ActionKind action = ActionKind::Install;
    Digest binary_hash;
    std::optional<Digest> replaced_hash;  // set only on Upgrade
    Digest tree_root;
    IdentityKind identity_kind = IdentityKind::Unsigned;
    std::string principal;
    PublicKey signer_key;
    Timestamp timestamp = 0;
    Signature signature;

    Digest signing_digest() const;
    Digest hash() const;
};

// ============================================================================
// Signer
// ============================================================================

/**
 * @brief Produces record signatures on behalf of an authorizing identity
 */
class Signer {
public:
    virtual ~Signer() = default;

    virtual PublicKey public_key() const = 0;
    virtual Result<Signature> sign(const Digest& message) const = 0;
};

// Signer backed by an in-process Ed25519 private key
class KeySigner : public Signer {
public:
    explicit KeySigner(std::shared_ptr<const PrivateKey> key) : key_(std::move(key)) {}

    PublicKey public_key() const override;
    Result<Signature> sign(const Digest& message) const override;

private:
    std::shared_ptr<const PrivateKey> key_;
};

// ============================================================================
// Chain Verification
// ============================================================================

/**
 * @brief Verify the first `count` records of a chain
 *
 * Walks from genesis recomputing each link and signature. Returns
 * TAMPER_DETECTED with the index of the first record that fails. When
 * `authorized_keys` is non-empty every signer must be in it.
 */
Result<void> verify_records(const std::vector<ProvenanceRecord>& records,
                            std::size_t count,
                            const std::set<PublicKey>& authorized_keys = {});

// ============================================================================
// Provenance Chain
// ============================================================================

struct AppendInput {
    ActionKind action = ActionKind::Install;
    Digest binary_hash;
    std::optional<Digest> replaced_hash;
    Digest tree_root;
    IdentityKind identity_kind = IdentityKind::Unsigned;
    std::string principal;
    Timestamp timestamp = 0;
};

/**
 * @brief Append-only, hash-linked, signed ledger for one scope
 *
 * Records are built and signed by prepare(), which does not modify the
 * chain, and become part of it through commit(). append() does both.
 * Not thread-safe; the owning scope serializes access.
 */
class ProvenanceChain {
public:
    ProvenanceChain() = default;

    bool empty() const { return records_.empty(); }
    std::size_t size() const { return records_.size(); }
    const std::vector<ProvenanceRecord>& records() const { return records_; }

    // Write the genesis record. Fails if the chain is not empty.
    Result<ProvenanceRecord> write_genesis(const std::string& principal,
                                           const Signer& signer, Timestamp timestamp);

    // Build and sign the record that would follow the current tip
    Result<ProvenanceRecord> prepare(const AppendInput& input, const Signer& signer) const;

    // Link a prepared record onto the chain. Fails if it does not follow
    // the current tip.
    Result<void> commit(ProvenanceRecord record);

    Result<ProvenanceRecord> append(const AppendInput& input, const Signer& signer);

    Result<void> verify(const std::set<PublicKey>& authorized_keys = {}) const;

    // CHAIN_EMPTY if genesis has not been written
    Result<ProvenanceRecord> tip() const;

    // Adopt records read from storage. Links are not checked; call verify().
    static ProvenanceChain from_records(std::vector<ProvenanceRecord> records);

private:
    Digest tip_hash() const;

    std::vector<ProvenanceRecord> records_;
};

} // namespace attest
