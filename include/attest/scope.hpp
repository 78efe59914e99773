#pragma once

/**
 * @file scope.hpp
 * @brief Trust scopes: per-scope tree, chain, locks and persistence
 *
 * A scope pairs a MerkleTree with a ProvenanceChain. Writers (the
 * Orchestrator) serialize on the scope's writer lock and mutate tree and
 * chain under the exclusive data lock. Readers use the published
 * ScopeSnapshot or take the data lock shared.
 *
 * On disk a scope lives in `<state_root>/scopes/<name>/`:
 *   scope.json   name and parent
 *   tree.json    tree snapshot (leaves + cached levels)
 *   chain.log    provenance records, one JSON object per line
 */

#include "attest/crypto.hpp"
#include "attest/key_store.hpp"
#include "attest/merkle_tree.hpp"
#include "attest/provenance_chain.hpp"
#include "attest/result.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace attest {

class Orchestrator;

// ============================================================================
// Snapshot
// ============================================================================

// Consistent (root, tip) pair as of the last commit
struct ScopeSnapshot {
    std::string scope;
    Digest root;
    ProvenanceRecord tip;
    std::uint64_t chain_length = 0;
};

// Inclusion proof together with the root it was computed against
struct ScopeProof {
    Digest root;
    InclusionProof proof;
};

// ============================================================================
// Scope Store
// ============================================================================

/**
 * @brief Durable storage for one scope
 *
 * persist() writes the tree snapshot to a temp file, appends the record to
 * the log with fsync, then renames the temp file into place. If the rename
 * fails the log is truncated back to its previous length.
 */
class ScopeStore {
public:
    explicit ScopeStore(std::string dir);

    const std::string& dir() const { return dir_; }
    std::string tree_path() const;
    std::string chain_path() const;
    std::string meta_path() const;

    bool exists() const;

    Result<void> create(const std::string& name, const std::optional<std::string>& parent,
                        const ProvenanceRecord& genesis);
    Result<void> persist(const TreeSnapshot& tree, const ProvenanceRecord& record);

    struct Loaded {
        std::string name;
        std::optional<std::string> parent;
        std::vector<ProvenanceRecord> records;
        TreeSnapshot tree;
    };
    Result<Loaded> load() const;

private:
    std::string dir_;
};

// ============================================================================
// Trust Scope
// ============================================================================

class TrustScope {
public:
    TrustScope(std::string name, std::optional<std::string> parent,
               std::unique_ptr<ScopeStore> store);

    TrustScope(const TrustScope&) = delete;
    TrustScope& operator=(const TrustScope&) = delete;

    const std::string& name() const { return name_; }
    const std::optional<std::string>& parent() const { return parent_; }
    bool persistent() const { return store_ != nullptr; }

    // Lock-free read of the last published (root, tip)
    std::shared_ptr<const ScopeSnapshot> snapshot() const;

    Result<void> verify_chain() const;

    // Verify the chain and return the snapshot it was verified against
    Result<std::shared_ptr<const ScopeSnapshot>> verified_snapshot() const;
    Result<ScopeProof> prove(const Digest& leaf) const;
    std::vector<ProvenanceRecord> records() const;
    bool contains(const Digest& leaf) const;

    void set_authorized_keys(std::set<PublicKey> keys);
    std::set<PublicKey> authorized_keys() const;

private:
    friend class Orchestrator;
    friend class ScopeRegistry;

    // Caller holds data_mutex_ exclusively
    void publish();

    std::string name_;
    std::optional<std::string> parent_;
    std::unique_ptr<ScopeStore> store_;

    std::timed_mutex writer_mutex_;
    mutable std::shared_mutex data_mutex_;
    MerkleTree tree_;
    ProvenanceChain chain_;
    std::set<PublicKey> authorized_keys_;

    std::shared_ptr<const ScopeSnapshot> snapshot_;
};

// ============================================================================
// Scope Registry
// ============================================================================

/**
 * @brief Owns all trust scopes of a machine
 *
 * With an empty state root scopes live in memory only. The registry lock
 * covers the name -> scope map; scopes are locked independently.
 */
class ScopeRegistry {
public:
    ScopeRegistry(std::string state_root, std::shared_ptr<const KeyStore> keys);

    const std::string& state_root() const { return state_root_; }

    // Create a scope and write its genesis record, signed by the machine key
    Result<std::shared_ptr<TrustScope>> create_scope(const std::string& name,
                                                     const std::optional<std::string>& parent = std::nullopt);

    // Load one scope from the state root
    Result<std::shared_ptr<TrustScope>> load_scope(const std::string& name);

    // Load every scope found under the state root; returns how many were loaded
    Result<std::size_t> load_all();

    Result<std::shared_ptr<TrustScope>> find(const std::string& name) const;
    std::vector<std::string> list_scopes() const;

    // Scopes present on disk, loaded or not
    std::vector<std::string> stored_scopes() const;

    // Read-only auditor surface
    Result<ScopeSnapshot> snapshot(const std::string& name) const;
    Result<ProvenanceRecord> tip(const std::string& name) const;
    Result<void> verify_chain(const std::string& name) const;
    Result<ScopeProof> prove(const std::string& name, const Digest& leaf) const;

    Result<void> set_authorized_keys(const std::string& name, std::set<PublicKey> keys);

private:
    std::string scope_dir(const std::string& name) const;

    std::string state_root_;
    std::shared_ptr<const KeyStore> keys_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<TrustScope>> scopes_;
};

// Scope names become directory names: [A-Za-z0-9._-], not "." or ".."
bool is_valid_scope_name(const std::string& name);

// Principal recorded in a scope's genesis record
std::string scope_principal(const std::string& name);

} // namespace attest
