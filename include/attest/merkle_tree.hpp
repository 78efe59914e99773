#pragma once

#include "attest/crypto.hpp"
#include "attest/result.hpp"

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace attest {

// ============================================================================
// Node Hashing
// ============================================================================
//
// leaf node     = SHA256(0x00 || binary_hash)
// internal node = SHA256(0x01 || left || right)
//
// Children are ordered by insertion index, never by value. A node without
// a right sibling is promoted unchanged to the next level. The root of an
// empty tree is the all-zero digest.

Digest leaf_node_hash(const Digest& leaf);
Digest internal_node_hash(const Digest& left, const Digest& right);

// Leaf value written in place of a removed binary. Keeps the position
// occupied so that indices and proofs of other leaves stay stable.
Digest tombstone_leaf();

// The tombstone and the all-zero digest are never valid binary hashes
bool is_reserved_leaf(const Digest& leaf);

// ============================================================================
// Inclusion Proof
// ============================================================================

struct ProofStep {
    Digest sibling;
    bool sibling_is_left = false;

    bool operator==(const ProofStep& other) const {
        return sibling == other.sibling && sibling_is_left == other.sibling_is_left;
    }
};

struct InclusionProof {
    std::uint64_t leaf_index = 0;
    std::vector<ProofStep> path;  // leaf to root
};

// Recompute the path from `leaf_hash` through the proof siblings and
// compare with `root`. Pure; a false result means "treat as untrusted".
bool verify_proof(const Digest& root, const Digest& leaf_hash, const InclusionProof& proof);

// ============================================================================
// Merkle Tree
// ============================================================================

struct TreeInsertResult {
    Digest root;
    InclusionProof proof;
    bool appended = false;  // false if the leaf was already live
};

// Serialized form: ordered leaves plus cached node levels
struct TreeSnapshot {
    std::vector<Digest> leaves;
    std::vector<std::vector<Digest>> levels;
};

/**
 * @brief Append-friendly Merkle tree over binary hashes
 *
 * Every mutation recomputes only the path from the affected leaf to the
 * root. Mutations return a TreeUndo that restores the previous state when
 * passed to rollback(); undos must be applied in reverse order.
 *
 * Not thread-safe; the owning scope serializes access.
 */
class MerkleTree {
public:
    struct Undo {
        enum class Kind { None, Append, Set };
        Kind kind = Kind::None;
        std::uint64_t index = 0;
        Digest previous_leaf;
    };

    MerkleTree() = default;

    Digest root() const;

    // Number of positions, tombstones included
    std::uint64_t size() const { return leaves_.size(); }
    std::uint64_t live_count() const { return index_.size(); }

    bool contains(const Digest& leaf) const { return index_.count(leaf) != 0; }
    std::optional<std::uint64_t> index_of(const Digest& leaf) const;
    const std::vector<Digest>& leaves() const { return leaves_; }

    // Append `leaf`, or return the current proof if it is already live.
    // INVALID_DIGEST for a reserved leaf value.
    Result<TreeInsertResult> insert(const Digest& leaf, Undo* undo = nullptr);

    // Put `new_leaf` at the position of `old_leaf`. INVALID_DIGEST for a
    // reserved `new_leaf`.
    Result<TreeInsertResult> replace(const Digest& old_leaf, const Digest& new_leaf,
                                     Undo* undo = nullptr);

    // Tombstone `leaf`, returning the new root
    Result<Digest> remove(const Digest& leaf, Undo* undo = nullptr);

    void rollback(const Undo& undo);

    Result<InclusionProof> prove(const Digest& leaf) const;

    TreeSnapshot snapshot() const;

    // Rebuild from a snapshot. With `check_cache`, the cached levels must
    // match a recomputation from the leaves.
    static Result<MerkleTree> from_snapshot(const TreeSnapshot& snapshot,
                                            bool check_cache = true);

private:
    InclusionProof prove_index(std::uint64_t index) const;
    void set_leaf(std::uint64_t index, const Digest& leaf);
    void update_path(std::uint64_t index);
    void pop_leaf();

    std::vector<Digest> leaves_;
    std::vector<std::vector<Digest>> levels_;  // levels_[0] holds leaf nodes
    std::unordered_map<Digest, std::uint64_t, DigestHash> index_;
};

} // namespace attest
