#include "attest/merkle_tree.hpp"

#include <spdlog/spdlog.h>

namespace attest {

namespace {

constexpr std::uint8_t LEAF_PREFIX = 0x00;
constexpr std::uint8_t NODE_PREFIX = 0x01;

bool levels_well_formed(const TreeSnapshot& snapshot) {
    const auto& levels = snapshot.levels;
    if (snapshot.leaves.empty()) return levels.empty();
    if (levels.empty() || levels[0].size() != snapshot.leaves.size()) return false;
    for (std::size_t l = 1; l < levels.size(); ++l) {
        if (levels[l - 1].size() <= 1) return false;
        if (levels[l].size() != (levels[l - 1].size() + 1) / 2) return false;
    }
    return levels.back().size() == 1;
}

} // namespace

// ============================================================================
// Node Hashing
// ============================================================================

Digest leaf_node_hash(const Digest& leaf) {
    Hasher h;
    h.update_u8(LEAF_PREFIX);
    h.update_digest(leaf);
    return h.finish();
}

Digest internal_node_hash(const Digest& left, const Digest& right) {
    Hasher h;
    h.update_u8(NODE_PREFIX);
    h.update_digest(left);
    h.update_digest(right);
    return h.finish();
}

Digest tombstone_leaf() {
    return Digest::filled(0xFF);
}

bool is_reserved_leaf(const Digest& leaf) {
    return leaf.is_zero() || leaf == tombstone_leaf();
}

bool verify_proof(const Digest& root, const Digest& leaf_hash, const InclusionProof& proof) {
    Digest node = leaf_node_hash(leaf_hash);
    for (const auto& step : proof.path) {
        node = step.sibling_is_left ? internal_node_hash(step.sibling, node)
                                    : internal_node_hash(node, step.sibling);
    }
    return node == root;
}

// ============================================================================
// Merkle Tree
// ============================================================================

Digest MerkleTree::root() const {
    if (levels_.empty()) return Digest::zero();
    return levels_.back()[0];
}

std::optional<std::uint64_t> MerkleTree::index_of(const Digest& leaf) const {
    auto it = index_.find(leaf);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

Result<TreeInsertResult> MerkleTree::insert(const Digest& leaf, Undo* undo) {
    if (undo) *undo = Undo{};
    if (is_reserved_leaf(leaf)) {
        return Result<TreeInsertResult>::err(Error(ErrorCode::INVALID_DIGEST,
            "reserved digest cannot be a leaf: " + leaf.to_hex()));
    }

    TreeInsertResult result;
    if (auto existing = index_of(leaf)) {
        result.root = root();
        result.proof = prove_index(*existing);
        return Result<TreeInsertResult>::ok(std::move(result));
    }

    std::uint64_t index = leaves_.size();
    leaves_.push_back(leaf);
    if (levels_.empty()) levels_.emplace_back();
    levels_[0].push_back(Digest::zero());
    index_[leaf] = index;
    update_path(index);

    if (undo) {
        undo->kind = Undo::Kind::Append;
        undo->index = index;
        undo->previous_leaf = Digest::zero();
    }

    result.appended = true;
    result.root = root();
    result.proof = prove_index(index);
    return Result<TreeInsertResult>::ok(std::move(result));
}

Result<TreeInsertResult> MerkleTree::replace(const Digest& old_leaf, const Digest& new_leaf,
                                             Undo* undo) {
    if (undo) *undo = Undo{};
    if (is_reserved_leaf(new_leaf)) {
        return Result<TreeInsertResult>::err(Error(ErrorCode::INVALID_DIGEST,
            "reserved digest cannot be a leaf: " + new_leaf.to_hex()));
    }
    auto index = index_of(old_leaf);
    if (!index) {
        return Result<TreeInsertResult>::err(Error(ErrorCode::BINARY_NOT_FOUND,
            "binary not present in tree: " + old_leaf.to_hex()));
    }
    if (old_leaf != new_leaf && contains(new_leaf)) {
        return Result<TreeInsertResult>::err(Error(ErrorCode::BINARY_EXISTS,
            "replacement binary already present in tree: " + new_leaf.to_hex()));
    }

    if (undo) {
        undo->kind = Undo::Kind::Set;
        undo->index = *index;
        undo->previous_leaf = old_leaf;
    }
    set_leaf(*index, new_leaf);

    TreeInsertResult result;
    result.root = root();
    result.proof = prove_index(*index);
    return Result<TreeInsertResult>::ok(std::move(result));
}

Result<Digest> MerkleTree::remove(const Digest& leaf, Undo* undo) {
    auto index = index_of(leaf);
    if (!index) {
        return Result<Digest>::err(Error(ErrorCode::BINARY_NOT_FOUND,
            "binary not present in tree: " + leaf.to_hex()));
    }

    if (undo) {
        undo->kind = Undo::Kind::Set;
        undo->index = *index;
        undo->previous_leaf = leaf;
    }
    set_leaf(*index, tombstone_leaf());
    return Result<Digest>::ok(root());
}

void MerkleTree::rollback(const Undo& undo) {
    switch (undo.kind) {
        case Undo::Kind::None:
            return;
        case Undo::Kind::Append:
            if (undo.index + 1 == leaves_.size()) {
                pop_leaf();
            } else {
                spdlog::error("merkle rollback out of order: append undo for index {} with {} leaves",
                              undo.index, leaves_.size());
            }
            return;
        case Undo::Kind::Set:
            set_leaf(undo.index, undo.previous_leaf);
            return;
    }
}

Result<InclusionProof> MerkleTree::prove(const Digest& leaf) const {
    auto index = index_of(leaf);
    if (!index) {
        return Result<InclusionProof>::err(Error(ErrorCode::BINARY_NOT_FOUND,
            "binary not present in tree: " + leaf.to_hex()));
    }
    return Result<InclusionProof>::ok(prove_index(*index));
}

InclusionProof MerkleTree::prove_index(std::uint64_t index) const {
    InclusionProof proof;
    proof.leaf_index = index;

    std::uint64_t i = index;
    for (std::size_t l = 0; l + 1 < levels_.size(); ++l) {
        const auto& level = levels_[l];
        std::uint64_t sibling = i ^ 1u;
        if (sibling < level.size()) {
            proof.path.push_back(ProofStep{level[sibling], sibling < i});
        }
        i /= 2;
    }
    return proof;
}

void MerkleTree::set_leaf(std::uint64_t index, const Digest& leaf) {
    const Digest previous = leaves_[index];
    auto it = index_.find(previous);
    if (it != index_.end() && it->second == index) {
        index_.erase(it);
    }
    leaves_[index] = leaf;
    if (leaf != tombstone_leaf()) {
        index_[leaf] = index;
    }
    update_path(index);
}

void MerkleTree::update_path(std::uint64_t index) {
    levels_[0][index] = leaf_node_hash(leaves_[index]);

    std::uint64_t i = index;
    for (std::size_t l = 0; levels_[l].size() > 1; ++l) {
        if (levels_.size() == l + 1) {
            levels_.emplace_back();
        }
        const auto& cur = levels_[l];
        auto& up = levels_[l + 1];

        std::size_t expected = (cur.size() + 1) / 2;
        if (up.size() < expected) up.resize(expected);

        std::uint64_t parent = i / 2;
        std::uint64_t left = parent * 2;
        std::uint64_t right = left + 1;
        up[parent] = right < cur.size() ? internal_node_hash(cur[left], cur[right]) : cur[left];
        i = parent;
    }
}

void MerkleTree::pop_leaf() {
    std::uint64_t last = leaves_.size() - 1;
    auto it = index_.find(leaves_[last]);
    if (it != index_.end() && it->second == last) {
        index_.erase(it);
    }
    leaves_.pop_back();
    levels_[0].pop_back();

    if (leaves_.empty()) {
        levels_.clear();
        return;
    }

    for (std::size_t l = 1; l < levels_.size(); ++l) {
        if (levels_[l - 1].size() == 1) {
            levels_.resize(l);
            break;
        }
        levels_[l].resize((levels_[l - 1].size() + 1) / 2);
    }
    update_path(leaves_.size() - 1);
}

TreeSnapshot MerkleTree::snapshot() const {
    TreeSnapshot snap;
    snap.leaves = leaves_;
    snap.levels = levels_;
    return snap;
}

Result<MerkleTree> MerkleTree::from_snapshot(const TreeSnapshot& snapshot, bool check_cache) {
    if (!levels_well_formed(snapshot)) {
        return Result<MerkleTree>::err(Error(ErrorCode::PARSE_ERROR,
            "tree snapshot levels do not match leaf count"));
    }

    MerkleTree tree;
    const Digest tombstone = tombstone_leaf();
    for (std::uint64_t i = 0; i < snapshot.leaves.size(); ++i) {
        const auto& leaf = snapshot.leaves[i];
        if (leaf == tombstone) continue;
        if (!tree.index_.emplace(leaf, i).second) {
            return Result<MerkleTree>::err(Error(ErrorCode::PARSE_ERROR,
                "tree snapshot contains duplicate leaf " + leaf.to_hex()));
        }
    }
    tree.leaves_ = snapshot.leaves;

    if (!check_cache) {
        tree.levels_ = snapshot.levels;
        return Result<MerkleTree>::ok(std::move(tree));
    }

    if (!tree.leaves_.empty()) {
        tree.levels_.emplace_back(tree.leaves_.size());
        for (std::uint64_t i = 0; i < tree.leaves_.size(); ++i) {
            tree.update_path(i);
        }
    }
    if (tree.levels_ != snapshot.levels) {
        return Result<MerkleTree>::err(Error(ErrorCode::TAMPER_DETECTED,
            "cached tree hashes do not match leaves"));
    }
    return Result<MerkleTree>::ok(std::move(tree));
}

} // namespace attest
