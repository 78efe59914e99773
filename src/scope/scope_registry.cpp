#include "attest/scope.hpp"

#include "attest/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace attest {

bool is_valid_scope_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    for (char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

std::string scope_principal(const std::string& name) {
    return "scope:" + name;
}

// ============================================================================
// Trust Scope
// ============================================================================

TrustScope::TrustScope(std::string name, std::optional<std::string> parent,
                       std::unique_ptr<ScopeStore> store)
    : name_(std::move(name)), parent_(std::move(parent)), store_(std::move(store)) {}

std::shared_ptr<const ScopeSnapshot> TrustScope::snapshot() const {
    return std::atomic_load(&snapshot_);
}

void TrustScope::publish() {
    auto snap = std::make_shared<ScopeSnapshot>();
    snap->scope = name_;
    snap->root = tree_.root();
    snap->chain_length = chain_.size();
    if (!chain_.empty()) {
        snap->tip = chain_.records().back();
    }
    std::atomic_store(&snapshot_, std::shared_ptr<const ScopeSnapshot>(std::move(snap)));
}

Result<void> TrustScope::verify_chain() const {
    std::shared_lock<std::shared_mutex> lock(data_mutex_);
    auto result = chain_.verify(authorized_keys_);
    if (result.isErr()) {
        result.error().withContext("scope '" + name_ + "'");
    }
    return result;
}

Result<std::shared_ptr<const ScopeSnapshot>> TrustScope::verified_snapshot() const {
    std::shared_lock<std::shared_mutex> lock(data_mutex_);
    auto verified = chain_.verify(authorized_keys_);
    if (verified.isErr()) {
        verified.error().withContext("scope '" + name_ + "'");
        return Result<std::shared_ptr<const ScopeSnapshot>>::err(verified.error());
    }
    return Result<std::shared_ptr<const ScopeSnapshot>>::ok(snapshot());
}

Result<ScopeProof> TrustScope::prove(const Digest& leaf) const {
    std::shared_lock<std::shared_mutex> lock(data_mutex_);
    auto proof = tree_.prove(leaf);
    if (proof.isErr()) {
        return Result<ScopeProof>::err(proof.error());
    }
    return Result<ScopeProof>::ok(ScopeProof{tree_.root(), std::move(proof.value())});
}

std::vector<ProvenanceRecord> TrustScope::records() const {
    std::shared_lock<std::shared_mutex> lock(data_mutex_);
    return chain_.records();
}

bool TrustScope::contains(const Digest& leaf) const {
    std::shared_lock<std::shared_mutex> lock(data_mutex_);
    return tree_.contains(leaf);
}

void TrustScope::set_authorized_keys(std::set<PublicKey> keys) {
    std::unique_lock<std::shared_mutex> lock(data_mutex_);
    authorized_keys_ = std::move(keys);
}

std::set<PublicKey> TrustScope::authorized_keys() const {
    std::shared_lock<std::shared_mutex> lock(data_mutex_);
    return authorized_keys_;
}

// ============================================================================
// Scope Registry
// ============================================================================

ScopeRegistry::ScopeRegistry(std::string state_root, std::shared_ptr<const KeyStore> keys)
    : state_root_(std::move(state_root)), keys_(std::move(keys)) {}

std::string ScopeRegistry::scope_dir(const std::string& name) const {
    return join_path(join_path(state_root_, "scopes"), name);
}

Result<std::shared_ptr<TrustScope>> ScopeRegistry::create_scope(
        const std::string& name, const std::optional<std::string>& parent) {
    using R = Result<std::shared_ptr<TrustScope>>;

    if (!is_valid_scope_name(name)) {
        return R::err(Error(ErrorCode::CONFIG_INVALID, "invalid scope name '" + name + "'"));
    }
    if (!keys_) {
        return R::err(Error(ErrorCode::SIGNING_FAILED, "no key store for genesis"));
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (scopes_.count(name) != 0) {
        return R::err(Error(ErrorCode::SCOPE_EXISTS, "scope '" + name + "' already exists"));
    }
    if (parent && scopes_.count(*parent) == 0) {
        return R::err(Error(ErrorCode::SCOPE_NOT_FOUND,
            "parent scope '" + *parent + "' not found"));
    }

    std::unique_ptr<ScopeStore> store;
    if (!state_root_.empty()) {
        store = std::make_unique<ScopeStore>(scope_dir(name));
        if (store->exists()) {
            return R::err(Error(ErrorCode::SCOPE_EXISTS,
                "scope '" + name + "' already stored at " + store->dir()));
        }
    }

    auto scope = std::make_shared<TrustScope>(name, parent, std::move(store));

    auto genesis = scope->chain_.write_genesis(scope_principal(name),
                                               keys_->machine_signer(), now_seconds());
    if (genesis.isErr()) {
        return R::err(genesis.error().withContext("scope '" + name + "'"));
    }

    if (scope->store_) {
        auto stored = scope->store_->create(name, parent, genesis.value());
        if (stored.isErr()) {
            return R::err(stored.error());
        }
    }

    scope->publish();
    scopes_[name] = scope;

    spdlog::info("created scope '{}'{}", name, parent ? " under '" + *parent + "'" : "");
    return R::ok(std::move(scope));
}

Result<std::shared_ptr<TrustScope>> ScopeRegistry::load_scope(const std::string& name) {
    using R = Result<std::shared_ptr<TrustScope>>;

    if (!is_valid_scope_name(name)) {
        return R::err(Error(ErrorCode::CONFIG_INVALID, "invalid scope name '" + name + "'"));
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = scopes_.find(name);
    if (it != scopes_.end()) {
        return R::ok(it->second);
    }
    if (state_root_.empty()) {
        return R::err(Error(ErrorCode::SCOPE_NOT_FOUND, "scope '" + name + "' not found"));
    }

    auto store = std::make_unique<ScopeStore>(scope_dir(name));
    if (!store->exists()) {
        return R::err(Error(ErrorCode::SCOPE_NOT_FOUND,
            "scope '" + name + "' not found in " + state_root_));
    }

    auto loaded = store->load();
    if (loaded.isErr()) {
        return R::err(loaded.error().withContext("scope '" + name + "'"));
    }
    auto& data = loaded.value();
    if (data.name != name) {
        return R::err(Error(ErrorCode::PARSE_ERROR,
            "scope directory '" + name + "' holds scope '" + data.name + "'"));
    }

    auto tree = MerkleTree::from_snapshot(data.tree);
    if (tree.isErr()) {
        spdlog::error("scope '{}': {}", name, tree.error().toString());
        return R::err(tree.error().withContext("scope '" + name + "'"));
    }

    const ProvenanceRecord& tip = data.records.back();
    if (tree.value().root() != tip.tree_root) {
        spdlog::error("scope '{}': tree root {} does not match chain tip root {}",
                      name, tree.value().root().to_hex(), tip.tree_root.to_hex());
        return R::err(Error::tamper(tip.index,
            "scope '" + name + "': tree snapshot does not match chain tip"));
    }

    auto scope = std::make_shared<TrustScope>(name, data.parent, std::move(store));
    scope->tree_ = std::move(tree.value());
    scope->chain_ = ProvenanceChain::from_records(std::move(data.records));
    scope->publish();
    scopes_[name] = scope;

    spdlog::debug("loaded scope '{}' ({} records, root {})",
                  name, scope->chain_.size(), scope->tree_.root().to_hex());
    return R::ok(std::move(scope));
}

std::vector<std::string> ScopeRegistry::stored_scopes() const {
    std::vector<std::string> names;
    if (state_root_.empty()) return names;

    std::string dir = join_path(state_root_, "scopes");
    for (const auto& entry : list_directory(dir)) {
        if (is_valid_scope_name(entry) && is_directory(join_path(dir, entry))) {
            names.push_back(entry);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

Result<std::size_t> ScopeRegistry::load_all() {
    std::size_t count = 0;
    for (const auto& name : stored_scopes()) {
        auto scope = load_scope(name);
        if (scope.isErr()) {
            return Result<std::size_t>::err(scope.error());
        }
        ++count;
    }
    return Result<std::size_t>::ok(count);
}

Result<std::shared_ptr<TrustScope>> ScopeRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = scopes_.find(name);
    if (it == scopes_.end()) {
        return Result<std::shared_ptr<TrustScope>>::err(Error(ErrorCode::SCOPE_NOT_FOUND,
            "scope '" + name + "' not found"));
    }
    return Result<std::shared_ptr<TrustScope>>::ok(it->second);
}

std::vector<std::string> ScopeRegistry::list_scopes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& entry : scopes_) {
        names.push_back(entry.first);
    }
    return names;
}

Result<ScopeSnapshot> ScopeRegistry::snapshot(const std::string& name) const {
    auto scope = find(name);
    if (scope.isErr()) return Result<ScopeSnapshot>::err(scope.error());
    return Result<ScopeSnapshot>::ok(*scope.value()->snapshot());
}

Result<ProvenanceRecord> ScopeRegistry::tip(const std::string& name) const {
    auto snap = snapshot(name);
    if (snap.isErr()) return Result<ProvenanceRecord>::err(snap.error());
    if (snap.value().chain_length == 0) {
        return Result<ProvenanceRecord>::err(Error(ErrorCode::CHAIN_EMPTY,
            "scope '" + name + "' has no genesis record"));
    }
    return Result<ProvenanceRecord>::ok(snap.value().tip);
}

Result<void> ScopeRegistry::verify_chain(const std::string& name) const {
    auto scope = find(name);
    if (scope.isErr()) return Result<void>::err(scope.error());
    return scope.value()->verify_chain();
}

Result<ScopeProof> ScopeRegistry::prove(const std::string& name, const Digest& leaf) const {
    auto scope = find(name);
    if (scope.isErr()) return Result<ScopeProof>::err(scope.error());
    return scope.value()->prove(leaf);
}

Result<void> ScopeRegistry::set_authorized_keys(const std::string& name,
                                                std::set<PublicKey> keys) {
    auto scope = find(name);
    if (scope.isErr()) return Result<void>::err(scope.error());
    scope.value()->set_authorized_keys(std::move(keys));
    return Result<void>::ok();
}

} // namespace attest
