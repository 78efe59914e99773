#include "attest/orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <mutex>
#include <optional>
#include <shared_mutex>

namespace attest {

namespace {

// Binary hash of the latest install or upgrade recorded for `principal`
std::optional<Digest> last_attested_root(const ProvenanceChain& chain,
                                         const std::string& principal) {
    const auto& records = chain.records();
    for (auto it = records.rbegin(); it != records.rend(); ++it) {
        if (it->principal != principal) continue;
        if (it->action == ActionKind::Install || it->action == ActionKind::Upgrade) {
            return it->binary_hash;
        }
    }
    return std::nullopt;
}

} // namespace

Orchestrator::Orchestrator(ScopeRegistry& registry, const Verifier& verifier,
                           const KeyStore& keys, Clock clock)
    : registry_(registry), verifier_(verifier), keys_(keys), clock_(std::move(clock)) {}

void Orchestrator::transition(Outcome& outcome, InstallState next,
                              const std::string& scope) const {
    spdlog::debug("[{}] {} -> {}", scope, install_state_to_string(outcome.state),
                  install_state_to_string(next));
    outcome.state = next;
    outcome.visited.push_back(next);
}

void Orchestrator::abort(Outcome& outcome, Error error, const std::string& scope) const {
    spdlog::warn("[{}] aborted in {}: {}", scope, install_state_to_string(outcome.state),
                 error.toString());
    outcome.state = InstallState::Aborted;
    outcome.visited.push_back(InstallState::Aborted);
    outcome.error = std::move(error);
}

// ============================================================================
// Requests
// ============================================================================

Outcome Orchestrator::install(Binary binary) {
    InstallRequest request;
    request.action = ActionKind::Install;
    request.binary = std::move(binary);
    return submit(request);
}

Outcome Orchestrator::upgrade(const Digest& replaces, Binary binary) {
    InstallRequest request;
    request.action = ActionKind::Upgrade;
    request.binary = std::move(binary);
    request.replaces = replaces;
    return submit(request);
}

Outcome Orchestrator::uninstall(Binary binary) {
    InstallRequest request;
    request.action = ActionKind::Uninstall;
    request.binary = std::move(binary);
    return submit(request);
}

Outcome Orchestrator::submit(const InstallRequest& request) {
    const Binary& binary = request.binary;
    const std::string& name = binary.scope;

    Outcome outcome;
    outcome.visited.push_back(InstallState::Received);

    if (request.action == ActionKind::Genesis) {
        abort(outcome, Error(ErrorCode::CONFIG_INVALID,
              "genesis is written when the scope is created"), name);
        return outcome;
    }
    if (request.action == ActionKind::Upgrade && !request.replaces) {
        abort(outcome, Error(ErrorCode::BINARY_NOT_FOUND,
              "upgrade requires the hash of the binary it replaces"), name);
        return outcome;
    }

    auto found = registry_.find(name);
    if (found.isErr()) {
        abort(outcome, found.error(), name);
        return outcome;
    }
    TrustScope& scope = *found.value();

    std::unique_lock<std::timed_mutex> writer(scope.writer_mutex_, std::defer_lock);
    if (request.lock_timeout) {
        if (!writer.try_lock_for(*request.lock_timeout)) {
            outcome.root = scope.snapshot()->root;
            abort(outcome, Error(ErrorCode::LOCK_TIMEOUT,
                  "scope writer lock not acquired within " +
                  std::to_string(request.lock_timeout->count()) + "ms"), name);
            return outcome;
        }
    } else {
        writer.lock();
    }
    outcome.root = scope.snapshot()->root;

    transition(outcome, InstallState::Verifying, name);
    auto grant = verifier_.verify(binary, clock_());
    if (grant.isErr()) {
        abort(outcome, grant.error(), name);
        return outcome;
    }
    outcome.grant = grant.value();

    if (request.deadline && std::chrono::steady_clock::now() > *request.deadline) {
        abort(outcome, Error(ErrorCode::DEADLINE_EXCEEDED,
              "request deadline passed before tree update"), name);
        return outcome;
    }

    Mutation mutation;
    mutation.action = request.action;
    mutation.leaf = binary.hash;
    mutation.replaces = request.replaces;
    mutation.identity_kind = grant.value().kind;
    mutation.principal = grant.value().principal;
    mutation.identity = binary.identity;

    apply(scope, mutation, outcome);
    return outcome;
}

Outcome Orchestrator::attest_child(const std::string& child) {
    Outcome outcome;
    outcome.visited.push_back(InstallState::Received);

    auto child_scope = registry_.find(child);
    if (child_scope.isErr()) {
        abort(outcome, child_scope.error(), child);
        return outcome;
    }
    const auto& parent_name = child_scope.value()->parent();
    if (!parent_name) {
        abort(outcome, Error(ErrorCode::SCOPE_NOT_FOUND,
              "scope '" + child + "' has no parent"), child);
        return outcome;
    }
    auto parent_scope = registry_.find(*parent_name);
    if (parent_scope.isErr()) {
        abort(outcome, parent_scope.error(), *parent_name);
        return outcome;
    }
    TrustScope& parent = *parent_scope.value();

    std::unique_lock<std::timed_mutex> writer(parent.writer_mutex_);
    outcome.root = parent.snapshot()->root;

    transition(outcome, InstallState::Verifying, parent.name());
    auto child_snapshot = child_scope.value()->verified_snapshot();
    if (child_snapshot.isErr()) {
        abort(outcome, child_snapshot.error(), parent.name());
        return outcome;
    }
    const Digest child_root = child_snapshot.value()->root;
    if (child_root.is_zero()) {
        abort(outcome, Error(ErrorCode::BINARY_NOT_FOUND,
              "scope '" + child + "' has nothing installed to attest"), parent.name());
        return outcome;
    }

    Mutation mutation;
    mutation.action = ActionKind::Install;
    mutation.leaf = child_root;
    mutation.identity_kind = IdentityKind::Unsigned;
    mutation.principal = scope_principal(child);

    // A newer child root supersedes the previous attestation in place
    if (auto previous = last_attested_root(parent.chain_, mutation.principal)) {
        if (*previous != child_root && parent.tree_.contains(*previous)) {
            mutation.action = ActionKind::Upgrade;
            mutation.replaces = *previous;
        }
    }

    apply(parent, mutation, outcome);
    return outcome;
}

// ============================================================================
// Tree update and chain append
// ============================================================================

void Orchestrator::apply(TrustScope& scope, const Mutation& mutation, Outcome& outcome) {
    const std::string& name = scope.name();

    transition(outcome, InstallState::TreeUpdating, name);
    std::unique_lock<std::shared_mutex> data(scope.data_mutex_);

    MerkleTree::Undo undo;
    std::optional<InclusionProof> proof;
    switch (mutation.action) {
        case ActionKind::Install: {
            auto inserted = scope.tree_.insert(mutation.leaf, &undo);
            if (inserted.isErr()) {
                abort(outcome, inserted.error(), name);
                return;
            }
            proof = std::move(inserted.value().proof);
            break;
        }
        case ActionKind::Upgrade: {
            auto replaced = scope.tree_.replace(*mutation.replaces, mutation.leaf, &undo);
            if (replaced.isErr()) {
                abort(outcome, replaced.error(), name);
                return;
            }
            proof = std::move(replaced.value().proof);
            break;
        }
        case ActionKind::Uninstall: {
            auto removed = scope.tree_.remove(mutation.leaf, &undo);
            if (removed.isErr()) {
                abort(outcome, removed.error(), name);
                return;
            }
            break;
        }
        case ActionKind::Genesis:
            abort(outcome, Error(ErrorCode::CONFIG_INVALID, "genesis cannot be applied"), name);
            return;
    }

    transition(outcome, InstallState::ChainAppending, name);

    AppendInput input;
    input.action = mutation.action;
    input.binary_hash = mutation.leaf;
    if (mutation.action == ActionKind::Upgrade) input.replaced_hash = mutation.replaces;
    input.tree_root = scope.tree_.root();
    input.identity_kind = mutation.identity_kind;
    input.principal = mutation.principal;
    input.timestamp = clock_();

    auto record = scope.chain_.prepare(input, keys_.signer_for(mutation.identity));
    if (record.isErr()) {
        scope.tree_.rollback(undo);
        abort(outcome, record.error(), name);
        return;
    }

    if (scope.store_) {
        auto persisted = scope.store_->persist(scope.tree_.snapshot(), record.value());
        if (persisted.isErr()) {
            scope.tree_.rollback(undo);
            spdlog::error("[{}] persisting record {} failed: {}", name,
                          record.value().index, persisted.error().toString());
            abort(outcome, persisted.error(), name);
            return;
        }
    }

    auto committed = scope.chain_.commit(record.value());
    if (committed.isErr()) {
        scope.tree_.rollback(undo);
        spdlog::error("[{}] record {} stored but not linked: {}", name,
                      record.value().index, committed.error().toString());
        abort(outcome, committed.error(), name);
        return;
    }

    scope.publish();

    transition(outcome, InstallState::Committed, name);
    outcome.root = scope.tree_.root();
    outcome.record = std::move(record.value());
    outcome.proof = std::move(proof);

    spdlog::info("[{}] {} {} by {} -> record #{} root {}", name,
                 action_kind_to_string(mutation.action), mutation.leaf.to_hex(),
                 mutation.principal, outcome.record->index, outcome.root.to_hex());
}

} // namespace attest
