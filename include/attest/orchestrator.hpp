#pragma once

/**
 * @file orchestrator.hpp
 * @brief Installation state machine
 *
 * Drives one install, upgrade or uninstall request through
 *
 *   Received -> Verifying -> TreeUpdating -> ChainAppending -> Committed
 *
 * with Aborted reachable from every non-terminal state. The tree mutation
 * and the chain append (including persistence) form one unit: if any step
 * after TreeUpdating fails, the tree change is rolled back and the scope's
 * root and tip are exactly what they were before the request.
 *
 * @example
 * ```cpp
 * attest::Orchestrator orch(registry, verifier, keys);
 * auto outcome = orch.install(attest::make_binary(bytes, "user"));
 * if (!outcome.committed()) {
 *     std::cerr << outcome.error->toString() << "\n";
 * }
 * ```
 */

#include "attest/identity.hpp"
#include "attest/key_store.hpp"
#include "attest/merkle_tree.hpp"
#include "attest/provenance_chain.hpp"
#include "attest/result.hpp"
#include "attest/scope.hpp"
#include "attest/verifier.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace attest {

enum class InstallState {
    Received,
    Verifying,
    TreeUpdating,
    ChainAppending,
    Committed,
    Aborted
};

inline const char* install_state_to_string(InstallState s) {
    switch (s) {
        case InstallState::Received: return "received";
        case InstallState::Verifying: return "verifying";
        case InstallState::TreeUpdating: return "tree-updating";
        case InstallState::ChainAppending: return "chain-appending";
        case InstallState::Committed: return "committed";
        case InstallState::Aborted: return "aborted";
        default: return "aborted";
    }
}

struct InstallRequest {
    ActionKind action = ActionKind::Install;
    Binary binary;

    // Upgrade only: hash of the binary being replaced
    std::optional<Digest> replaces;

    // Bound on waiting for the scope's writer lock; unbounded if unset
    std::optional<std::chrono::milliseconds> lock_timeout;

    // Checked before the tree is touched; ignored once TreeUpdating starts
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

struct Outcome {
    InstallState state = InstallState::Received;
    std::vector<InstallState> visited;
    std::optional<Error> error;

    // Set when committed
    std::optional<ProvenanceRecord> record;
    std::optional<InclusionProof> proof;
    std::optional<Grant> grant;

    // New root when committed, otherwise the unchanged root
    Digest root;

    bool committed() const { return state == InstallState::Committed; }
};

/**
 * @brief Runs install/upgrade/uninstall requests against a ScopeRegistry
 *
 * The registry, verifier and key store must outlive the orchestrator.
 * Any number of orchestrations may run concurrently; requests for the
 * same scope serialize on its writer lock.
 */
class Orchestrator {
public:
    using Clock = std::function<Timestamp()>;

    Orchestrator(ScopeRegistry& registry, const Verifier& verifier, const KeyStore& keys,
                 Clock clock = now_seconds);

    Outcome submit(const InstallRequest& request);

    Outcome install(Binary binary);
    Outcome upgrade(const Digest& replaces, Binary binary);

    // `binary` needs only hash, scope and the authorizing identity/signature
    Outcome uninstall(Binary binary);

    // Record the current root of `child` as a leaf of its parent scope
    Outcome attest_child(const std::string& child);

private:
    struct Mutation {
        ActionKind action = ActionKind::Install;
        Digest leaf;
        std::optional<Digest> replaces;
        IdentityKind identity_kind = IdentityKind::Unsigned;
        std::string principal;
        std::optional<Identity> identity;
    };

    // TreeUpdating and ChainAppending. Caller holds the scope's writer lock.
    void apply(TrustScope& scope, const Mutation& mutation, Outcome& outcome);

    void transition(Outcome& outcome, InstallState next, const std::string& scope) const;
    void abort(Outcome& outcome, Error error, const std::string& scope) const;

    ScopeRegistry& registry_;
    const Verifier& verifier_;
    const KeyStore& keys_;
    Clock clock_;
};

} // namespace attest
