#include <doctest/doctest.h>
#include <attest/orchestrator.hpp>

#include "test_helpers.hpp"

#include <atomic>
#include <future>
#include <set>
#include <thread>

using namespace attest;
using namespace attest::test;

namespace {

Timestamp fixed_now() { return NOW; }

struct Fixture {
    std::shared_ptr<const PrivateKey> machine_key = make_key();
    Pki pki = make_pki({"net"});
    std::shared_ptr<KeyStore> keys = std::make_shared<KeyStore>(machine_key);
    ScopeRegistry registry{"", keys};
    Verifier verifier{{pki.anchor}, make_machine("m1", machine_key, {"raw-device"})};
    Orchestrator orch{registry, verifier, *keys, fixed_now};

    Fixture() {
        REQUIRE(registry.create_scope("admin").isOk());
        REQUIRE(registry.create_scope("user", std::string("admin")).isOk());
    }

    ProvenanceRecord tip(const std::string& scope = "user") {
        return registry.tip(scope).value();
    }
    Digest root(const std::string& scope = "user") {
        return registry.snapshot(scope).value().root;
    }
};

using States = std::vector<InstallState>;

} // namespace

// ============================================================================
// Install
// ============================================================================

TEST_CASE("entity-signed install commits leaf and record") {
    Fixture f;
    auto genesis = f.tip();

    auto binary = entity_binary(f.pki, "h1 content", "user", {"net"});
    auto outcome = f.orch.install(binary);

    REQUIRE(outcome.committed());
    CHECK_FALSE(outcome.error.has_value());
    CHECK(outcome.visited == States{InstallState::Received, InstallState::Verifying,
                                    InstallState::TreeUpdating, InstallState::ChainAppending,
                                    InstallState::Committed});

    CHECK(outcome.root == leaf_node_hash(binary.hash));
    CHECK(f.root() == outcome.root);

    REQUIRE(outcome.record.has_value());
    const auto& rec = *outcome.record;
    CHECK(rec.index == 1);
    CHECK(rec.previous_hash == genesis.hash());
    CHECK(rec.action == ActionKind::Install);
    CHECK(rec.binary_hash == binary.hash);
    CHECK(rec.tree_root == outcome.root);
    CHECK(rec.identity_kind == IdentityKind::EntitySigned);
    CHECK(rec.principal == "entity:vendor-app");
    CHECK(rec.timestamp == NOW);
    CHECK(f.tip().hash() == rec.hash());

    REQUIRE(outcome.proof.has_value());
    CHECK(verify_proof(outcome.root, binary.hash, *outcome.proof));
    REQUIRE(outcome.grant.has_value());
    CHECK(outcome.grant->granted == CapabilitySet{"net"});

    CHECK(f.registry.verify_chain("user").isOk());
}

TEST_CASE("denied install leaves root and tip untouched") {
    Fixture f;
    auto root_before = f.root();
    auto tip_before = f.tip();

    auto outcome = f.orch.install(make_binary(to_bytes("driver"), "user", {"raw-device"}));

    CHECK(outcome.state == InstallState::Aborted);
    REQUIRE(outcome.error.has_value());
    CHECK(outcome.error->code() == ErrorCode::SIGNATURE_REQUIRED);
    CHECK(outcome.visited == States{InstallState::Received, InstallState::Verifying,
                                    InstallState::Aborted});
    CHECK_FALSE(outcome.record.has_value());
    CHECK(outcome.root == root_before);
    CHECK(f.root() == root_before);
    CHECK(f.tip().hash() == tip_before.hash());
}

TEST_CASE("verifier denials abort the install") {
    Fixture f;

    SUBCASE("capability beyond certificate") {
        auto outcome = f.orch.install(entity_binary(f.pki, "app", "user", {"net", "admin"}));
        CHECK(outcome.error->code() == ErrorCode::CAPABILITY_DENIED);
    }
    SUBCASE("dev identity of another machine") {
        auto other_key = make_key();
        auto outcome = f.orch.install(dev_binary(*other_key, "m2", "tool", "user"));
        CHECK(outcome.error->code() == ErrorCode::FOREIGN_MACHINE_IDENTITY);
    }
    SUBCASE("untrusted vendor") {
        auto rogue = make_pki({"net"});
        auto outcome = f.orch.install(entity_binary(rogue, "app", "user", {"net"}));
        CHECK(outcome.error->code() == ErrorCode::UNTRUSTED_ROOT);
    }
    CHECK(f.tip().index == 0);
    CHECK(f.root().is_zero());
}

TEST_CASE("a binary hash equal to the tombstone is refused") {
    Fixture f;
    Binary binary;
    binary.hash = tombstone_leaf();
    binary.scope = "user";

    auto outcome = f.orch.install(binary);
    CHECK(outcome.state == InstallState::Aborted);
    REQUIRE(outcome.error.has_value());
    CHECK(outcome.error->code() == ErrorCode::INVALID_DIGEST);
    CHECK(outcome.visited == States{InstallState::Received, InstallState::Verifying,
                                    InstallState::TreeUpdating, InstallState::Aborted});
    CHECK(f.tip().index == 0);
    CHECK(f.root().is_zero());
}

TEST_CASE("dev-signed install on the signing machine") {
    Fixture f;
    auto outcome = f.orch.install(dev_binary(*f.machine_key, "m1", "tool", "user", {"raw-device"}));
    REQUIRE(outcome.committed());
    CHECK(outcome.record->identity_kind == IdentityKind::DevSigned);
    CHECK(outcome.record->principal == "dev:m1");
    CHECK(outcome.record->signer_key == f.machine_key->public_key());
}

TEST_CASE("installing into an unknown scope") {
    Fixture f;
    auto outcome = f.orch.install(make_binary(to_bytes("x"), "ghost"));
    CHECK(outcome.state == InstallState::Aborted);
    CHECK(outcome.error->code() == ErrorCode::SCOPE_NOT_FOUND);
    CHECK(outcome.visited == States{InstallState::Received, InstallState::Aborted});
}

TEST_CASE("genesis cannot be submitted") {
    Fixture f;
    InstallRequest request;
    request.action = ActionKind::Genesis;
    request.binary = make_binary(to_bytes("x"), "user");

    auto outcome = f.orch.submit(request);
    CHECK(outcome.error->code() == ErrorCode::CONFIG_INVALID);
    CHECK(f.tip().index == 0);
}

TEST_CASE("reinstalling a live binary records the action without moving the root") {
    Fixture f;
    auto binary = make_binary(to_bytes("script"), "user");
    REQUIRE(f.orch.install(binary).committed());
    auto root = f.root();

    auto again = f.orch.install(binary);
    REQUIRE(again.committed());
    CHECK(again.root == root);
    CHECK(again.record->index == 2);
    CHECK(again.proof->leaf_index == 0);
}

TEST_CASE("records for a registered vendor are signed with the vendor key") {
    Fixture f;
    auto vendor_signer = make_key();
    f.keys->register_entity_signer("vendor-app", vendor_signer);

    auto outcome = f.orch.install(entity_binary(f.pki, "app", "user", {"net"}));
    REQUIRE(outcome.committed());
    CHECK(outcome.record->signer_key == vendor_signer->public_key());

    REQUIRE(f.registry.set_authorized_keys("user", {f.machine_key->public_key()}).isOk());
    auto verified = f.registry.verify_chain("user");
    REQUIRE(verified.isErr());
    CHECK(verified.error().atIndex() == std::optional<std::uint64_t>(1));

    REQUIRE(f.registry.set_authorized_keys(
        "user", {f.machine_key->public_key(), vendor_signer->public_key()}).isOk());
    CHECK(f.registry.verify_chain("user").isOk());
}

// ============================================================================
// Rollback
// ============================================================================

TEST_CASE("signing failure rolls the tree back") {
    Fixture f;
    REQUIRE(f.orch.install(make_binary(to_bytes("first"), "user")).committed());
    auto root_before = f.root();
    auto tip_before = f.tip();

    KeyStore keyless;
    Orchestrator orch(f.registry, f.verifier, keyless, fixed_now);

    auto binary = dev_binary(*f.machine_key, "m1", "tool", "user");
    auto outcome = orch.install(binary);

    CHECK(outcome.state == InstallState::Aborted);
    REQUIRE(outcome.error.has_value());
    CHECK(outcome.error->code() == ErrorCode::SIGNING_FAILED);
    CHECK(outcome.visited == States{InstallState::Received, InstallState::Verifying,
                                    InstallState::TreeUpdating, InstallState::ChainAppending,
                                    InstallState::Aborted});

    CHECK(f.root() == root_before);
    CHECK(f.tip().hash() == tip_before.hash());
    auto scope = f.registry.find("user").value();
    CHECK_FALSE(scope->contains(binary.hash));
    CHECK(f.registry.prove("user", binary.hash).error().code() == ErrorCode::BINARY_NOT_FOUND);

    // The scope keeps working after the failed attempt
    auto retry = f.orch.install(binary);
    REQUIRE(retry.committed());
    CHECK(retry.record->index == tip_before.index + 1);
    CHECK(retry.record->previous_hash == tip_before.hash());
}

// ============================================================================
// Upgrade and Uninstall
// ============================================================================

TEST_CASE("upgrade replaces the leaf in place") {
    Fixture f;
    auto v1 = entity_binary(f.pki, "app v1", "user", {"net"});
    auto other = make_binary(to_bytes("other"), "user");
    REQUIRE(f.orch.install(v1).committed());
    REQUIRE(f.orch.install(other).committed());

    auto v2 = entity_binary(f.pki, "app v2", "user", {"net"});
    auto outcome = f.orch.upgrade(v1.hash, v2);
    REQUIRE(outcome.committed());
    CHECK(outcome.record->action == ActionKind::Upgrade);
    CHECK(outcome.record->binary_hash == v2.hash);
    CHECK(outcome.record->replaced_hash == std::optional<Digest>(v1.hash));
    CHECK(outcome.proof->leaf_index == 0);

    auto scope = f.registry.find("user").value();
    CHECK(scope->contains(v2.hash));
    CHECK_FALSE(scope->contains(v1.hash));
    CHECK(outcome.root == internal_node_hash(leaf_node_hash(v2.hash), leaf_node_hash(other.hash)));
}

TEST_CASE("upgrade errors") {
    Fixture f;
    auto v2 = entity_binary(f.pki, "app v2", "user", {"net"});

    SUBCASE("replaced binary not installed") {
        auto outcome = f.orch.upgrade(sha256(std::string("never installed")), v2);
        CHECK(outcome.error->code() == ErrorCode::BINARY_NOT_FOUND);
        CHECK(outcome.visited.back() == InstallState::Aborted);
        CHECK(outcome.visited[outcome.visited.size() - 2] == InstallState::TreeUpdating);
    }
    SUBCASE("no replaced hash given") {
        InstallRequest request;
        request.action = ActionKind::Upgrade;
        request.binary = v2;
        auto outcome = f.orch.submit(request);
        CHECK(outcome.error->code() == ErrorCode::BINARY_NOT_FOUND);
    }
    SUBCASE("new binary fails verification") {
        auto v1 = make_binary(to_bytes("v1"), "user");
        REQUIRE(f.orch.install(v1).committed());
        auto unsigned_v2 = make_binary(to_bytes("v2"), "user", {"net"});
        auto outcome = f.orch.upgrade(v1.hash, unsigned_v2);
        CHECK(outcome.error->code() == ErrorCode::SIGNATURE_REQUIRED);
        CHECK(f.registry.find("user").value()->contains(v1.hash));
    }
    CHECK(f.registry.verify_chain("user").isOk());
}

TEST_CASE("uninstall tombstones the binary") {
    Fixture f;
    auto a = make_binary(to_bytes("a"), "user");
    auto b = make_binary(to_bytes("b"), "user");
    REQUIRE(f.orch.install(a).committed());
    REQUIRE(f.orch.install(b).committed());

    Binary request = a;
    request.content.clear();
    auto outcome = f.orch.uninstall(request);
    REQUIRE(outcome.committed());
    CHECK(outcome.record->action == ActionKind::Uninstall);
    CHECK_FALSE(outcome.proof.has_value());
    CHECK(outcome.root == internal_node_hash(leaf_node_hash(tombstone_leaf()),
                                             leaf_node_hash(b.hash)));

    CHECK(f.registry.prove("user", a.hash).error().code() == ErrorCode::BINARY_NOT_FOUND);
    auto proof_b = f.registry.prove("user", b.hash);
    REQUIRE(proof_b.isOk());
    CHECK(verify_proof(outcome.root, b.hash, proof_b.value().proof));

    auto twice = f.orch.uninstall(request);
    CHECK(twice.error->code() == ErrorCode::BINARY_NOT_FOUND);
    CHECK(f.tip().index == 3);
}

// ============================================================================
// Deadlines and Locks
// ============================================================================

TEST_CASE("deadline passed during verification aborts before the tree is touched") {
    Fixture f;
    InstallRequest request;
    request.binary = make_binary(to_bytes("late"), "user");
    request.deadline = std::chrono::steady_clock::now() - std::chrono::seconds(1);

    auto outcome = f.orch.submit(request);
    CHECK(outcome.error->code() == ErrorCode::DEADLINE_EXCEEDED);
    CHECK(outcome.visited == States{InstallState::Received, InstallState::Verifying,
                                    InstallState::Aborted});
    CHECK(f.root().is_zero());
}

TEST_CASE("writer lock held by another request times out") {
    Fixture f;

    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> signalled{false};

    Orchestrator slow(f.registry, f.verifier, *f.keys, [&]() {
        if (!signalled.exchange(true)) {
            entered.set_value();
            released.wait();
        }
        return NOW;
    });

    std::thread holder([&]() {
        auto outcome = slow.install(make_binary(to_bytes("slow"), "user"));
        CHECK(outcome.committed());
    });
    entered.get_future().wait();

    InstallRequest request;
    request.binary = make_binary(to_bytes("impatient"), "user");
    request.lock_timeout = std::chrono::milliseconds(50);
    auto outcome = f.orch.submit(request);

    CHECK((outcome.error && outcome.error->code() == ErrorCode::LOCK_TIMEOUT));
    CHECK(outcome.visited == States{InstallState::Received, InstallState::Aborted});

    SUBCASE("other scopes are not blocked") {
        InstallRequest admin;
        admin.binary = make_binary(to_bytes("admin tool"), "admin");
        admin.lock_timeout = std::chrono::milliseconds(50);
        CHECK(f.orch.submit(admin).committed());
    }

    release.set_value();
    holder.join();
    CHECK(f.tip().index == 1);
}

// ============================================================================
// Nested Scopes
// ============================================================================

TEST_CASE("attest_child records the child root in the parent") {
    Fixture f;
    REQUIRE(f.orch.install(make_binary(to_bytes("user app"), "user")).committed());
    auto child_root = f.root("user");

    auto outcome = f.orch.attest_child("user");
    REQUIRE(outcome.committed());
    CHECK(outcome.record->binary_hash == child_root);
    CHECK(outcome.record->principal == "scope:user");
    CHECK(outcome.record->action == ActionKind::Install);
    CHECK(f.root("admin") == leaf_node_hash(child_root));
    CHECK(verify_proof(f.root("admin"), child_root, *outcome.proof));

    // The child chain is unaffected
    CHECK(f.tip("user").index == 1);
}

TEST_CASE("a newer child root replaces the previous attestation") {
    Fixture f;
    REQUIRE(f.orch.install(make_binary(to_bytes("first"), "user")).committed());
    auto first_root = f.root("user");
    REQUIRE(f.orch.attest_child("user").committed());

    REQUIRE(f.orch.install(make_binary(to_bytes("second"), "user")).committed());
    auto second_root = f.root("user");

    auto outcome = f.orch.attest_child("user");
    REQUIRE(outcome.committed());
    CHECK(outcome.record->action == ActionKind::Upgrade);
    CHECK(outcome.record->binary_hash == second_root);
    CHECK(outcome.record->replaced_hash == std::optional<Digest>(first_root));

    auto admin = f.registry.find("admin").value();
    CHECK(admin->contains(second_root));
    CHECK_FALSE(admin->contains(first_root));
    CHECK(f.root("admin") == leaf_node_hash(second_root));

    SUBCASE("attesting an unchanged child leaves the root alone") {
        auto again = f.orch.attest_child("user");
        REQUIRE(again.committed());
        CHECK(again.record->action == ActionKind::Install);
        CHECK(f.root("admin") == leaf_node_hash(second_root));
    }
}

TEST_CASE("attested root always belongs to a verified child chain") {
    Fixture f;
    REQUIRE(f.orch.install(make_binary(to_bytes("seed"), "user")).committed());

    std::atomic<bool> done{false};
    std::thread writer([&]() {
        for (int i = 0; i < 20; ++i) {
            f.orch.install(make_binary(to_bytes("w-" + std::to_string(i)), "user"));
        }
        done = true;
    });

    std::vector<Digest> attested;
    for (int i = 0; i < 200 && !done.load(); ++i) {
        auto outcome = f.orch.attest_child("user");
        if (outcome.committed()) attested.push_back(outcome.record->binary_hash);
    }
    writer.join();

    std::set<Digest> child_roots;
    for (const auto& rec : f.registry.find("user").value()->records()) {
        child_roots.insert(rec.tree_root);
    }
    for (const auto& root : attested) {
        CHECK(child_roots.count(root) == 1);
    }
    CHECK(f.registry.verify_chain("admin").isOk());
}

TEST_CASE("attest_child errors") {
    Fixture f;

    SUBCASE("scope without parent") {
        auto outcome = f.orch.attest_child("admin");
        CHECK(outcome.error->code() == ErrorCode::SCOPE_NOT_FOUND);
    }
    SUBCASE("unknown child") {
        auto outcome = f.orch.attest_child("ghost");
        CHECK(outcome.error->code() == ErrorCode::SCOPE_NOT_FOUND);
    }
    SUBCASE("child with nothing installed") {
        auto outcome = f.orch.attest_child("user");
        CHECK(outcome.error->code() == ErrorCode::BINARY_NOT_FOUND);
        CHECK(f.tip("admin").index == 0);
    }
    SUBCASE("child chain fails verification") {
        REQUIRE(f.registry.set_authorized_keys("user", {make_key()->public_key()}).isOk());
        auto outcome = f.orch.attest_child("user");
        CHECK(outcome.error->code() == ErrorCode::TAMPER_DETECTED);
        CHECK(f.tip("admin").index == 0);
    }
}
