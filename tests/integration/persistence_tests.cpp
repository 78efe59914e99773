#include <doctest/doctest.h>
#include <attest/attest.hpp>

#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <sstream>

using namespace attest;
using namespace attest::test;

namespace {

Timestamp fixed_now() { return NOW; }

std::string scope_file(const std::string& root, const std::string& scope,
                       const std::string& file) {
    return join_path(join_path(join_path(root, "scopes"), scope), file);
}

std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> lines;
    std::istringstream in(read_file(path).value_or(""));
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

void write_lines(const std::string& path, const std::vector<std::string>& lines) {
    std::string content;
    for (const auto& line : lines) content += line + "\n";
    REQUIRE(atomic_write_file(path, content).ok);
}

// A machine with one persistent scope "user" holding three installs
struct Machine {
    TempDir dir;
    std::shared_ptr<const PrivateKey> machine_key = make_key();
    std::shared_ptr<KeyStore> keys = std::make_shared<KeyStore>(machine_key);
    Verifier verifier{{}, make_machine("m1", machine_key, {"net"})};
    std::vector<Binary> installed;

    Machine() {
        ScopeRegistry registry(dir.path(), keys);
        REQUIRE(registry.create_scope("user").isOk());
        Orchestrator orch(registry, verifier, *keys, fixed_now);
        for (int i = 0; i < 3; ++i) {
            auto binary = dev_binary(*machine_key, "m1", "tool-" + std::to_string(i), "user",
                                     {"net"});
            REQUIRE(orch.install(binary).committed());
            installed.push_back(binary);
        }
    }
};

} // namespace

TEST_CASE("scope state survives a restart") {
    Machine m;

    ScopeRegistry first(m.dir.path(), m.keys);
    REQUIRE(first.load_all().isOk());
    auto snap = first.snapshot("user").value();

    ScopeRegistry reloaded(m.dir.path(), m.keys);
    REQUIRE(reloaded.load_all().value() == 1);
    auto again = reloaded.snapshot("user").value();

    CHECK(again.root == snap.root);
    CHECK(again.tip.hash() == snap.tip.hash());
    CHECK(again.chain_length == 4);
    CHECK(reloaded.verify_chain("user").isOk());

    for (const auto& binary : m.installed) {
        auto proof = reloaded.prove("user", binary.hash);
        REQUIRE(proof.isOk());
        CHECK(verify_proof(again.root, binary.hash, proof.value().proof));
    }
}

TEST_CASE("upgrade records keep the replaced binary across a restart") {
    Machine m;
    auto v2 = dev_binary(*m.machine_key, "m1", "tool-1 v2", "user", {"net"});
    {
        ScopeRegistry registry(m.dir.path(), m.keys);
        REQUIRE(registry.load_all().isOk());
        Orchestrator orch(registry, m.verifier, *m.keys, fixed_now);
        REQUIRE(orch.upgrade(m.installed[1].hash, v2).committed());
    }

    ScopeRegistry reloaded(m.dir.path(), m.keys);
    REQUIRE(reloaded.load_all().isOk());
    CHECK(reloaded.verify_chain("user").isOk());

    auto tip = reloaded.tip("user").value();
    CHECK(tip.action == ActionKind::Upgrade);
    CHECK(tip.binary_hash == v2.hash);
    CHECK(tip.replaced_hash == std::optional<Digest>(m.installed[1].hash));
}

TEST_CASE("installs after a restart extend the stored chain") {
    Machine m;
    {
        ScopeRegistry registry(m.dir.path(), m.keys);
        REQUIRE(registry.load_all().isOk());
        Orchestrator orch(registry, m.verifier, *m.keys, fixed_now);
        Binary request = m.installed[1];
        request.content.clear();
        REQUIRE(orch.uninstall(request).committed());
    }

    ScopeRegistry reloaded(m.dir.path(), m.keys);
    REQUIRE(reloaded.load_all().isOk());
    auto tip = reloaded.tip("user").value();
    CHECK(tip.index == 4);
    CHECK(tip.action == ActionKind::Uninstall);
    CHECK(reloaded.verify_chain("user").isOk());
    CHECK(reloaded.prove("user", m.installed[1].hash).error().code() ==
          ErrorCode::BINARY_NOT_FOUND);
    CHECK(read_lines(scope_file(m.dir.path(), "user", "chain.log")).size() == 5);
}

TEST_CASE("edited record on disk is detected at its index") {
    Machine m;
    std::string log = scope_file(m.dir.path(), "user", "chain.log");
    auto lines = read_lines(log);
    REQUIRE(lines.size() == 4);

    auto rec = nlohmann::json::parse(lines[2]);
    rec["principal"] = "entity:trusted-vendor";
    lines[2] = rec.dump();
    write_lines(log, lines);

    ScopeRegistry registry(m.dir.path(), m.keys);
    REQUIRE(registry.load_all().isOk());
    auto verified = registry.verify_chain("user");
    REQUIRE(verified.isErr());
    CHECK(verified.error().code() == ErrorCode::TAMPER_DETECTED);
    CHECK(verified.error().atIndex() == std::optional<std::uint64_t>(2));
}

TEST_CASE("deleted record on disk is detected") {
    Machine m;
    std::string log = scope_file(m.dir.path(), "user", "chain.log");
    auto lines = read_lines(log);
    lines.erase(lines.begin() + 1);
    write_lines(log, lines);

    ScopeRegistry registry(m.dir.path(), m.keys);
    REQUIRE(registry.load_all().isOk());
    auto verified = registry.verify_chain("user");
    REQUIRE(verified.isErr());
    CHECK(verified.error().atIndex() == std::optional<std::uint64_t>(1));
}

TEST_CASE("corrupt log line is a parse error with its line number") {
    Machine m;
    std::string log = scope_file(m.dir.path(), "user", "chain.log");
    auto lines = read_lines(log);
    lines[3] = lines[3].substr(0, lines[3].size() / 2);
    write_lines(log, lines);

    ScopeRegistry registry(m.dir.path(), m.keys);
    auto loaded = registry.load_scope("user");
    REQUIRE(loaded.isErr());
    CHECK(loaded.error().code() == ErrorCode::PARSE_ERROR);
    CHECK(loaded.error().message().find("chain.log:4") != std::string::npos);
}

TEST_CASE("tree snapshot that disagrees with the chain tip is tamper") {
    Machine m;
    std::string tree_path = scope_file(m.dir.path(), "user", "tree.json");

    SUBCASE("consistent tree with a smuggled leaf") {
        MerkleTree forged;
        for (const auto& binary : m.installed) forged.insert(binary.hash);
        forged.insert(sha256(std::string("smuggled")));
        REQUIRE(atomic_write_file(tree_path,
            json::tree_snapshot_to_json(forged.snapshot()).dump()).ok);

        ScopeRegistry registry(m.dir.path(), m.keys);
        auto loaded = registry.load_scope("user");
        REQUIRE(loaded.isErr());
        CHECK(loaded.error().code() == ErrorCode::TAMPER_DETECTED);
        CHECK(loaded.error().atIndex() == std::optional<std::uint64_t>(3));
    }
    SUBCASE("cached hashes edited") {
        auto snap = json::parse_tree_snapshot(read_file(tree_path).value());
        REQUIRE(snap.ok);
        snap.value.levels[1][0] = sha256(std::string("edited"));
        REQUIRE(atomic_write_file(tree_path,
            json::tree_snapshot_to_json(snap.value).dump()).ok);

        ScopeRegistry registry(m.dir.path(), m.keys);
        auto loaded = registry.load_scope("user");
        REQUIRE(loaded.isErr());
        CHECK(loaded.error().code() == ErrorCode::TAMPER_DETECTED);
    }
}

TEST_CASE("tree file from before the last record is detected on load") {
    // State left behind when the record was appended but the tree rename
    // never happened
    Machine m;
    std::string tree_path = scope_file(m.dir.path(), "user", "tree.json");
    auto old_tree = read_file(tree_path).value();

    {
        ScopeRegistry registry(m.dir.path(), m.keys);
        REQUIRE(registry.load_all().isOk());
        Orchestrator orch(registry, m.verifier, *m.keys, fixed_now);
        REQUIRE(orch.install(make_binary(to_bytes("late"), "user")).committed());
    }
    REQUIRE(atomic_write_file(tree_path, old_tree).ok);

    ScopeRegistry registry(m.dir.path(), m.keys);
    auto loaded = registry.load_scope("user");
    REQUIRE(loaded.isErr());
    CHECK(loaded.error().code() == ErrorCode::TAMPER_DETECTED);
    CHECK(loaded.error().atIndex() == std::optional<std::uint64_t>(4));
}

TEST_CASE("failed persist leaves memory and disk unchanged") {
    Machine m;
    ScopeRegistry registry(m.dir.path(), m.keys);
    REQUIRE(registry.load_all().isOk());
    Orchestrator orch(registry, m.verifier, *m.keys, fixed_now);

    auto before = registry.snapshot("user").value();
    std::string scope_dir = join_path(join_path(m.dir.path(), "scopes"), "user");
    std::filesystem::remove_all(scope_dir);

    auto binary = make_binary(to_bytes("unlucky"), "user");
    auto outcome = orch.install(binary);
    CHECK(outcome.state == InstallState::Aborted);
    REQUIRE(outcome.error.has_value());
    CHECK(outcome.error->code() == ErrorCode::IO_ERROR);

    auto after = registry.snapshot("user").value();
    CHECK(after.root == before.root);
    CHECK(after.tip.hash() == before.tip.hash());
    CHECK_FALSE(registry.find("user").value()->contains(binary.hash));
}

// ============================================================================
// Core
// ============================================================================

namespace {

struct ConfigFixture {
    TempDir dir;
    std::shared_ptr<const PrivateKey> machine_key = make_key();
    std::string key_path;
    std::string config_path;

    ConfigFixture() {
        key_path = join_path(dir.path(), "machine.pem");
        config_path = join_path(dir.path(), "config.json");
        REQUIRE(atomic_write_file(key_path, machine_key->to_pem().value()).ok);
    }

    CoreConfig write(const nlohmann::json& scopes, const std::string& public_key = "") {
        nlohmann::json j;
        j["$schema"] = "attest.config.v1";
        j["machine"] = {{"id", "m1"}, {"private_key", "machine.pem"}};
        if (!public_key.empty()) j["machine"]["public_key"] = public_key;
        j["capabilities"] = {{"local", {"net"}}};
        j["scopes"] = scopes;
        j["state_root"] = "state";
        REQUIRE(atomic_write_file(config_path, j.dump(2)).ok);

        auto parsed = load_core_config(config_path);
        REQUIRE(parsed.ok);
        return parsed.config;
    }
};

} // namespace

TEST_CASE("core creates configured scopes and reopens them") {
    ConfigFixture fx;
    auto config = fx.write(nlohmann::json::array({
        {{"name", "admin"}},
        {{"name", "user"}, {"parent", "admin"}}}));

    Digest root;
    {
        auto core = Core::open(config);
        REQUIRE(core.isOk());
        CHECK(core.value()->registry().list_scopes() ==
              std::vector<std::string>{"admin", "user"});

        auto binary = dev_binary(*fx.machine_key, "m1", "tool", "user", {"net"});
        auto outcome = core.value()->orchestrator().install(binary);
        REQUIRE(outcome.committed());
        root = outcome.root;

        REQUIRE(core.value()->orchestrator().attest_child("user").committed());
    }

    auto reopened = Core::open(config, Core::Mode::ReadOnly);
    REQUIRE(reopened.isOk());
    auto& registry = reopened.value()->registry();
    CHECK(registry.snapshot("user").value().root == root);
    CHECK(registry.tip("user").value().index == 1);
    CHECK(registry.tip("admin").value().binary_hash == root);
    CHECK(registry.verify_chain("admin").isOk());
}

TEST_CASE("read-only core does not create scopes") {
    ConfigFixture fx;
    auto config = fx.write(nlohmann::json::array({{{"name", "user"}}}));

    auto core = Core::open(config, Core::Mode::ReadOnly);
    REQUIRE(core.isOk());
    CHECK(core.value()->registry().list_scopes().empty());
    CHECK_FALSE(path_exists(join_path(config.state_root, "scopes")));
}

TEST_CASE("core open errors") {
    ConfigFixture fx;

    SUBCASE("public key does not match the private key") {
        auto config = fx.write(nlohmann::json::array(), make_key()->public_key().to_hex());
        auto core = Core::open(config);
        REQUIRE(core.isErr());
        CHECK(core.error().code() == ErrorCode::CONFIG_INVALID);
    }
    SUBCASE("private key file missing") {
        auto config = fx.write(nlohmann::json::array());
        config.machine_private_key_path = join_path(fx.dir.path(), "missing.pem");
        auto core = Core::open(config);
        REQUIRE(core.isErr());
        CHECK(core.error().code() == ErrorCode::KEY_UNAVAILABLE);
    }
    SUBCASE("stored parent differs from config") {
        auto first = fx.write(nlohmann::json::array({
            {{"name", "admin"}},
            {{"name", "user"}, {"parent", "admin"}}}));
        REQUIRE(Core::open(first).isOk());

        auto second = fx.write(nlohmann::json::array({
            {{"name", "admin"}},
            {{"name", "user"}}}));
        auto core = Core::open(second);
        REQUIRE(core.isErr());
        CHECK(core.error().code() == ErrorCode::CONFIG_INVALID);
    }
}

TEST_CASE("configured signers restrict who may extend a scope") {
    ConfigFixture fx;
    auto vendor = make_key();
    auto config = fx.write(nlohmann::json::array({
        {{"name", "user"}, {"authorized_signers", {vendor->public_key().to_hex()}}}}));

    auto core = Core::open(config);
    REQUIRE(core.isOk());
    auto scope = core.value()->registry().find("user").value();
    CHECK(scope->authorized_keys().count(vendor->public_key()) == 1);
    CHECK(scope->authorized_keys().count(fx.machine_key->public_key()) == 1);
    CHECK(core.value()->registry().verify_chain("user").isOk());
}
