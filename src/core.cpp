#include "attest/core.hpp"

#include <spdlog/spdlog.h>

namespace attest {

Core::Core(CoreConfig config) : config_(std::move(config)) {}

Result<std::unique_ptr<Core>> Core::open(const CoreConfig& config, Mode mode) {
    using R = Result<std::unique_ptr<Core>>;

    std::unique_ptr<Core> core(new Core(config));

    MachineIdentity machine;
    machine.machine_id = config.machine_id;
    machine.public_key = config.machine_public_key;
    machine.local_capabilities = config.local_capabilities;

    if (!config.machine_private_key_path.empty()) {
        auto key = PrivateKey::load_pem_file(config.machine_private_key_path);
        if (key.isErr()) {
            return R::err(key.error());
        }
        auto derived = key.value().public_key();
        if (!machine.public_key.empty() && machine.public_key != derived) {
            return R::err(Error(ErrorCode::CONFIG_INVALID,
                "machine.public_key does not match " + config.machine_private_key_path));
        }
        machine.public_key = derived;
        machine.private_key = std::make_shared<const PrivateKey>(std::move(key.value()));
    }

    core->keys_ = std::make_shared<KeyStore>(machine.private_key);
    core->verifier_ = std::make_unique<Verifier>(config.trust_anchors, machine);
    core->registry_ = std::make_unique<ScopeRegistry>(config.state_root, core->keys_);
    core->orchestrator_ = std::make_unique<Orchestrator>(*core->registry_, *core->verifier_,
                                                         *core->keys_);

    if (!config.state_root.empty()) {
        auto loaded = core->registry_->load_all();
        if (loaded.isErr()) {
            return R::err(loaded.error());
        }
        spdlog::debug("loaded {} scope(s) from {}", loaded.value(), config.state_root);
    }

    for (const auto& scope : config.scopes) {
        auto existing = core->registry_->find(scope.name);
        if (existing.isErr()) {
            if (mode == Mode::ReadOnly) {
                spdlog::warn("configured scope '{}' does not exist", scope.name);
                continue;
            }
            auto created = core->registry_->create_scope(scope.name, scope.parent);
            if (created.isErr()) {
                return R::err(created.error());
            }
        } else if (existing.value()->parent() != scope.parent) {
            return R::err(Error(ErrorCode::CONFIG_INVALID,
                "scope '" + scope.name + "' is stored with a different parent"));
        }

        if (!scope.authorized_signers.empty()) {
            std::set<PublicKey> keys(scope.authorized_signers.begin(),
                                     scope.authorized_signers.end());
            if (!machine.public_key.empty()) {
                keys.insert(machine.public_key);
            }
            auto set = core->registry_->set_authorized_keys(scope.name, std::move(keys));
            if (set.isErr()) {
                return R::err(set.error());
            }
        }
    }

    return R::ok(std::move(core));
}

} // namespace attest
