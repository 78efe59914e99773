#pragma once

#include "attest/config.hpp"
#include "attest/key_store.hpp"
#include "attest/orchestrator.hpp"
#include "attest/result.hpp"
#include "attest/scope.hpp"
#include "attest/verifier.hpp"

#include <memory>

namespace attest {

/**
 * @brief A configured attest instance: keys, verifier, scopes, orchestrator
 *
 * open() loads the machine key, loads every stored scope and, unless
 * opened read-only, creates the configured scopes that do not exist yet.
 */
class Core {
public:
    enum class Mode { ReadWrite, ReadOnly };

    static Result<std::unique_ptr<Core>> open(const CoreConfig& config,
                                              Mode mode = Mode::ReadWrite);

    Core(const Core&) = delete;
    Core& operator=(const Core&) = delete;

    const CoreConfig& config() const { return config_; }
    KeyStore& keys() { return *keys_; }
    const Verifier& verifier() const { return *verifier_; }
    ScopeRegistry& registry() { return *registry_; }
    Orchestrator& orchestrator() { return *orchestrator_; }

private:
    explicit Core(CoreConfig config);

    CoreConfig config_;
    std::shared_ptr<KeyStore> keys_;
    std::unique_ptr<Verifier> verifier_;
    std::unique_ptr<ScopeRegistry> registry_;
    std::unique_ptr<Orchestrator> orchestrator_;
};

} // namespace attest
