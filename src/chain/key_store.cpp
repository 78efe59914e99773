#include "attest/key_store.hpp"

namespace attest {

KeyStore::KeyStore(std::shared_ptr<const PrivateKey> machine_key)
    : machine_key_(std::move(machine_key)) {}

void KeyStore::set_machine_key(std::shared_ptr<const PrivateKey> key) {
    std::lock_guard<std::mutex> lock(mutex_);
    machine_key_ = std::move(key);
}

bool KeyStore::has_machine_key() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return machine_key_ && machine_key_->valid();
}

void KeyStore::register_entity_signer(const std::string& subject,
                                      std::shared_ptr<const PrivateKey> key) {
    std::lock_guard<std::mutex> lock(mutex_);
    entity_signers_[subject] = std::move(key);
}

KeySigner KeyStore::machine_signer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return KeySigner(machine_key_);
}

KeySigner KeyStore::signer_for(const std::optional<Identity>& identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (identity) {
        if (const auto* entity = std::get_if<EntitySigned>(&*identity)) {
            if (!entity->certificate_chain.empty()) {
                auto it = entity_signers_.find(entity->certificate_chain.front().subject);
                if (it != entity_signers_.end()) {
                    return KeySigner(it->second);
                }
            }
        }
    }
    return KeySigner(machine_key_);
}

} // namespace attest
