#include "attest/provenance_chain.hpp"

#include <spdlog/spdlog.h>

namespace attest {

namespace {

constexpr const char* RECORD_DOMAIN = "attest.record.v1";

} // namespace

// ============================================================================
// Provenance Record
// ============================================================================

Digest ProvenanceRecord::signing_digest() const {
    Hasher h;
    h.update_string(RECORD_DOMAIN);
    h.update_u64(index);
    h.update_digest(previous_hash);
    h.update_string(action_kind_to_string(action));
    h.update_digest(binary_hash);
    h.update_bool(replaced_hash.has_value());
    if (replaced_hash) h.update_digest(*replaced_hash);
    h.update_digest(tree_root);
    h.update_string(identity_kind_to_string(identity_kind));
    h.update_string(principal);
    h.update_blob(signer_key.raw);
    h.update_i64(timestamp);
    return h.finish();
}

Digest ProvenanceRecord::hash() const {
    Hasher h;
    h.update_digest(signing_digest());
    h.update_blob(signature);
    return h.finish();
}

// ============================================================================
// Key Signer
// ============================================================================

PublicKey KeySigner::public_key() const {
    if (!key_) return PublicKey{};
    return key_->public_key();
}

Result<Signature> KeySigner::sign(const Digest& message) const {
    if (!key_ || !key_->valid()) {
        return Result<Signature>::err(Error(ErrorCode::KEY_UNAVAILABLE, "signer has no private key"));
    }
    return attest::sign(*key_, message);
}

// ============================================================================
// Chain Verification
// ============================================================================

Result<void> verify_records(const std::vector<ProvenanceRecord>& records,
                            std::size_t count,
                            const std::set<PublicKey>& authorized_keys) {
    if (count > records.size()) count = records.size();

    for (std::size_t i = 0; i < count; ++i) {
        const auto& rec = records[i];

        if (rec.index != i) {
            return Result<void>::err(Error::tamper(i,
                "record index " + std::to_string(rec.index) + " out of sequence"));
        }

        if (i == 0) {
            if (!rec.previous_hash.is_zero() || rec.action != ActionKind::Genesis) {
                return Result<void>::err(Error::tamper(0, "genesis record malformed"));
            }
        } else {
            if (rec.action == ActionKind::Genesis) {
                return Result<void>::err(Error::tamper(i, "genesis action after chain start"));
            }
            if (rec.previous_hash != records[i - 1].hash()) {
                return Result<void>::err(Error::tamper(i, "previous hash does not match predecessor"));
            }
        }

        if (!verify(rec.signer_key, rec.signing_digest(), rec.signature)) {
            return Result<void>::err(Error::tamper(i, "record signature does not verify"));
        }

        if (!authorized_keys.empty() && authorized_keys.count(rec.signer_key) == 0) {
            return Result<void>::err(Error::tamper(i,
                "record signed by unauthorized key " + rec.signer_key.to_hex()));
        }
    }
    return Result<void>::ok();
}

// ============================================================================
// Provenance Chain
// ============================================================================

Result<ProvenanceRecord> ProvenanceChain::write_genesis(const std::string& principal,
                                                       const Signer& signer,
                                                       Timestamp timestamp) {
    if (!records_.empty()) {
        return Result<ProvenanceRecord>::err(Error(ErrorCode::SCOPE_EXISTS,
            "genesis already written"));
    }

    ProvenanceRecord genesis;
    genesis.index = 0;
    genesis.previous_hash = Digest::zero();
    genesis.action = ActionKind::Genesis;
    genesis.binary_hash = Digest::zero();
    genesis.tree_root = Digest::zero();
    genesis.identity_kind = IdentityKind::Unsigned;
    genesis.principal = principal;
    genesis.signer_key = signer.public_key();
    genesis.timestamp = timestamp;

    auto sig = signer.sign(genesis.signing_digest());
    if (sig.isErr()) {
        return Result<ProvenanceRecord>::err(Error(ErrorCode::SIGNING_FAILED,
            "cannot sign genesis: " + sig.error().message()));
    }
    genesis.signature = std::move(sig.value());

    records_.push_back(genesis);
    return Result<ProvenanceRecord>::ok(std::move(genesis));
}

Result<ProvenanceRecord> ProvenanceChain::prepare(const AppendInput& input,
                                                  const Signer& signer) const {
    if (records_.empty()) {
        return Result<ProvenanceRecord>::err(Error(ErrorCode::CHAIN_EMPTY,
            "cannot append before genesis"));
    }
    if (input.action == ActionKind::Genesis) {
        return Result<ProvenanceRecord>::err(Error(ErrorCode::SIGNING_FAILED,
            "genesis can only start a chain"));
    }

    ProvenanceRecord rec;
    rec.index = records_.size();
    rec.previous_hash = tip_hash();
    rec.action = input.action;
    rec.binary_hash = input.binary_hash;
    rec.replaced_hash = input.replaced_hash;
    rec.tree_root = input.tree_root;
    rec.identity_kind = input.identity_kind;
    rec.principal = input.principal;
    rec.signer_key = signer.public_key();
    rec.timestamp = input.timestamp;

    if (rec.signer_key.empty()) {
        return Result<ProvenanceRecord>::err(Error(ErrorCode::SIGNING_FAILED,
            "no signing key for " + input.principal));
    }

    auto sig = signer.sign(rec.signing_digest());
    if (sig.isErr()) {
        return Result<ProvenanceRecord>::err(Error(ErrorCode::SIGNING_FAILED,
            input.principal + ": " + sig.error().message()));
    }
    rec.signature = std::move(sig.value());
    return Result<ProvenanceRecord>::ok(std::move(rec));
}

Result<void> ProvenanceChain::commit(ProvenanceRecord record) {
    if (records_.empty() || record.index != records_.size() ||
        record.previous_hash != tip_hash()) {
        return Result<void>::err(Error(ErrorCode::TAMPER_DETECTED,
            "record " + std::to_string(record.index) + " does not follow chain tip"));
    }
    records_.push_back(std::move(record));
    return Result<void>::ok();
}

Result<ProvenanceRecord> ProvenanceChain::append(const AppendInput& input, const Signer& signer) {
    auto rec = prepare(input, signer);
    if (rec.isErr()) return rec;

    auto committed = commit(rec.value());
    if (committed.isErr()) {
        return Result<ProvenanceRecord>::err(committed.error());
    }
    return rec;
}

Result<void> ProvenanceChain::verify(const std::set<PublicKey>& authorized_keys) const {
    auto result = verify_records(records_, records_.size(), authorized_keys);
    if (result.isErr()) {
        spdlog::error("provenance chain verification failed: {}", result.error().toString());
    }
    return result;
}

Result<ProvenanceRecord> ProvenanceChain::tip() const {
    if (records_.empty()) {
        return Result<ProvenanceRecord>::err(Error(ErrorCode::CHAIN_EMPTY, "genesis not written"));
    }
    return Result<ProvenanceRecord>::ok(records_.back());
}

ProvenanceChain ProvenanceChain::from_records(std::vector<ProvenanceRecord> records) {
    ProvenanceChain chain;
    chain.records_ = std::move(records);
    return chain;
}

Digest ProvenanceChain::tip_hash() const {
    if (records_.empty()) return Digest::zero();
    return records_.back().hash();
}

} // namespace attest
