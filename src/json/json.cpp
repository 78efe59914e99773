#include "attest/json.hpp"

namespace attest {
namespace json {

namespace {

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<std::int64_t> get_int(const json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_number_integer()) {
        return j[key].get<std::int64_t>();
    }
    return std::nullopt;
}

std::optional<Digest> get_digest(const json& j, const std::string& key) {
    auto hex = get_string(j, key);
    if (!hex) return std::nullopt;
    auto d = Digest::from_hex(*hex);
    if (d.isErr()) return std::nullopt;
    return d.value();
}

std::optional<PublicKey> get_public_key(const json& j, const std::string& key) {
    auto hex = get_string(j, key);
    if (!hex) return std::nullopt;
    auto k = PublicKey::from_hex(*hex);
    if (k.isErr()) return std::nullopt;
    return k.value();
}

std::optional<Bytes> get_hex_bytes(const json& j, const std::string& key) {
    auto hex = get_string(j, key);
    if (!hex) return std::nullopt;
    return hex_to_bytes(*hex);
}

std::optional<std::vector<Digest>> parse_digest_array(const json& j) {
    if (!j.is_array()) return std::nullopt;
    std::vector<Digest> out;
    out.reserve(j.size());
    for (const auto& elem : j) {
        if (!elem.is_string()) return std::nullopt;
        auto d = Digest::from_hex(elem.get<std::string>());
        if (d.isErr()) return std::nullopt;
        out.push_back(d.value());
    }
    return out;
}

json digest_array(const std::vector<Digest>& digests) {
    json arr = json::array();
    for (const auto& d : digests) {
        arr.push_back(d.to_hex());
    }
    return arr;
}

} // namespace

// ============================================================================
// CERTIFICATES
// ============================================================================

json certificate_to_json(const Certificate& cert) {
    json j;
    j["subject"] = cert.subject;
    j["issuer"] = cert.issuer;
    j["subject_key"] = cert.subject_key.to_hex();
    j["issuer_key"] = cert.issuer_key.to_hex();
    j["not_before"] = cert.not_before;
    j["not_after"] = cert.not_after;
    j["capabilities"] = json(std::vector<std::string>(cert.capabilities.begin(),
                                                      cert.capabilities.end()));
    j["is_authority"] = cert.is_authority;
    j["signature"] = bytes_to_hex(cert.signature);
    return j;
}

ParseResult<Certificate> parse_certificate(const json& j) {
    ParseResult<Certificate> result;

    if (!j.is_object()) {
        result.error = "certificate must be an object";
        return result;
    }

    auto& cert = result.value;
    auto subject = get_string(j, "subject");
    auto issuer = get_string(j, "issuer");
    if (!subject || !issuer) {
        result.error = "certificate subject/issuer missing";
        return result;
    }
    cert.subject = *subject;
    cert.issuer = *issuer;

    auto subject_key = get_public_key(j, "subject_key");
    auto issuer_key = get_public_key(j, "issuer_key");
    if (!subject_key || !issuer_key) {
        result.error = "certificate keys missing or malformed";
        return result;
    }
    cert.subject_key = *subject_key;
    cert.issuer_key = *issuer_key;

    auto not_before = get_int(j, "not_before");
    auto not_after = get_int(j, "not_after");
    if (!not_before || !not_after) {
        result.error = "certificate validity window missing";
        return result;
    }
    cert.not_before = *not_before;
    cert.not_after = *not_after;

    if (j.contains("capabilities") && j["capabilities"].is_array()) {
        for (const auto& cap : j["capabilities"]) {
            if (cap.is_string()) {
                cert.capabilities.insert(cap.get<std::string>());
            }
        }
    }

    if (j.contains("is_authority") && j["is_authority"].is_boolean()) {
        cert.is_authority = j["is_authority"].get<bool>();
    }

    auto sig = get_hex_bytes(j, "signature");
    if (!sig) {
        result.error = "certificate signature missing or malformed";
        return result;
    }
    cert.signature = std::move(*sig);

    result.ok = true;
    return result;
}

json chain_to_json(const CertificateChain& chain) {
    json arr = json::array();
    for (const auto& cert : chain) {
        arr.push_back(certificate_to_json(cert));
    }
    return arr;
}

ParseResult<CertificateChain> parse_certificate_chain(const json& j) {
    ParseResult<CertificateChain> result;
    if (!j.is_array()) {
        result.error = "certificate chain must be an array";
        return result;
    }
    for (std::size_t i = 0; i < j.size(); ++i) {
        auto cert = parse_certificate(j[i]);
        if (!cert.ok) {
            result.error = "chain[" + std::to_string(i) + "]: " + cert.error;
            return result;
        }
        result.value.push_back(std::move(cert.value));
    }
    result.ok = true;
    return result;
}

// ============================================================================
// IDENTITIES
// ============================================================================

json identity_to_json(const std::optional<Identity>& identity) {
    if (!identity) return nullptr;

    json j;
    if (const auto* entity = std::get_if<EntitySigned>(&*identity)) {
        j["kind"] = identity_kind_to_string(IdentityKind::EntitySigned);
        j["chain"] = chain_to_json(entity->certificate_chain);
    } else {
        j["kind"] = identity_kind_to_string(IdentityKind::DevSigned);
        j["machine_id"] = std::get<DevSigned>(*identity).machine_id;
    }
    return j;
}

ParseResult<std::optional<Identity>> parse_identity(const json& j) {
    ParseResult<std::optional<Identity>> result;

    if (j.is_null()) {
        result.ok = true;
        return result;
    }
    if (!j.is_object()) {
        result.error = "identity must be an object or null";
        return result;
    }

    auto kind_str = get_string(j, "kind");
    auto kind = kind_str ? parse_identity_kind(*kind_str) : std::nullopt;
    if (!kind) {
        result.error = "identity kind missing or unknown";
        return result;
    }

    switch (*kind) {
        case IdentityKind::Unsigned:
            break;
        case IdentityKind::EntitySigned: {
            if (!j.contains("chain")) {
                result.error = "entity identity requires chain";
                return result;
            }
            auto chain = parse_certificate_chain(j["chain"]);
            if (!chain.ok) {
                result.error = chain.error;
                return result;
            }
            result.value = Identity{EntitySigned{std::move(chain.value)}};
            break;
        }
        case IdentityKind::DevSigned: {
            auto machine = get_string(j, "machine_id");
            if (!machine || machine->empty()) {
                result.error = "dev identity requires machine_id";
                return result;
            }
            result.value = Identity{DevSigned{*machine}};
            break;
        }
    }

    result.ok = true;
    return result;
}

// ============================================================================
// PROVENANCE RECORDS
// ============================================================================

json record_to_json(const ProvenanceRecord& record) {
    json j;
    j["index"] = record.index;
    j["previous_hash"] = record.previous_hash.to_hex();
    j["action"] = action_kind_to_string(record.action);
    j["binary_hash"] = record.binary_hash.to_hex();
    if (record.replaced_hash) {
        j["replaced_hash"] = record.replaced_hash->to_hex();
    }
    j["tree_root"] = record.tree_root.to_hex();
    j["identity"] = identity_kind_to_string(record.identity_kind);
    j["principal"] = record.principal;
    j["signer_key"] = record.signer_key.to_hex();
    j["timestamp"] = record.timestamp;
    j["signature"] = bytes_to_hex(record.signature);
    return j;
}

ParseResult<ProvenanceRecord> parse_record(const json& j) {
    ParseResult<ProvenanceRecord> result;

    if (!j.is_object()) {
        result.error = "record must be an object";
        return result;
    }

    auto& rec = result.value;

    auto index = get_int(j, "index");
    if (!index || *index < 0) {
        result.error = "record index missing";
        return result;
    }
    rec.index = static_cast<std::uint64_t>(*index);

    auto prev = get_digest(j, "previous_hash");
    auto bin = get_digest(j, "binary_hash");
    auto root = get_digest(j, "tree_root");
    if (!prev || !bin || !root) {
        result.error = "record digests missing or malformed";
        return result;
    }
    rec.previous_hash = *prev;
    rec.binary_hash = *bin;
    rec.tree_root = *root;

    auto action_str = get_string(j, "action");
    auto action = action_str ? parse_action_kind(*action_str) : std::nullopt;
    if (!action) {
        result.error = "record action missing or unknown";
        return result;
    }
    rec.action = *action;

    if (j.contains("replaced_hash")) {
        auto replaced = get_digest(j, "replaced_hash");
        if (!replaced) {
            result.error = "record replaced_hash malformed";
            return result;
        }
        rec.replaced_hash = *replaced;
    }
    if ((rec.action == ActionKind::Upgrade) != rec.replaced_hash.has_value()) {
        result.error = rec.replaced_hash ? "replaced_hash only belongs on upgrade records"
                                         : "upgrade record replaced_hash missing";
        return result;
    }

    auto identity_str = get_string(j, "identity");
    auto identity = identity_str ? parse_identity_kind(*identity_str) : std::nullopt;
    if (!identity) {
        result.error = "record identity kind missing or unknown";
        return result;
    }
    rec.identity_kind = *identity;

    if (auto principal = get_string(j, "principal")) {
        rec.principal = *principal;
    }

    auto signer = get_public_key(j, "signer_key");
    if (!signer) {
        result.error = "record signer_key missing or malformed";
        return result;
    }
    rec.signer_key = *signer;

    auto ts = get_int(j, "timestamp");
    if (!ts) {
        result.error = "record timestamp missing";
        return result;
    }
    rec.timestamp = *ts;

    auto sig = get_hex_bytes(j, "signature");
    if (!sig) {
        result.error = "record signature missing or malformed";
        return result;
    }
    rec.signature = std::move(*sig);

    result.ok = true;
    return result;
}

std::string record_to_line(const ProvenanceRecord& record) {
    return record_to_json(record).dump();
}

ParseResult<ProvenanceRecord> parse_record_line(const std::string& line) {
    try {
        return parse_record(json::parse(line));
    } catch (const json::exception& e) {
        ParseResult<ProvenanceRecord> result;
        result.error = std::string("parse error: ") + e.what();
        return result;
    }
}

// ============================================================================
// TREE SNAPSHOTS AND PROOFS
// ============================================================================

json tree_snapshot_to_json(const TreeSnapshot& snapshot) {
    json j;
    j["$schema"] = "attest.tree.v1";
    j["leaves"] = digest_array(snapshot.leaves);
    json levels = json::array();
    for (const auto& level : snapshot.levels) {
        levels.push_back(digest_array(level));
    }
    j["levels"] = levels;
    return j;
}

ParseResult<TreeSnapshot> parse_tree_snapshot(const std::string& json_str) {
    ParseResult<TreeSnapshot> result;

    try {
        auto j = json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }
        if (get_string(j, "$schema").value_or("") != "attest.tree.v1") {
            result.error = "$schema mismatch: expected attest.tree.v1";
            return result;
        }

        if (!j.contains("leaves")) {
            result.error = "leaves missing";
            return result;
        }
        auto leaves = parse_digest_array(j["leaves"]);
        if (!leaves) {
            result.error = "leaves malformed";
            return result;
        }
        result.value.leaves = std::move(*leaves);

        if (j.contains("levels") && j["levels"].is_array()) {
            for (const auto& level : j["levels"]) {
                auto digests = parse_digest_array(level);
                if (!digests) {
                    result.error = "levels malformed";
                    return result;
                }
                result.value.levels.push_back(std::move(*digests));
            }
        }

        result.ok = true;
        return result;

    } catch (const json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

json proof_to_json(const InclusionProof& proof) {
    json j;
    j["leaf_index"] = proof.leaf_index;
    json path = json::array();
    for (const auto& step : proof.path) {
        path.push_back({{"sibling", step.sibling.to_hex()},
                        {"side", step.sibling_is_left ? "left" : "right"}});
    }
    j["path"] = path;
    return j;
}

ParseResult<InclusionProof> parse_proof(const json& j) {
    ParseResult<InclusionProof> result;

    if (!j.is_object()) {
        result.error = "proof must be an object";
        return result;
    }
    auto index = get_int(j, "leaf_index");
    if (!index || *index < 0) {
        result.error = "proof leaf_index missing";
        return result;
    }
    result.value.leaf_index = static_cast<std::uint64_t>(*index);

    if (!j.contains("path") || !j["path"].is_array()) {
        result.error = "proof path missing";
        return result;
    }
    for (const auto& step_json : j["path"]) {
        auto sibling = get_digest(step_json, "sibling");
        auto side = get_string(step_json, "side");
        if (!sibling || !side || (*side != "left" && *side != "right")) {
            result.error = "proof step malformed";
            return result;
        }
        result.value.path.push_back(ProofStep{*sibling, *side == "left"});
    }

    result.ok = true;
    return result;
}

} // namespace json
} // namespace attest
