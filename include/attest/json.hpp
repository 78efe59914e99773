/*
 * attest JSON - serialization for certificates, identities, provenance
 * records, tree snapshots and inclusion proofs.
 *
 * Requires nlohmann/json. Digests, keys and signatures are lowercase hex.
 */

#pragma once

#include "attest/certificate.hpp"
#include "attest/identity.hpp"
#include "attest/merkle_tree.hpp"
#include "attest/provenance_chain.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace attest {
namespace json {

using json = nlohmann::json;

// ============================================================================
// PARSE RESULTS
// ============================================================================

template<typename T>
struct ParseResult {
    bool ok = false;
    std::string error;
    T value;
};

// ============================================================================
// CERTIFICATES AND IDENTITIES
// ============================================================================

json certificate_to_json(const Certificate& cert);
ParseResult<Certificate> parse_certificate(const json& j);

json chain_to_json(const CertificateChain& chain);
ParseResult<CertificateChain> parse_certificate_chain(const json& j);

// null for unsigned, {"kind": "entity", "chain": [...]} or
// {"kind": "dev", "machine_id": "..."}
json identity_to_json(const std::optional<Identity>& identity);
ParseResult<std::optional<Identity>> parse_identity(const json& j);

// ============================================================================
// PROVENANCE RECORDS
// ============================================================================

json record_to_json(const ProvenanceRecord& record);
ParseResult<ProvenanceRecord> parse_record(const json& j);

// One record per line, as stored in chain.log
std::string record_to_line(const ProvenanceRecord& record);
ParseResult<ProvenanceRecord> parse_record_line(const std::string& line);

// ============================================================================
// TREE SNAPSHOTS AND PROOFS
// ============================================================================

json tree_snapshot_to_json(const TreeSnapshot& snapshot);
ParseResult<TreeSnapshot> parse_tree_snapshot(const std::string& json_str);

json proof_to_json(const InclusionProof& proof);
ParseResult<InclusionProof> parse_proof(const json& j);

} // namespace json
} // namespace attest
