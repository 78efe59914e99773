#pragma once

#include "attest/crypto.hpp"
#include "attest/types.hpp"
#include "attest/verifier.hpp"

#include <optional>
#include <string>
#include <vector>

namespace attest {

// ============================================================================
// Core Configuration (attest.config.v1)
// ============================================================================
//
// {
//   "$schema": "attest.config.v1",
//   "machine": { "id": "m1", "private_key": "keys/machine.pem", "public_key": "<hex>" },
//   "trust_anchors": [ { "name": "vendor-root", "public_key": "<hex>" } ],
//   "capabilities": { "local": ["raw-device"] },
//   "scopes": [ { "name": "admin" }, { "name": "user", "parent": "admin",
//                 "authorized_signers": ["<hex>"] } ],
//   "state_root": "/var/lib/attest",
//   "log": { "level": "info" }
// }
//
// Relative paths are resolved against the directory of the config file.

struct ScopeConfig {
    std::string name;
    std::optional<std::string> parent;
    std::vector<PublicKey> authorized_signers;
};

struct CoreConfig {
    std::string schema;
    std::string source_path;

    std::string machine_id;
    std::string machine_private_key_path;  // empty = verify-only machine
    PublicKey machine_public_key;          // empty = derive from private key

    std::vector<TrustAnchor> trust_anchors;
    CapabilitySet local_capabilities;
    std::vector<ScopeConfig> scopes;

    std::string state_root;  // empty = in-memory
    std::string log_level = "info";
};

struct CoreConfigParseResult {
    bool ok = false;
    std::string error;
    CoreConfig config;
    std::vector<std::string> warnings;
};

CoreConfigParseResult parse_core_config_full(const std::string& json_str,
                                             const std::string& source_path = "");

// Read and parse a config file
CoreConfigParseResult load_core_config(const std::string& path);

// True for the level names spdlog understands
bool is_valid_log_level(const std::string& level);

// Set the default spdlog logger level from config
void apply_log_level(const CoreConfig& config);

} // namespace attest
