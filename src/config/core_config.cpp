#include "attest/config.hpp"

#include "attest/platform.hpp"
#include "attest/scope.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace attest {

namespace {

constexpr const char* CONFIG_SCHEMA = "attest.config.v1";

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Helper to safely get a string array from JSON
std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

std::string resolve_path(const std::string& path, const std::string& source_path) {
    if (path.empty() || source_path.empty()) return path;
    std::filesystem::path p(path);
    if (p.is_absolute()) return path;
    std::string base = get_parent_directory(source_path);
    return base.empty() ? path : join_path(base, path);
}

} // namespace

bool is_valid_log_level(const std::string& level) {
    static const std::set<std::string> levels = {
        "trace", "debug", "info", "warn", "warning", "err", "error", "critical", "off"
    };
    return levels.count(level) != 0;
}

void apply_log_level(const CoreConfig& config) {
    spdlog::set_level(spdlog::level::from_str(config.log_level));
}

CoreConfigParseResult parse_core_config_full(const std::string& json_str,
                                             const std::string& source_path) {
    CoreConfigParseResult result;
    auto& config = result.config;
    config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            config.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }
        if (config.schema != CONFIG_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + CONFIG_SCHEMA;
            return result;
        }

        // "machine" section (REQUIRED)
        if (!j.contains("machine") || !j["machine"].is_object()) {
            result.error = "machine section missing";
            return result;
        }
        const auto& machine = j["machine"];
        config.machine_id = trim(get_string(machine, "id").value_or(""));
        if (config.machine_id.empty()) {
            result.error = "machine.id missing";
            return result;
        }
        if (auto key_path = get_string(machine, "private_key")) {
            config.machine_private_key_path = resolve_path(trim(*key_path), source_path);
        }
        if (auto pub = get_string(machine, "public_key")) {
            auto key = PublicKey::from_hex(trim(*pub));
            if (key.isErr()) {
                result.error = "machine.public_key: " + key.error().message();
                return result;
            }
            config.machine_public_key = key.value();
        }
        if (config.machine_private_key_path.empty() && config.machine_public_key.empty()) {
            result.warnings.push_back("invalid_configuration:machine_key_missing");
        }

        // "trust_anchors" section
        if (j.contains("trust_anchors") && j["trust_anchors"].is_array()) {
            for (const auto& anchor : j["trust_anchors"]) {
                TrustAnchor ta;
                ta.name = get_string(anchor, "name").value_or("");
                auto key = PublicKey::from_hex(trim(get_string(anchor, "public_key").value_or("")));
                if (key.isErr()) {
                    result.error = "trust anchor '" + ta.name + "': " + key.error().message();
                    return result;
                }
                ta.public_key = key.value();
                config.trust_anchors.push_back(std::move(ta));
            }
        }

        // "capabilities" section
        if (j.contains("capabilities") && j["capabilities"].is_object()) {
            for (const auto& cap : get_string_array(j["capabilities"], "local")) {
                config.local_capabilities.insert(trim(cap));
            }
        }

        // "scopes" section; parents must be declared first
        if (j.contains("scopes") && j["scopes"].is_array()) {
            std::set<std::string> declared;
            for (const auto& entry : j["scopes"]) {
                ScopeConfig scope;
                scope.name = trim(get_string(entry, "name").value_or(""));
                if (!is_valid_scope_name(scope.name)) {
                    result.error = "invalid scope name '" + scope.name + "'";
                    return result;
                }
                if (!declared.insert(scope.name).second) {
                    result.error = "scope '" + scope.name + "' declared twice";
                    return result;
                }
                if (auto parent = get_string(entry, "parent")) {
                    if (declared.count(*parent) == 0 || *parent == scope.name) {
                        result.error = "scope '" + scope.name + "': parent '" + *parent +
                                       "' must be declared before it";
                        return result;
                    }
                    scope.parent = *parent;
                }
                for (const auto& hex : get_string_array(entry, "authorized_signers")) {
                    auto key = PublicKey::from_hex(trim(hex));
                    if (key.isErr()) {
                        result.error = "scope '" + scope.name + "' authorized signer: " +
                                       key.error().message();
                        return result;
                    }
                    scope.authorized_signers.push_back(key.value());
                }
                config.scopes.push_back(std::move(scope));
            }
        }

        // "state_root"
        if (auto root = get_string(j, "state_root")) {
            config.state_root = resolve_path(trim(*root), source_path);
        }

        // "log" section
        if (j.contains("log") && j["log"].is_object()) {
            if (auto level = get_string(j["log"], "level")) {
                std::string lvl = to_lower(trim(*level));
                if (is_valid_log_level(lvl)) {
                    config.log_level = lvl;
                } else {
                    result.warnings.push_back("invalid_configuration:invalid_log_level");
                    config.log_level = "info";
                }
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

CoreConfigParseResult load_core_config(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        CoreConfigParseResult result;
        result.error = "cannot read config file: " + path;
        return result;
    }
    return parse_core_config_full(*content, path);
}

} // namespace attest
