/**
 * attest CLI - Common utilities and types
 */

#pragma once

#include <attest/attest.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace attest::cli {

// Exit codes
constexpr int EXIT_CODE_OK = 0;
constexpr int EXIT_CODE_FAILURE = 1;
constexpr int EXIT_CODE_TAMPER = 2;

inline std::string safe_getenv(const char* name) {
    const char* val = std::getenv(name);
    return val ? val : "";
}

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Resolve the config file path.
 * Priority: --config flag > ATTEST_CONFIG env > /etc/attest/config.json
 */
inline std::string resolve_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }

    std::string env_path = safe_getenv("ATTEST_CONFIG");
    if (!env_path.empty()) {
        return env_path;
    }

    return "/etc/attest/config.json";
}

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static thread_local WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode,
                        const std::string& code = "") {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        if (!code.empty()) {
            j["code"] = code;
        }
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

// Print an attest error and map it to an exit code
inline int report_error(const Error& error, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = error.message();
        j["code"] = error_code_to_string(error.code());
        if (error.atIndex()) {
            j["at_index"] = *error.atIndex();
        }
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << error.toString() << std::endl;
    }
    return error.code() == ErrorCode::TAMPER_DETECTED ? EXIT_CODE_TAMPER : EXIT_CODE_FAILURE;
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/**
 * Load the config and open the core read-only. Returns nullptr after
 * printing the error; `exit_code` receives the code to exit with.
 */
inline std::unique_ptr<Core> open_core(const GlobalOptions& opts, int& exit_code) {
    std::string path = resolve_config_path(opts.config);
    auto parsed = load_core_config(path);
    if (!parsed.ok) {
        print_error(path + ": " + parsed.error, opts.json, "ConfigInvalid");
        exit_code = EXIT_CODE_FAILURE;
        return nullptr;
    }
    for (const auto& w : parsed.warnings) {
        get_warning_collector().add(w);
    }

    apply_log_level(parsed.config);
    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    }

    auto core = Core::open(parsed.config, Core::Mode::ReadOnly);
    if (core.isErr()) {
        exit_code = report_error(core.error(), opts.json);
        return nullptr;
    }
    exit_code = EXIT_CODE_OK;
    return std::move(core.value());
}

inline nlohmann::json record_summary(const ProvenanceRecord& record) {
    auto j = json::record_to_json(record);
    j["hash"] = record.hash().to_hex();
    j["time"] = format_timestamp(record.timestamp);
    return j;
}

} // namespace attest::cli
