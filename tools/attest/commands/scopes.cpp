/**
 * attest CLI - scopes and tip commands
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace attest::cli::commands {

namespace {

struct TipOptions {
    std::string scope;
};

int cmd_scopes(const GlobalOptions& opts) {
    init_warning_collector(opts.json, opts.quiet);

    int exit_code = EXIT_CODE_OK;
    auto core = open_core(opts, exit_code);
    if (!core) return exit_code;

    auto& registry = core->registry();

    nlohmann::json result;
    result["ok"] = true;
    result["scopes"] = nlohmann::json::array();
    for (const auto& name : registry.list_scopes()) {
        auto scope = registry.find(name);
        if (scope.isErr()) continue;
        auto snap = scope.value()->snapshot();

        nlohmann::json entry;
        entry["name"] = name;
        entry["parent"] = scope.value()->parent() ? nlohmann::json(*scope.value()->parent())
                                                  : nlohmann::json(nullptr);
        entry["root"] = snap->root.to_hex();
        entry["records"] = snap->chain_length;
        result["scopes"].push_back(entry);
    }

    if (opts.json) {
        output_json(result);
        return EXIT_CODE_OK;
    }

    if (result["scopes"].empty()) {
        print_success("No scopes", opts.json);
        return EXIT_CODE_OK;
    }
    for (const auto& entry : result["scopes"]) {
        std::cout << entry["name"].get<std::string>();
        if (entry["parent"].is_string()) {
            std::cout << " (parent: " << entry["parent"].get<std::string>() << ")";
        }
        std::cout << "\n  root:    " << entry["root"].get<std::string>()
                  << "\n  records: " << entry["records"].get<std::uint64_t>() << std::endl;
    }
    return EXIT_CODE_OK;
}

int cmd_tip(const GlobalOptions& opts, const TipOptions& tip_opts) {
    init_warning_collector(opts.json, opts.quiet);

    int exit_code = EXIT_CODE_OK;
    auto core = open_core(opts, exit_code);
    if (!core) return exit_code;

    auto snap = core->registry().snapshot(tip_opts.scope);
    if (snap.isErr()) {
        return report_error(snap.error(), opts.json);
    }
    if (snap.value().chain_length == 0) {
        return report_error(Error(ErrorCode::CHAIN_EMPTY,
            "scope '" + tip_opts.scope + "' has no genesis record"), opts.json);
    }

    const auto& tip = snap.value().tip;
    if (opts.json) {
        nlohmann::json result;
        result["ok"] = true;
        result["scope"] = tip_opts.scope;
        result["root"] = snap.value().root.to_hex();
        result["tip"] = record_summary(tip);
        output_json(result);
        return EXIT_CODE_OK;
    }

    std::cout << "scope:     " << tip_opts.scope << "\n"
              << "root:      " << snap.value().root.to_hex() << "\n"
              << "record:    #" << tip.index << " " << action_kind_to_string(tip.action) << "\n"
              << "binary:    " << tip.binary_hash.to_hex() << "\n";
    if (tip.replaced_hash) {
        std::cout << "replaces:  " << tip.replaced_hash->to_hex() << "\n";
    }
    std::cout << "principal: " << tip.principal << "\n"
              << "time:      " << format_timestamp(tip.timestamp) << "\n"
              << "hash:      " << tip.hash().to_hex() << std::endl;
    return EXIT_CODE_OK;
}

} // namespace

void setup_scopes(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() { std::exit(cmd_scopes(opts)); });
}

void setup_tip(CLI::App* app, GlobalOptions& opts) {
    static TipOptions tip_opts;

    app->add_option("scope", tip_opts.scope, "Scope name")->required();

    app->callback([&opts]() { std::exit(cmd_tip(opts, tip_opts)); });
}

} // namespace attest::cli::commands
