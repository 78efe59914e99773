/**
 * attest CLI - prove command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace attest::cli::commands {

namespace {

struct ProveOptions {
    std::string scope;
    std::string hash;
};

int cmd_prove(const GlobalOptions& opts, const ProveOptions& prove_opts) {
    init_warning_collector(opts.json, opts.quiet);

    auto leaf = Digest::from_hex(prove_opts.hash);
    if (leaf.isErr()) {
        return report_error(leaf.error(), opts.json);
    }

    int exit_code = EXIT_CODE_OK;
    auto core = open_core(opts, exit_code);
    if (!core) return exit_code;

    auto proof = core->registry().prove(prove_opts.scope, leaf.value());
    if (proof.isErr()) {
        return report_error(proof.error(), opts.json);
    }

    const auto& p = proof.value();
    if (opts.json) {
        nlohmann::json result;
        result["ok"] = true;
        result["scope"] = prove_opts.scope;
        result["root"] = p.root.to_hex();
        result["hash"] = leaf.value().to_hex();
        result["proof"] = json::proof_to_json(p.proof);
        output_json(result);
        return EXIT_CODE_OK;
    }

    std::cout << "root:  " << p.root.to_hex() << "\n"
              << "leaf:  " << p.proof.leaf_index << "\n"
              << "path:" << std::endl;
    for (const auto& step : p.proof.path) {
        std::cout << "  " << (step.sibling_is_left ? "L " : "R ") << step.sibling.to_hex()
                  << std::endl;
    }
    return EXIT_CODE_OK;
}

} // namespace

void setup_prove(CLI::App* app, GlobalOptions& opts) {
    static ProveOptions prove_opts;

    app->add_option("scope", prove_opts.scope, "Scope name")->required();
    app->add_option("hash", prove_opts.hash, "Binary hash (hex)")->required();

    app->callback([&opts]() { std::exit(cmd_prove(opts, prove_opts)); });
}

} // namespace attest::cli::commands
