/**
 * attest CLI - verify-chain and verify-proof commands
 *
 * Exit status 2 means the chain or proof failed an integrity check.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace attest::cli::commands {

namespace {

struct VerifyChainOptions {
    std::string scope;
};

struct VerifyProofOptions {
    std::string root;
    std::string hash;
    std::string proof_file;
};

int cmd_verify_chain(const GlobalOptions& opts, const VerifyChainOptions& vc_opts) {
    init_warning_collector(opts.json, opts.quiet);

    int exit_code = EXIT_CODE_OK;
    auto core = open_core(opts, exit_code);
    if (!core) return exit_code;

    auto& registry = core->registry();
    auto verified = registry.verify_chain(vc_opts.scope);
    if (verified.isErr()) {
        return report_error(verified.error(), opts.json);
    }

    auto snap = registry.snapshot(vc_opts.scope);
    if (snap.isErr()) {
        return report_error(snap.error(), opts.json);
    }

    if (opts.json) {
        nlohmann::json result;
        result["ok"] = true;
        result["scope"] = vc_opts.scope;
        result["records"] = snap.value().chain_length;
        result["root"] = snap.value().root.to_hex();
        output_json(result);
    } else {
        print_success("Chain of '" + vc_opts.scope + "' verified: " +
                      std::to_string(snap.value().chain_length) + " records", opts.json);
    }
    return EXIT_CODE_OK;
}

int cmd_verify_proof(const GlobalOptions& opts, const VerifyProofOptions& vp_opts) {
    init_warning_collector(opts.json, opts.quiet);

    auto root = Digest::from_hex(vp_opts.root);
    if (root.isErr()) {
        return report_error(root.error().withContext("root"), opts.json);
    }
    auto leaf = Digest::from_hex(vp_opts.hash);
    if (leaf.isErr()) {
        return report_error(leaf.error().withContext("hash"), opts.json);
    }

    auto content = read_file(vp_opts.proof_file);
    if (!content) {
        print_error("cannot read " + vp_opts.proof_file, opts.json, "IoError");
        return EXIT_CODE_FAILURE;
    }

    json::ParseResult<InclusionProof> proof;
    try {
        auto j = nlohmann::json::parse(*content);
        // Accept the output of `attest prove --json` as well as a bare proof
        proof = json::parse_proof(j.contains("proof") ? j["proof"] : j);
    } catch (const nlohmann::json::exception& e) {
        proof.error = e.what();
    }
    if (!proof.ok) {
        print_error(vp_opts.proof_file + ": " + proof.error, opts.json, "ParseError");
        return EXIT_CODE_FAILURE;
    }

    bool valid = verify_proof(root.value(), leaf.value(), proof.value);

    if (opts.json) {
        nlohmann::json result;
        result["ok"] = valid;
        result["root"] = root.value().to_hex();
        result["hash"] = leaf.value().to_hex();
        result["leaf_index"] = proof.value.leaf_index;
        output_json(result);
    } else if (valid) {
        print_success("Proof valid: " + vp_opts.hash + " is leaf " +
                      std::to_string(proof.value.leaf_index) + " of " + vp_opts.root, opts.json);
    } else {
        std::cerr << "Proof INVALID: treat " << vp_opts.hash << " as untrusted" << std::endl;
    }
    return valid ? EXIT_CODE_OK : EXIT_CODE_TAMPER;
}

} // namespace

void setup_verify_chain(CLI::App* app, GlobalOptions& opts) {
    static VerifyChainOptions vc_opts;

    app->add_option("scope", vc_opts.scope, "Scope name")->required();

    app->callback([&opts]() { std::exit(cmd_verify_chain(opts, vc_opts)); });
}

void setup_verify_proof(CLI::App* app, GlobalOptions& opts) {
    static VerifyProofOptions vp_opts;

    app->add_option("root", vp_opts.root, "Tree root (hex)")->required();
    app->add_option("hash", vp_opts.hash, "Binary hash (hex)")->required();
    app->add_option("proof", vp_opts.proof_file, "Proof JSON file")->required()->check(CLI::ExistingFile);

    app->callback([&opts]() { std::exit(cmd_verify_proof(opts, vp_opts)); });
}

} // namespace attest::cli::commands
