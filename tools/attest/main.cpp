/**
 * attest CLI - Entry Point
 *
 * Read-only auditor for trust scopes: chain tips, chain verification and
 * inclusion proofs.
 */

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "common.hpp"

#ifndef ATTEST_VERSION
#define ATTEST_VERSION "0.0.0"
#endif

// Forward declarations for commands
namespace attest::cli::commands {
    void setup_scopes(CLI::App* app, GlobalOptions& opts);
    void setup_tip(CLI::App* app, GlobalOptions& opts);
    void setup_verify_chain(CLI::App* app, GlobalOptions& opts);
    void setup_prove(CLI::App* app, GlobalOptions& opts);
    void setup_verify_proof(CLI::App* app, GlobalOptions& opts);
    void setup_keygen(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace attest::cli;

    // Keep stdout for command output
    spdlog::set_default_logger(spdlog::stderr_color_mt("attest"));

    CLI::App app{"attest - binary provenance auditor"};
    app.set_version_flag("-V,--version", ATTEST_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("-c,--config", opts.config, "Config file (default: $ATTEST_CONFIG)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* scopes_cmd = app.add_subcommand("scopes", "List trust scopes");
    commands::setup_scopes(scopes_cmd, opts);

    auto* tip_cmd = app.add_subcommand("tip", "Show the chain tip and root of a scope");
    commands::setup_tip(tip_cmd, opts);

    auto* verify_chain_cmd = app.add_subcommand("verify-chain", "Verify a scope's provenance chain");
    commands::setup_verify_chain(verify_chain_cmd, opts);

    auto* prove_cmd = app.add_subcommand("prove", "Produce an inclusion proof for a binary");
    commands::setup_prove(prove_cmd, opts);

    auto* verify_proof_cmd = app.add_subcommand("verify-proof", "Check an inclusion proof against a root");
    commands::setup_verify_proof(verify_proof_cmd, opts);

    auto* keygen_cmd = app.add_subcommand("keygen", "Generate an Ed25519 private key");
    commands::setup_keygen(keygen_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
