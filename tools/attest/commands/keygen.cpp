/**
 * attest CLI - keygen command
 *
 * Writes a PEM Ed25519 private key (mode 0600) and prints the raw public
 * key in the hex form used by trust_anchors and machine.public_key.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <filesystem>

namespace attest::cli::commands {

namespace {

struct KeygenOptions {
    std::string output;
    bool force = false;
};

int cmd_keygen(const GlobalOptions& opts, const KeygenOptions& kg_opts) {
    init_warning_collector(opts.json, opts.quiet);

    if (path_exists(kg_opts.output) && !kg_opts.force) {
        print_error(kg_opts.output + " already exists (use --force to overwrite)", opts.json);
        return EXIT_CODE_FAILURE;
    }

    auto key = PrivateKey::generate();
    if (key.isErr()) {
        return report_error(key.error(), opts.json);
    }
    auto pem = key.value().to_pem();
    if (pem.isErr()) {
        return report_error(pem.error(), opts.json);
    }

    auto written = atomic_write_file(kg_opts.output, pem.value());
    if (!written.ok) {
        print_error("failed to write " + kg_opts.output + ": " + written.error, opts.json, "IoError");
        return EXIT_CODE_FAILURE;
    }

    std::error_code ec;
    std::filesystem::permissions(kg_opts.output,
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        get_warning_collector().add("cannot restrict permissions of " + kg_opts.output + ": " +
                                    ec.message());
    }

    std::string public_hex = key.value().public_key().to_hex();
    if (opts.json) {
        nlohmann::json result;
        result["ok"] = true;
        result["path"] = kg_opts.output;
        result["public_key"] = public_hex;
        output_json(result);
    } else {
        print_success("Wrote " + kg_opts.output, opts.json);
        std::cout << "public key: " << public_hex << std::endl;
    }
    return EXIT_CODE_OK;
}

} // namespace

void setup_keygen(CLI::App* app, GlobalOptions& opts) {
    static KeygenOptions kg_opts;

    app->add_option("output", kg_opts.output, "PEM file to write")->required();
    app->add_flag("-f,--force", kg_opts.force, "Overwrite an existing file");

    app->callback([&opts]() { std::exit(cmd_keygen(opts, kg_opts)); });
}

} // namespace attest::cli::commands
