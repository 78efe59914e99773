#include "test_helpers.hpp"

#include <filesystem>
#include <stdexcept>

namespace attest::test {

namespace fs = std::filesystem;

Bytes to_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

std::shared_ptr<const PrivateKey> make_key() {
    auto key = PrivateKey::generate();
    if (key.isErr()) {
        throw std::runtime_error("key generation failed: " + key.error().toString());
    }
    return std::make_shared<const PrivateKey>(std::move(key.value()));
}

TempDir::TempDir() {
    path_ = (fs::temp_directory_path() / ("attest-test-" + generate_uuid())).string();
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

namespace {

Certificate issue(const PrivateKey& issuer_key, const std::string& issuer_name,
                  Certificate tbs) {
    auto cert = issue_certificate(issuer_key, issuer_name, std::move(tbs));
    if (cert.isErr()) {
        throw std::runtime_error("certificate issue failed: " + cert.error().toString());
    }
    return cert.value();
}

} // namespace

Pki make_pki(const CapabilitySet& leaf_capabilities, Timestamp not_before,
             Timestamp not_after, const std::string& leaf_subject) {
    Pki pki;
    pki.root_key = make_key();
    pki.intermediate_key = make_key();
    pki.leaf_key = make_key();
    pki.anchor = TrustAnchor{"vendor-root", pki.root_key->public_key()};

    Certificate intermediate;
    intermediate.subject = "vendor-intermediate";
    intermediate.subject_key = pki.intermediate_key->public_key();
    intermediate.not_before = not_before;
    intermediate.not_after = not_after;
    intermediate.capabilities = leaf_capabilities;
    intermediate.is_authority = true;
    intermediate = issue(*pki.root_key, "vendor-root", std::move(intermediate));

    Certificate leaf;
    leaf.subject = leaf_subject;
    leaf.subject_key = pki.leaf_key->public_key();
    leaf.not_before = not_before;
    leaf.not_after = not_after;
    leaf.capabilities = leaf_capabilities;
    leaf = issue(*pki.intermediate_key, "vendor-intermediate", std::move(leaf));

    pki.chain = {leaf, intermediate};
    return pki;
}

Binary entity_binary(const Pki& pki, const std::string& content, const std::string& scope,
                     const CapabilitySet& requested) {
    Binary binary = make_binary(to_bytes(content), scope, requested);
    auto signed_ok = sign_binary(binary, *pki.leaf_key, EntitySigned{pki.chain});
    if (signed_ok.isErr()) {
        throw std::runtime_error("signing failed: " + signed_ok.error().toString());
    }
    return binary;
}

Binary dev_binary(const PrivateKey& machine_key, const std::string& machine_id,
                  const std::string& content, const std::string& scope,
                  const CapabilitySet& requested) {
    Binary binary = make_binary(to_bytes(content), scope, requested);
    auto signed_ok = sign_binary(binary, machine_key, DevSigned{machine_id});
    if (signed_ok.isErr()) {
        throw std::runtime_error("signing failed: " + signed_ok.error().toString());
    }
    return binary;
}

MachineIdentity make_machine(const std::string& machine_id,
                             std::shared_ptr<const PrivateKey> key,
                             const CapabilitySet& local_capabilities) {
    MachineIdentity machine;
    machine.machine_id = machine_id;
    machine.public_key = key ? key->public_key() : PublicKey{};
    machine.private_key = std::move(key);
    machine.local_capabilities = local_capabilities;
    return machine;
}

} // namespace attest::test
