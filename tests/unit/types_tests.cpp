#include <doctest/doctest.h>
#include <attest/types.hpp>
#include <attest/result.hpp>

using namespace attest;

// ============================================================================
// Capability Sets
// ============================================================================

TEST_CASE("empty request is a subset of anything") {
    CHECK(is_capability_subset({}, {}));
    CHECK(is_capability_subset({}, {"raw-device"}));
}

TEST_CASE("capability subset requires every requested element") {
    CapabilitySet granted = {"net", "raw-device"};
    CHECK(is_capability_subset({"net"}, granted));
    CHECK(is_capability_subset({"net", "raw-device"}, granted));
    CHECK_FALSE(is_capability_subset({"net", "admin"}, granted));
    CHECK_FALSE(is_capability_subset({"raw-device"}, {}));
}

// ============================================================================
// Hex
// ============================================================================

TEST_CASE("bytes_to_hex is lowercase") {
    Bytes data = {0x00, 0xAB, 0xff, 0x10};
    CHECK(bytes_to_hex(data) == "00abff10");
}

TEST_CASE("hex_to_bytes accepts either case") {
    auto bytes = hex_to_bytes("00ABff10");
    REQUIRE(bytes.has_value());
    CHECK(*bytes == Bytes{0x00, 0xAB, 0xFF, 0x10});
}

TEST_CASE("hex_to_bytes rejects odd length and non-hex") {
    CHECK_FALSE(hex_to_bytes("abc").has_value());
    CHECK_FALSE(hex_to_bytes("zz").has_value());
    CHECK(hex_to_bytes("")->empty());
}

// ============================================================================
// Enums
// ============================================================================

TEST_CASE("parse_action_kind parses valid kinds") {
    CHECK(parse_action_kind("genesis") == ActionKind::Genesis);
    CHECK(parse_action_kind("install") == ActionKind::Install);
    CHECK(parse_action_kind("UPGRADE") == ActionKind::Upgrade);
    CHECK(parse_action_kind("Uninstall") == ActionKind::Uninstall);
    CHECK_FALSE(parse_action_kind("remove").has_value());
}

TEST_CASE("identity kind strings") {
    CHECK(std::string(identity_kind_to_string(IdentityKind::Unsigned)) == "unsigned");
    CHECK(std::string(identity_kind_to_string(IdentityKind::EntitySigned)) == "entity");
    CHECK(std::string(identity_kind_to_string(IdentityKind::DevSigned)) == "dev");
    CHECK(parse_identity_kind("dev") == IdentityKind::DevSigned);
    CHECK_FALSE(parse_identity_kind("root").has_value());
}

TEST_CASE("format_timestamp is RFC3339 UTC") {
    CHECK(format_timestamp(0) == "1970-01-01T00:00:00Z");
    CHECK(format_timestamp(1700000000) == "2023-11-14T22:13:20Z");
}

// ============================================================================
// Errors
// ============================================================================

TEST_CASE("tamper errors carry the failing index") {
    auto e = Error::tamper(3, "previous hash does not match predecessor");
    CHECK(e.code() == ErrorCode::TAMPER_DETECTED);
    REQUIRE(e.atIndex().has_value());
    CHECK(*e.atIndex() == 3);
    CHECK(e.toString() == "TamperDetected: previous hash does not match predecessor (at index 3)");
}

TEST_CASE("withContext prefixes the message") {
    Error e(ErrorCode::SCOPE_NOT_FOUND, "not found");
    e.withContext("scope 'user'");
    CHECK(e.message() == "scope 'user': not found");
    CHECK_FALSE(e.atIndex().has_value());
}
