#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace attest {

// ============================================================================
// Common Aliases
// ============================================================================

using Bytes = std::vector<std::uint8_t>;

// Seconds since the Unix epoch
using Timestamp = std::int64_t;

// Capabilities are opaque privilege names. Ordered so that encodings of a
// set are deterministic.
using CapabilitySet = std::set<std::string>;

// True if every element of `requested` is present in `granted`
bool is_capability_subset(const CapabilitySet& requested, const CapabilitySet& granted);

// Lowercase hex encoding / decoding
std::string bytes_to_hex(const std::uint8_t* data, std::size_t len);
std::string bytes_to_hex(const Bytes& data);
std::optional<Bytes> hex_to_bytes(const std::string& hex);

// ============================================================================
// Action Kind
// ============================================================================

enum class ActionKind {
    Genesis,
    Install,
    Upgrade,
    Uninstall
};

inline const char* action_kind_to_string(ActionKind a) {
    switch (a) {
        case ActionKind::Genesis: return "genesis";
        case ActionKind::Install: return "install";
        case ActionKind::Upgrade: return "upgrade";
        case ActionKind::Uninstall: return "uninstall";
        default: return "install";
    }
}

std::optional<ActionKind> parse_action_kind(const std::string& s);

// ============================================================================
// Identity Kind
// ============================================================================

enum class IdentityKind {
    Unsigned,
    EntitySigned,
    DevSigned
};

inline const char* identity_kind_to_string(IdentityKind k) {
    switch (k) {
        case IdentityKind::Unsigned: return "unsigned";
        case IdentityKind::EntitySigned: return "entity";
        case IdentityKind::DevSigned: return "dev";
        default: return "unsigned";
    }
}

std::optional<IdentityKind> parse_identity_kind(const std::string& s);

// Current wall-clock time in seconds
Timestamp now_seconds();

// Format a timestamp as RFC3339 (UTC)
std::string format_timestamp(Timestamp t);

} // namespace attest
