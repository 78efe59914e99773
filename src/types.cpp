#include "attest/types.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>

namespace attest {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

bool is_capability_subset(const CapabilitySet& requested, const CapabilitySet& granted) {
    return std::includes(granted.begin(), granted.end(), requested.begin(), requested.end());
}

std::string bytes_to_hex(const std::uint8_t* data, std::size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

std::string bytes_to_hex(const Bytes& data) {
    return bytes_to_hex(data.data(), data.size());
}

std::optional<Bytes> hex_to_bytes(const std::string& hex) {
    if (hex.size() % 2 != 0) return std::nullopt;
    Bytes out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::optional<ActionKind> parse_action_kind(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "genesis") return ActionKind::Genesis;
    if (lower == "install") return ActionKind::Install;
    if (lower == "upgrade") return ActionKind::Upgrade;
    if (lower == "uninstall") return ActionKind::Uninstall;
    return std::nullopt;
}

std::optional<IdentityKind> parse_identity_kind(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "unsigned") return IdentityKind::Unsigned;
    if (lower == "entity") return IdentityKind::EntitySigned;
    if (lower == "dev") return IdentityKind::DevSigned;
    return std::nullopt;
}

Timestamp now_seconds() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

std::string format_timestamp(Timestamp t) {
    std::time_t tt = static_cast<std::time_t>(t);
    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &tt);
#else
    gmtime_r(&tt, &tm_buf);
#endif
    char buffer[64];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return std::string(buffer);
}

} // namespace attest
