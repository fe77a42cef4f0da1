// ============================================================================
// format.cpp - implementation for format.hpp
// ============================================================================

#include "zetta/format.hpp"

#include <chrono>
#include <sstream>

namespace zetta {

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string to_hex(const uint8_t* data, size_t n) {
    static const char* DIGITS = "0123456789ABCDEF";
    std::string s;
    s.reserve(n * 2);
    for (size_t i = 0; i < n; ++i) {
        s.push_back(DIGITS[data[i] >> 4]);
        s.push_back(DIGITS[data[i] & 0x0F]);
    }
    return s;
}

bool parse_hex(const std::string& text, std::vector<uint8_t>& out) {
    out.clear();
    size_t i = 0;
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) i = 2;

    int hi = -1;                                   // pending high nibble
    for (; i < text.size(); ++i) {
        const char c = text[i];
        if (c == ' ' || c == ':' || c == '-') {
            if (hi >= 0) return false;             // separator splits a byte
            continue;
        }
        const int v = hex_value(c);
        if (v < 0) return false;
        if (hi < 0) { hi = v; continue; }
        out.push_back(static_cast<uint8_t>((hi << 4) | v));
        hi = -1;
    }
    return hi < 0;                                 // odd digit count is an error
}

std::string format_packet(const Packet& p) {
    std::ostringstream os;
    os << "type=" << static_cast<unsigned>(p.type)
       << " name=" << type_name(p.type)
       << " len=" << p.payload.size()
       << " payload=" << to_hex(p.payload.data(), p.payload.size());
    return os.str();
}

std::string format_stats(const StatsSnapshot& s) {
    std::ostringstream os;
    os << "packets_sent="      << s.packets_sent
       << " packets_received=" << s.packets_received
       << " crc_errors="       << s.crc_errors
       << " frame_errors="     << s.frame_errors
       << " bytes_received="   << s.bytes_received
       << " queue_overflows="  << s.queue_overflows
       << " resync_bytes="     << s.resync_bytes
       << " send_errors="      << s.send_errors;
    return os.str();
}

nlohmann::json packet_to_json(const Packet& p) {
    using namespace std::chrono;
    nlohmann::json j;
    j["type"]      = p.type;
    j["name"]      = type_name(p.type);
    j["len"]       = p.payload.size();
    j["payload"]   = to_hex(p.payload.data(), p.payload.size());
    j["raw"]       = to_hex(p.raw_frame.data(), p.raw_frame.size());
    j["timestamp_ms"] = duration_cast<milliseconds>(p.timestamp.time_since_epoch()).count();
    return j;
}

nlohmann::json stats_to_json(const StatsSnapshot& s) {
    nlohmann::json j;
    j["packets_sent"]     = s.packets_sent;
    j["packets_received"] = s.packets_received;
    j["crc_errors"]       = s.crc_errors;
    j["frame_errors"]     = s.frame_errors;
    j["bytes_received"]   = s.bytes_received;
    j["queue_overflows"]  = s.queue_overflows;
    j["resync_bytes"]     = s.resync_bytes;
    j["send_errors"]      = s.send_errors;
    return j;
}

} // namespace zetta
