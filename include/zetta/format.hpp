#pragma once
/**
 * @file format.hpp
 * @brief Text and JSON renderings of packets and statistics for logs and the CLI.
 *
 * Text output is one line of `key=value` tokens so it can be grepped or
 * split by shell scripts:
 *
 *   type=1 name=MSG_PUBLISH len=2 payload=4142
 *   packets_sent=3 packets_received=2 crc_errors=0 frame_errors=1 ...
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "zetta/packet.hpp"
#include "zetta/stats.hpp"

namespace zetta {

/// @brief Uppercase hex, two digits per byte, no separators.
std::string to_hex(const uint8_t* data, size_t n);

/**
 * @brief Parse hex text into bytes.
 *
 * Accepts an optional "0x" prefix and ignores spaces, ':' and '-' between
 * bytes ("41 42", "41:42", "0x4142"). Rejects odd digit counts and non-hex.
 */
bool parse_hex(const std::string& text, std::vector<uint8_t>& out);

std::string    format_packet(const Packet& p);
std::string    format_stats(const StatsSnapshot& s);
nlohmann::json packet_to_json(const Packet& p);
nlohmann::json stats_to_json(const StatsSnapshot& s);

} // namespace zetta
