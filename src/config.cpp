// ============================================================================
// config.cpp - implementation for config.hpp
// For the file format see the matching .hpp. For usage, check tests/test_config.cpp.
// ============================================================================

#include "zetta/config.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace zetta {

// ---------------------------------------------------------------------------
// read_int()
// ----------
// Pull an optional integer key out of `j` into `out`.
// Returns false (with a reason) if the key exists but is not an integer
// or falls below `min_value`.
// ---------------------------------------------------------------------------
static bool read_int(const json& j, const char* key, int min_value, int& out, std::string& err) {
    if (!j.contains(key)) return true;                       // optional
    const json& v = j.at(key);
    if (!v.is_number_integer()) {
        err = std::string("config key '") + key + "' must be an integer";
        return false;
    }
    const long long n = v.get<long long>();
    if (n < min_value || n > 10000000) {
        err = std::string("config key '") + key + "' out of range";
        return false;
    }
    out = static_cast<int>(n);
    return true;
}

bool parse_config(const std::string& text, LinkConfig& cfg, std::string& err) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        err = std::string("config is not valid JSON: ") + e.what();
        return false;
    }
    if (!j.is_object()) {
        err = "config must be a JSON object";
        return false;
    }

    LinkConfig next = cfg;                                   // apply all-or-nothing
    if (j.contains("dev")) {
        if (!j["dev"].is_string()) { err = "config key 'dev' must be a string"; return false; }
        next.dev = j["dev"].get<std::string>();
    }
    if (!read_int(j, "baud", 1, next.baud, err))                   return false;
    if (!read_int(j, "timeout_ms", 0, next.timeout_ms, err))       return false;
    if (!read_int(j, "boot_delay_ms", 0, next.boot_delay_ms, err)) return false;

    cfg = next;
    return true;
}

bool load_config(const std::string& path, LinkConfig& cfg, std::string& err) {
    std::ifstream in(path);
    if (!in) {
        err = "cannot open config file " + path;
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_config(ss.str(), cfg, err);
}

transport::Config to_transport_config(const LinkConfig& cfg) {
    transport::Config tc;
    tc.path          = cfg.dev;
    tc.baud          = cfg.baud;
    tc.timeout_ms    = cfg.timeout_ms;
    tc.boot_delay_ms = cfg.boot_delay_ms;
    return tc;
}

} // namespace zetta
