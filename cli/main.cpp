/**
 * @file main.cpp
 * @brief zetta-cli - Linux front end for a Zetta serial link.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11); overlay them on an optional JSON config file.
 *  - Open the serial port, start a zetta::Protocol on it.
 *  - Send raw frames (--send TYPE HEX) and text frames (--send-text TYPE TEXT).
 *  - Listen for a while (--listen MS) and print every packet received.
 *  - Print link statistics (--stats).
 *
 * Output is `key=value` lines (pretty) or one JSON object per line (json),
 * so it can be piped into scripts. Errors go to stderr as
 * `status=error reason=...`.
 *
 * Exit codes: 0 ok, 1 open failed, 2 usage/config error, 3 send failed.
 */

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "zetta/codecs.hpp"
#include "zetta/config.hpp"
#include "zetta/format.hpp"
#include "zetta/protocol.hpp"
#include "zetta/transport/transport_linux_serial.hpp"

using namespace zetta;

static void print_packet(Protocol& link, const Packet& p, bool as_json) {
  Value v = link.process_packet(p);
  const std::string* text = std::any_cast<std::string>(&v);

  if (as_json) {
    nlohmann::json j = packet_to_json(p);
    if (text) j["text"] = *text;
    std::cout << j.dump() << "\n";
  } else {
    std::cout << format_packet(p);
    if (text) std::cout << " text=" << *text;
    std::cout << "\n";
  }
}

int main(int argc, char** argv) {
  CLI::App app{"Zetta link CLI"};

  // ---- device / io settings ----
  LinkConfig cli_cfg;
  std::string config_path;
  app.add_option("--config", config_path, "JSON file with dev/baud/timeout_ms/boot_delay_ms");
  CLI::Option* opt_dev   = app.add_option("--dev", cli_cfg.dev, "Serial device (e.g. /dev/serial/by-id/...)");
  CLI::Option* opt_baud  = app.add_option("--baud", cli_cfg.baud, "Baud rate (default 115200)");
  CLI::Option* opt_to    = app.add_option("--timeout", cli_cfg.timeout_ms, "Write timeout (ms)");
  CLI::Option* opt_boot  = app.add_option("--boot-delay", cli_cfg.boot_delay_ms, "Delay after open (ms) to let USB reset");

  // ---- commands ----
  std::vector<std::pair<int, std::string>> raw_sends;   // --send <type> <hex>
  std::vector<std::pair<int, std::string>> text_sends;  // --send-text <type> <text>
  int listen_ms = 0;
  bool show_stats = false;
  std::string format = "pretty";

  app.add_option("--send", raw_sends, "Send raw payload: --send <type> <hex> (repeatable)");
  app.add_option("--send-text", text_sends, "Send text payload: --send-text <type> <text> (repeatable)");
  app.add_option("--listen", listen_ms, "Print received packets for this many ms")
      ->check(CLI::NonNegativeNumber);
  app.add_flag("--stats", show_stats, "Print link statistics before exit");
  app.add_option("--format", format, "Output format: pretty|json")
      ->check(CLI::IsMember({"pretty", "json"}));

  CLI11_PARSE(app, argc, argv);

  if (raw_sends.empty() && text_sends.empty() && listen_ms == 0 && !show_stats) {
    std::cerr << "status=error reason=need_command (use --send, --send-text, --listen or --stats)\n";
    return 2;
  }

  // -------- config: file first, explicit flags win --------
  LinkConfig cfg;
  if (!config_path.empty()) {
    std::string err;
    if (!load_config(config_path, cfg, err)) {
      std::cerr << "status=error reason=config detail=" << err << "\n";
      return 2;
    }
  }
  if (opt_dev->count()  > 0) cfg.dev           = cli_cfg.dev;
  if (opt_baud->count() > 0) cfg.baud          = cli_cfg.baud;
  if (opt_to->count()   > 0) cfg.timeout_ms    = cli_cfg.timeout_ms;
  if (opt_boot->count() > 0) cfg.boot_delay_ms = cli_cfg.boot_delay_ms;

  // -------- validate sends before touching the port --------
  std::vector<std::pair<uint8_t, Bytes>> raw_payloads;
  for (const auto& s : raw_sends) {
    Bytes payload;
    if (s.first < 0 || s.first > 255) {
      std::cerr << "status=error reason=bad_type type=" << s.first << "\n";
      return 2;
    }
    if (!parse_hex(s.second, payload)) {
      std::cerr << "status=error reason=bad_hex value=" << s.second << "\n";
      return 2;
    }
    raw_payloads.emplace_back(static_cast<uint8_t>(s.first), std::move(payload));
  }
  for (const auto& s : text_sends) {
    if (s.first < 0 || s.first > 255) {
      std::cerr << "status=error reason=bad_type type=" << s.first << "\n";
      return 2;
    }
  }

  // -------- open port + start link --------
  auto port = std::make_shared<transport::LinuxSerial>();
  if (!port->begin(to_transport_config(cfg))) {
    std::cerr << "status=error reason=open_failed dev=" << cfg.dev << "\n";
    return 1;
  }

  Protocol link(port);

  // Text types get a string codec both ways so received replies print as text too.
  std::set<uint8_t> text_types;
  for (const auto& s : text_sends) text_types.insert(static_cast<uint8_t>(s.first));
  for (uint8_t t : text_types) {
    link.register_handler(t, make_string_parser(), make_string_builder());
  }

  if (!link.start()) {
    std::cerr << "status=error reason=start_failed dev=" << cfg.dev << "\n";
    return 1;
  }

  const bool as_json = (format == "json");
  int rc = 0;

  for (const auto& s : raw_payloads) {
    if (!link.send_raw(s.first, s.second)) rc = 3;
  }
  for (const auto& s : text_sends) {
    if (!link.send(static_cast<uint8_t>(s.first), s.second)) rc = 3;
  }

  // -------- listen --------
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + std::chrono::milliseconds(listen_ms);
  while (clock::now() < deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
    if (left.count() <= 0) break;
    if (auto p = link.get_packet(left)) print_packet(link, *p, as_json);
  }

  link.stop();
  if (listen_ms > 0) {
    while (auto p = link.get_packet(std::chrono::milliseconds(0))) print_packet(link, *p, as_json);
  }

  if (show_stats) {
    const StatsSnapshot st = link.get_stats();
    if (as_json) std::cout << stats_to_json(st).dump() << "\n";
    else         std::cout << format_stats(st) << "\n";
  }

  return rc;
}
