#pragma once
/**
 * @file config.hpp
 * @brief Link settings: serial device, baud, timeouts; loadable from a small JSON file.
 *
 * A config file is optional. When present it is a flat JSON object; every key
 * is optional and unknown keys are ignored so one file can be shared with
 * other tools:
 *
 * @code
 *   {
 *     "dev": "/dev/serial/by-id/usb-STM32_Virtual_ComPort-if00",
 *     "baud": 115200,
 *     "timeout_ms": 100,
 *     "boot_delay_ms": 400
 *   }
 * @endcode
 *
 * A key with the wrong type or an out-of-range number is an error; the config
 * is left untouched in that case so a half-applied file never happens.
 */

#include <string>

#include "zetta/transport/transport_base.hpp"

namespace zetta {

struct LinkConfig {
  std::string dev{"/dev/ttyACM0"};  ///< Serial device path
  int baud{115200};                 ///< Line rate
  int timeout_ms{100};              ///< Transport write timeout
  int boot_delay_ms{400};           ///< Settle time after open (USB CDC reset)
};

/**
 * @brief Overlay settings from JSON text onto @p cfg.
 * @return false with a reason in @p err on malformed JSON, wrong types or bad values.
 */
bool parse_config(const std::string& text, LinkConfig& cfg, std::string& err);

/**
 * @brief Read @p path and overlay it onto @p cfg.
 * @return false with a reason in @p err if the file cannot be read or parsed.
 */
bool load_config(const std::string& path, LinkConfig& cfg, std::string& err);

/// @brief Transport settings for LinuxSerial::begin().
transport::Config to_transport_config(const LinkConfig& cfg);

} // namespace zetta
