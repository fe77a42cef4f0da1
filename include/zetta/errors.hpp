#pragma once
/**
 * @file errors.hpp
 * @brief Error kinds reported through the Zetta error channel.
 *
 * Nothing in the link layer throws. Failures come back as a bool or enum from
 * the call that hit them, and the interesting ones are also pushed through the
 * error channel (stderr log line + optional user callback) with a readable
 * message. Exceptions only exist at the boundary with user code: parsers,
 * builders and callbacks may throw, and the library catches them there.
 */

#include <cstdint>
#include <functional>
#include <string>

namespace zetta {

enum class ErrorKind : uint8_t {
    PayloadTooLarge = 0,  ///< Payload over 25 bytes; rejected before any I/O
    TransportFailure,     ///< Read or write failed in the transport
    FrameError,           ///< Candidate frame had a bad STOP byte or LENGTH
    CrcError,             ///< Candidate frame failed the CRC check
    NoBuilder,            ///< send() for a type without a builder
    NoParser,             ///< Type has no parser; never reported, process_packet() passes the payload through
    HandlerException,     ///< User parser, builder or callback threw
};

/// @brief Stable lowercase name, used as the `kind=` token in log lines.
inline const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::PayloadTooLarge:  return "payload_too_large";
        case ErrorKind::TransportFailure: return "transport_failure";
        case ErrorKind::FrameError:       return "frame_error";
        case ErrorKind::CrcError:         return "crc_error";
        case ErrorKind::NoBuilder:        return "no_builder";
        case ErrorKind::NoParser:         return "no_parser";
        case ErrorKind::HandlerException: return "handler_exception";
    }
    return "unknown";
}

/// User hook for error reports. Runs on whichever thread hit the error.
using ErrorCallback = std::function<void(ErrorKind kind, const std::string& message)>;

} // namespace zetta
