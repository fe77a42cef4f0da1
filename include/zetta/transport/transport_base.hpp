#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal byte-stream transport interface the Zetta link runs on.
 *
 * The link never touches a file descriptor directly. It needs exactly five
 * things from the medium: open it, ask how many bytes are waiting, read them,
 * write a frame, close it. Anything that can do that (a tty, a socket, a test
 * double) plugs in here.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace zetta::transport {

// Return codes kept simple; the link turns them into error reports.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };

struct Config {
  std::string path;          // device or endpoint, e.g. /dev/ttyACM0
  int baud{115200};
  int timeout_ms{100};       // longest a send() may wait for the driver
  int boot_delay_ms{0};      // settle time after open (USB CDC auto-reset)
};

/**
 * @brief Transport trait every medium implements.
 *
 * Contract:
 *  - begin(cfg) opens the medium; false on failure.
 *  - available() returns bytes ready for recv() without blocking.
 *  - recv(buf,cap) pulls up to cap bytes; never blocks beyond the configured timeout.
 *  - send(buf,len) writes the whole buffer or reports Busy/Error. Busy/Error
 *    may follow a partial write; the peer drops the cut frame and resyncs.
 *  - name() is a short identifier for logs.
 *
 * Implementations need not be thread-safe; Protocol serializes every call
 * behind one mutex.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual bool        begin(const Config& cfg) = 0;
  virtual void        end() = 0;
  virtual bool        is_open() const = 0;
  virtual std::size_t available() const = 0;
  virtual RxResult    recv(uint8_t* out, std::size_t cap, std::size_t& out_len) = 0;
  virtual TxResult    send(const uint8_t* data, std::size_t len) = 0;
  virtual const char* name() const = 0;
};

} // namespace zetta::transport
