#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux USB/tty transport (header-only, termios; non-blocking).
 *
 * Opens the port raw 8N1 with no flow control and VMIN=VTIME=0, so reads never
 * block: the receive loop asks available() (FIONREAD) first and only reads what
 * is already there. Writes loop until the whole frame is out, parking in
 * poll(POLLOUT) when the driver buffer is full, bounded by Config::timeout_ms.
 * A timeout after part of the frame went out returns Busy with those bytes
 * already on the wire; the receiver sees a bad frame and resyncs.
 *
 * Depends on: unistd.h, fcntl.h, termios.h, poll.h, sys/ioctl.h.
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "zetta/transport/transport_base.hpp"
#include <string>
#include <thread>
#include <chrono>
#include <unistd.h>
#include <fcntl.h>
#include <termios.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <cerrno>

namespace zetta::transport {

/// @brief Map an integer baud to a termios speed; unknown values fall back to 115200.
inline speed_t baud_to_speed(int baud) {
  switch (baud) {
    case 9600:   return B9600;
    case 19200:  return B19200;
    case 38400:  return B38400;
    case 57600:  return B57600;
    case 115200: return B115200;
#ifdef B230400
    case 230400: return B230400;
#endif
#ifdef B460800
    case 460800: return B460800;
#endif
    default:     return B115200;
  }
}

class LinuxSerial : public ITransport {
public:
  LinuxSerial() = default;
  ~LinuxSerial() override { end(); }

  LinuxSerial(const LinuxSerial&) = delete;
  LinuxSerial& operator=(const LinuxSerial&) = delete;

  bool begin(const Config& cfg) override {
    end();
    cfg_ = cfg;
    if (cfg_.path.empty()) return false;

    fd_ = ::open(cfg_.path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) return false;

    if (!set_raw(baud_to_speed(cfg_.baud))) { end(); return false; }

    if (cfg_.boot_delay_ms > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.boot_delay_ms));
    }
    ::tcflush(fd_, TCIOFLUSH);               // drop reset chatter
    return true;
  }

  void end() override {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
  }

  bool is_open() const override { return fd_ >= 0; }

  std::size_t available() const override {
    if (fd_ < 0) return 0;
    int n = 0;
    if (::ioctl(fd_, FIONREAD, &n) != 0) return 0;
    return n > 0 ? static_cast<std::size_t>(n) : 0;
  }

  RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len) override {
    out_len = 0;
    if (fd_ < 0 || cap == 0) return RxResult::Error;
    ssize_t r = ::read(fd_, out, cap);
    if (r > 0) { out_len = static_cast<std::size_t>(r); return RxResult::Ok; }
    if (r == 0 || (r < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))) return RxResult::None;
    return RxResult::Error;
  }

  TxResult send(const uint8_t* data, std::size_t len) override {
    if (fd_ < 0 || !data || !len) return TxResult::Error;

    std::size_t done = 0;
    while (done < len) {
      ssize_t w = ::write(fd_, data + done, len - done);
      if (w > 0) { done += static_cast<std::size_t>(w); continue; }
      if (w < 0 && errno == EINTR) continue;
      if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        pollfd pfd{fd_, POLLOUT, 0};
        int pr = ::poll(&pfd, 1, cfg_.timeout_ms);
        if (pr == 0) return TxResult::Busy;     // driver never drained; `done` bytes already sent
        if (pr < 0 && errno != EINTR) return TxResult::Error;
        continue;
      }
      return TxResult::Error;
    }
    return TxResult::Ok;
  }

  const char* name() const override { return "linux-serial"; }

  const std::string& path() const { return cfg_.path; }

private:
  bool set_raw(speed_t sp) {
    termios tio{};
    if (::tcgetattr(fd_, &tio) != 0) return false;
    ::cfmakeraw(&tio);                       // 8N1, no echo, no line discipline
    ::cfsetispeed(&tio, sp);
    ::cfsetospeed(&tio, sp);
    tio.c_cflag |= (CLOCAL | CREAD);         // ignore modem ctrl, enable receiver
    tio.c_cflag &= ~CRTSCTS;                 // no hardware flow control
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;
    return ::tcsetattr(fd_, TCSANOW, &tio) == 0;
  }

  int fd_{-1};
  Config cfg_;
};

} // namespace zetta::transport
