#pragma once

#include "phxchan/options.hpp"

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace phxchan {

enum class frame_kind { text, ping, pong, close };

inline const char *to_string(frame_kind kind) {
  switch (kind) {
  case frame_kind::text:
    return "text";
  case frame_kind::ping:
    return "ping";
  case frame_kind::pong:
    return "pong";
  case frame_kind::close:
    return "close";
  }
  return "unknown";
}

struct frame {
  frame_kind kind = frame_kind::text;
  std::string data;
  int close_code = 0;

  static frame text(std::string data) {
    return frame{frame_kind::text, std::move(data), 0};
  }
  static frame ping(std::string data = {}) {
    return frame{frame_kind::ping, std::move(data), 0};
  }
  static frame pong(std::string data = {}) {
    return frame{frame_kind::pong, std::move(data), 0};
  }
  static frame close(int code, std::string reason = {}) {
    return frame{frame_kind::close, std::move(reason), code};
  }
};

/// A message stream for one connection epoch.
///
/// send() may be called from any thread while another thread is blocked in
/// receive(). Both close() and abort() must make a blocked receive() return;
/// close() says goodbye to the peer first. Failures are reported as
/// channel_error(transport).
class transport {
public:
  virtual ~transport() = default;

  virtual void send(const frame &f) = 0;
  virtual frame receive() = 0;
  virtual void close() = 0;
  virtual void abort() = 0;
};

/// Opens a transport or throws channel_error(connect).
using transport_opener = std::function<std::shared_ptr<transport>(
    const endpoint &, const socket_options &)>;

} // namespace phxchan
