#pragma once

#include "phxchan/error.hpp"
#include "phxchan/transport.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <memory>
#include <mutex>
#include <netdb.h>
#include <random>
#include <sstream>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>
#include <vector>

namespace phxchan {

namespace detail {

inline std::string base64_encode(const uint8_t *data, size_t size) {
  static const char table[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve((size + 2) / 3 * 4);
  size_t i = 0;
  for (; i + 2 < size; i += 3) {
    uint32_t v = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) |
                 data[i + 2];
    out.push_back(table[(v >> 18) & 0x3F]);
    out.push_back(table[(v >> 12) & 0x3F]);
    out.push_back(table[(v >> 6) & 0x3F]);
    out.push_back(table[v & 0x3F]);
  }
  if (i + 1 == size) {
    uint32_t v = uint32_t(data[i]) << 16;
    out.push_back(table[(v >> 18) & 0x3F]);
    out.push_back(table[(v >> 12) & 0x3F]);
    out += "==";
  } else if (i + 2 == size) {
    uint32_t v = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
    out.push_back(table[(v >> 18) & 0x3F]);
    out.push_back(table[(v >> 12) & 0x3F]);
    out.push_back(table[(v >> 6) & 0x3F]);
    out.push_back('=');
  }
  return out;
}

inline void set_socket_timeout(int fd, int option, long timeout_ms) {
  timeval tv{};
  tv.tv_sec = timeout_ms / 1000;
  tv.tv_usec = (timeout_ms % 1000) * 1000;
  ::setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv));
}

} // namespace detail

/// RFC 6455 client over a blocking TCP socket.
class ws_transport : public transport {
public:
  static constexpr int kAbnormalClosure = 1006;
  static constexpr int kMessageTooBig = 1009;
  static constexpr uint64_t kMaxMessageSize = 16 * 1024 * 1024;

  static std::shared_ptr<transport> open(const endpoint &ep,
                                         const socket_options &opts) {
    if (ep.secure) {
      throw channel_error(error_kind::connect,
                          "wss:// is not supported without a TLS stack");
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *res = nullptr;
    int rc = ::getaddrinfo(ep.host.c_str(), std::to_string(ep.port).c_str(),
                           &hints, &res);
    if (rc != 0) {
      throw channel_error(error_kind::connect, "cannot resolve " + ep.host +
                                                   ": " + ::gai_strerror(rc));
    }

    long timeout_ms = static_cast<long>(opts.connect_timeout.count());
    int fd = -1;
    std::string last_error = "no address";
    for (addrinfo *ai = res; ai != nullptr; ai = ai->ai_next) {
      fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
      if (fd < 0) {
        last_error = std::strerror(errno);
        continue;
      }
      detail::set_socket_timeout(fd, SO_SNDTIMEO, timeout_ms);
      if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0)
        break;
      last_error = std::strerror(errno);
      ::close(fd);
      fd = -1;
    }
    ::freeaddrinfo(res);

    if (fd < 0) {
      throw channel_error(error_kind::connect,
                          "cannot connect to " + ep.host + ":" +
                              std::to_string(ep.port) + ": " + last_error);
    }

    detail::set_socket_timeout(fd, SO_RCVTIMEO, timeout_ms);
    try {
      handshake(fd, ep);
    } catch (const channel_error &) {
      ::close(fd);
      throw;
    }
    detail::set_socket_timeout(fd, SO_RCVTIMEO, 0);
    detail::set_socket_timeout(fd, SO_SNDTIMEO, 0);

    spdlog::debug("websocket open to {}:{}{}", ep.host, ep.port, ep.target);
    return std::make_shared<ws_transport>(fd);
  }

  explicit ws_transport(int fd) : sockfd_(fd) {}

  ~ws_transport() override { close_socket(); }

  ws_transport(const ws_transport &) = delete;
  ws_transport &operator=(const ws_transport &) = delete;

  void send(const frame &f) override {
    uint8_t opcode = 0x1;
    switch (f.kind) {
    case frame_kind::text:
      opcode = 0x1;
      break;
    case frame_kind::ping:
      opcode = 0x9;
      break;
    case frame_kind::pong:
      opcode = 0xA;
      break;
    case frame_kind::close:
      opcode = 0x8;
      break;
    }

    std::string payload = f.data;
    if (f.kind == frame_kind::close) {
      payload.clear();
      payload.push_back(static_cast<char>((f.close_code >> 8) & 0xFF));
      payload.push_back(static_cast<char>(f.close_code & 0xFF));
      payload += f.data;
    }

    if (!send_frame(opcode, payload)) {
      throw channel_error(error_kind::transport,
                          std::string("websocket send failed: ") +
                              to_string(f.kind));
    }
  }

  /// Control frames may arrive between the fragments of a text message;
  /// they are returned on their own and the partial message is kept for the
  /// next call.
  frame receive() override {
    std::lock_guard<std::mutex> reader(recv_mu_);
    for (;;) {
      int fd = socket_fd();
      if (fd < 0 || aborted_.load())
        throw channel_error(error_kind::transport, "websocket aborted");

      uint8_t header[2];
      if (!read_exact(fd, header, 2))
        return dropped();

      bool fin = (header[0] & 0x80) != 0;
      uint8_t opcode = static_cast<uint8_t>(header[0] & 0x0F);
      bool masked = (header[1] & 0x80) != 0;
      uint64_t len = static_cast<uint64_t>(header[1] & 0x7F);

      if (len == 126) {
        uint8_t ext[2];
        if (!read_exact(fd, ext, 2))
          return dropped();
        len = (static_cast<uint64_t>(ext[0]) << 8) | ext[1];
      } else if (len == 127) {
        uint8_t ext[8];
        if (!read_exact(fd, ext, 8))
          return dropped();
        len = 0;
        for (int i = 0; i < 8; ++i) {
          len = (len << 8) | ext[i];
        }
      }

      bool data_frame = opcode <= 0x2;
      if (len > kMaxMessageSize ||
          (data_frame && fragmented_.size() + len > kMaxMessageSize)) {
        spdlog::warn("websocket frame of {} bytes exceeds limit", len);
        fragmented_.clear();
        reading_fragment_ = false;
        return frame::close(kMessageTooBig, "message too big");
      }

      std::array<uint8_t, 4> mask{};
      if (masked && !read_exact(fd, mask.data(), mask.size()))
        return dropped();

      std::string payload(len, '\0');
      if (len > 0 && !read_exact(fd, payload.data(), len))
        return dropped();
      if (masked) {
        for (size_t i = 0; i < payload.size(); ++i) {
          payload[i] = static_cast<char>(payload[i] ^ mask[i % 4]);
        }
      }

      if (opcode == 0x8) { // close
        int code = 1005;
        std::string reason;
        if (payload.size() >= 2) {
          code = (static_cast<uint8_t>(payload[0]) << 8) |
                 static_cast<uint8_t>(payload[1]);
          reason = payload.substr(2);
        }
        return frame::close(code, reason);
      }
      if (opcode == 0x9) // ping
        return frame::ping(payload);
      if (opcode == 0xA) // pong
        return frame::pong(payload);

      if (opcode == 0x1 || opcode == 0x2 || opcode == 0x0) {
        if (opcode != 0x0 && !reading_fragment_)
          fragmented_.clear();
        fragmented_.append(payload);
        reading_fragment_ = !fin;
        if (fin) {
          std::string text;
          text.swap(fragmented_);
          return frame::text(std::move(text));
        }
        continue;
      }

      throw channel_error(error_kind::protocol,
                          "unknown websocket opcode " + std::to_string(opcode));
    }
  }

  void close() override {
    if (!aborted_.load() && !close_sent_.exchange(true)) {
      std::string payload;
      payload.push_back(static_cast<char>((1000 >> 8) & 0xFF));
      payload.push_back(static_cast<char>(1000 & 0xFF));
      if (!send_frame(0x8, payload))
        spdlog::debug("websocket close frame not delivered");
    }
    abort();
  }

  // The descriptor stays open until destruction so that a reader blocked on
  // it never sees the number reused.
  void abort() override {
    aborted_.store(true);
    std::lock_guard<std::mutex> lock(state_mu_);
    if (sockfd_ >= 0)
      ::shutdown(sockfd_, SHUT_RDWR);
  }

private:
  static void handshake(int fd, const endpoint &ep) {
    std::array<uint8_t, 16> nonce{};
    std::random_device rd;
    for (auto &b : nonce) {
      b = static_cast<uint8_t>(rd());
    }

    std::ostringstream req;
    req << "GET " << (ep.target.empty() ? "/" : ep.target) << " HTTP/1.1\r\n";
    req << "Host: " << ep.host << ":" << ep.port << "\r\n";
    req << "Upgrade: websocket\r\n";
    req << "Connection: Upgrade\r\n";
    req << "Sec-WebSocket-Key: "
        << detail::base64_encode(nonce.data(), nonce.size()) << "\r\n";
    req << "Sec-WebSocket-Version: 13\r\n\r\n";

    auto req_str = req.str();
    if (!send_all(fd, req_str.data(), req_str.size())) {
      throw channel_error(error_kind::connect,
                          "websocket handshake send failed");
    }

    std::string headers;
    headers.reserve(4096);
    char ch = 0;
    while (headers.find("\r\n\r\n") == std::string::npos) {
      ssize_t n = ::recv(fd, &ch, 1, 0);
      if (n <= 0) {
        throw channel_error(error_kind::connect,
                            "websocket handshake interrupted");
      }
      headers.push_back(ch);
      if (headers.size() > 16384) {
        throw channel_error(error_kind::connect,
                            "websocket handshake too large");
      }
    }

    auto status_end = headers.find("\r\n");
    std::string status = headers.substr(0, status_end);
    if (status.find(" 101") == std::string::npos) {
      throw channel_error(error_kind::connect,
                          "server refused websocket upgrade: " + status);
    }
  }

  static bool send_all(int fd, const void *data, size_t size) {
    const auto *ptr = static_cast<const uint8_t *>(data);
    size_t sent = 0;
    while (sent < size) {
      ssize_t n = ::send(fd, ptr + sent, size - sent, MSG_NOSIGNAL);
      if (n < 0 && errno == EINTR)
        continue;
      if (n <= 0) {
        return false;
      }
      sent += static_cast<size_t>(n);
    }
    return true;
  }

  static frame dropped() {
    return frame::close(kAbnormalClosure, "connection dropped");
  }

  // Returns false when the peer went away without a close frame; any other
  // failure is a transport error.
  bool read_exact(int fd, void *data, size_t size) {
    auto *ptr = static_cast<uint8_t *>(data);
    size_t got = 0;
    while (got < size) {
      ssize_t n = ::recv(fd, ptr + got, size - got, 0);
      if (n > 0) {
        got += static_cast<size_t>(n);
        continue;
      }
      if (n < 0 && errno == EINTR)
        continue;
      if (aborted_.load())
        throw channel_error(error_kind::transport, "websocket aborted");
      if (n == 0 || errno == ECONNRESET || errno == EPIPE)
        return false;
      throw channel_error(error_kind::transport,
                          std::string("websocket read failed: ") +
                              std::strerror(errno));
    }
    return true;
  }

  bool send_frame(uint8_t opcode, const std::string &payload) {
    int fd = socket_fd();
    if (fd < 0 || aborted_.load()) {
      return false;
    }

    std::vector<uint8_t> buf;
    buf.reserve(payload.size() + 16);
    buf.push_back(static_cast<uint8_t>(0x80 | (opcode & 0x0F)));

    uint64_t len = payload.size();
    if (len < 126) {
      buf.push_back(static_cast<uint8_t>(0x80 | len));
    } else if (len <= 0xFFFF) {
      buf.push_back(static_cast<uint8_t>(0x80 | 126));
      buf.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
      buf.push_back(static_cast<uint8_t>(len & 0xFF));
    } else {
      buf.push_back(static_cast<uint8_t>(0x80 | 127));
      for (int i = 7; i >= 0; --i) {
        buf.push_back(static_cast<uint8_t>((len >> (i * 8)) & 0xFF));
      }
    }

    std::lock_guard<std::mutex> lock(send_mu_);
    std::array<uint8_t, 4> mask{};
    for (auto &b : mask) {
      b = static_cast<uint8_t>(random_device_());
      buf.push_back(b);
    }

    for (size_t i = 0; i < payload.size(); ++i) {
      buf.push_back(static_cast<uint8_t>(payload[i]) ^ mask[i % 4]);
    }

    return send_all(fd, buf.data(), buf.size());
  }

  int socket_fd() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return sockfd_;
  }

  void close_socket() {
    std::lock_guard<std::mutex> lock(state_mu_);
    if (sockfd_ >= 0) {
      ::close(sockfd_);
      sockfd_ = -1;
    }
  }

  mutable std::mutex state_mu_;
  int sockfd_ = -1;
  std::atomic<bool> aborted_{false};
  std::atomic<bool> close_sent_{false};

  std::mutex send_mu_;
  std::random_device random_device_;

  // Partial text message, owned by the reader.
  std::mutex recv_mu_;
  std::string fragmented_;
  bool reading_fragment_ = false;
};

} // namespace phxchan
