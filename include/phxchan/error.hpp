#pragma once

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace phxchan {

enum class error_kind {
  connect,
  transport,
  protocol,
  timeout,
  closed,
  terminated,
};

inline const char *to_string(error_kind kind) {
  switch (kind) {
  case error_kind::connect:
    return "connect";
  case error_kind::transport:
    return "transport";
  case error_kind::protocol:
    return "protocol";
  case error_kind::timeout:
    return "timeout";
  case error_kind::closed:
    return "closed";
  case error_kind::terminated:
    return "terminated";
  }
  return "unknown";
}

class channel_error : public std::runtime_error {
public:
  channel_error(error_kind kind, const std::string &message,
                nlohmann::json data = nullptr)
      : std::runtime_error(std::string(to_string(kind)) + " error: " +
                           message),
        kind_(kind), data_(std::move(data)) {}

  error_kind kind() const { return kind_; }
  const nlohmann::json &data() const { return data_; }

private:
  error_kind kind_;
  nlohmann::json data_;
};

} // namespace phxchan
