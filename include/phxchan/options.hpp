#pragma once

#include <nlohmann/json.hpp>

#include <cctype>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>

namespace phxchan {

/// Protocol version announced in the connection query string.
constexpr std::string_view kPhoenixVsn = "1.0.0";

/// Connection settings recognized by connection::connect.
struct socket_options {
  std::string host;
  std::optional<int> port;
  std::string path = "/";
  nlohmann::json params = nlohmann::json::object();
  bool secure = false;
  std::chrono::milliseconds heartbeat_interval{30000};
  std::chrono::milliseconds connect_timeout{10000};
};

/// Resolved address of one websocket stream.
struct endpoint {
  std::string host;
  int port = 0;
  std::string target;
  bool secure = false;
};

inline void validate(const socket_options &opts) {
  if (opts.host.empty())
    throw std::invalid_argument("host is required");
  if (opts.port && (*opts.port <= 0 || *opts.port > 65535))
    throw std::invalid_argument("invalid port: " + std::to_string(*opts.port));
  if (!opts.params.is_object())
    throw std::invalid_argument("params must be a JSON object");
  if (opts.heartbeat_interval.count() <= 0)
    throw std::invalid_argument("heartbeat_interval must be positive");
  if (opts.connect_timeout.count() <= 0)
    throw std::invalid_argument("connect_timeout must be positive");
}

/// Percent-encode one query component, application/x-www-form-urlencoded.
inline std::string form_encode(std::string_view text) {
  static const char hex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    auto b = static_cast<unsigned char>(c);
    if (std::isalnum(b) || c == '-' || c == '.' || c == '_' || c == '~') {
      out.push_back(c);
    } else if (c == ' ') {
      out.push_back('+');
    } else {
      out.push_back('%');
      out.push_back(hex[b >> 4]);
      out.push_back(hex[b & 0x0F]);
    }
  }
  return out;
}

inline std::string form_decode(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < text.size() &&
               std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
               std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
      out.push_back(static_cast<char>(
          std::stoi(std::string(text.substr(i + 1, 2)), nullptr, 16)));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

/// Encode a flat JSON object as a query string. Keys come out sorted;
/// string values are used verbatim, anything else is dumped as JSON.
inline std::string encode_query(const nlohmann::json &params) {
  std::string out;
  for (auto it = params.begin(); it != params.end(); ++it) {
    if (!out.empty())
      out.push_back('&');
    out += form_encode(it.key());
    out.push_back('=');
    out += form_encode(it.value().is_string()
                           ? it.value().get<std::string>()
                           : it.value().dump());
  }
  return out;
}

inline std::tuple<std::string, std::optional<int>>
split_host_port(const std::string &addr) {
  auto pos = addr.rfind(':');
  if (pos == std::string::npos)
    return {addr, std::nullopt};

  std::string host = addr.substr(0, pos);
  std::string port_text = addr.substr(pos + 1);
  if (port_text.empty())
    return {host, std::nullopt};
  for (char c : port_text) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      throw std::invalid_argument("invalid port in address: " + addr);
  }
  return {host, std::stoi(port_text)};
}

/// Build options from "ws://host[:port][/path][?k=v&...]" (or wss://).
inline socket_options options_from_uri(const std::string &uri) {
  socket_options opts;
  std::string rest;
  if (uri.rfind("ws://", 0) == 0) {
    rest = uri.substr(5);
  } else if (uri.rfind("wss://", 0) == 0) {
    opts.secure = true;
    rest = uri.substr(6);
  } else {
    throw std::invalid_argument("unsupported socket URI: " + uri);
  }

  std::string query;
  auto qmark = rest.find('?');
  if (qmark != std::string::npos) {
    query = rest.substr(qmark + 1);
    rest = rest.substr(0, qmark);
  }

  auto slash = rest.find('/');
  std::string addr = slash == std::string::npos ? rest : rest.substr(0, slash);
  if (slash != std::string::npos)
    opts.path = rest.substr(slash);

  auto [host, port] = split_host_port(addr);
  if (host.empty())
    throw std::invalid_argument("invalid socket URI: " + uri);
  opts.host = host;
  opts.port = port;

  size_t start = 0;
  while (start < query.size()) {
    auto amp = query.find('&', start);
    std::string pair = query.substr(
        start, amp == std::string::npos ? std::string::npos : amp - start);
    if (!pair.empty()) {
      auto eq = pair.find('=');
      std::string key = form_decode(pair.substr(0, eq));
      std::string value =
          eq == std::string::npos ? "" : form_decode(pair.substr(eq + 1));
      if (key != "vsn")
        opts.params[key] = value;
    }
    if (amp == std::string::npos)
      break;
    start = amp + 1;
  }

  validate(opts);
  return opts;
}

/// Build options from a JSON configuration object. Missing keys keep their
/// defaults; intervals are given in milliseconds.
inline socket_options options_from_json(const nlohmann::json &config) {
  if (!config.is_object())
    throw std::invalid_argument("socket configuration must be a JSON object");

  socket_options opts;
  try {
    opts.host = config.at("host").get<std::string>();
    if (config.contains("port") && !config["port"].is_null())
      opts.port = config["port"].get<int>();
    opts.path = config.value("path", opts.path);
    if (config.contains("params"))
      opts.params = config["params"];
    opts.secure = config.value("secure", opts.secure);
    opts.heartbeat_interval = std::chrono::milliseconds(
        config.value("heartbeat_interval",
                     static_cast<long long>(opts.heartbeat_interval.count())));
    opts.connect_timeout = std::chrono::milliseconds(
        config.value("connect_timeout",
                     static_cast<long long>(opts.connect_timeout.count())));
  } catch (const nlohmann::json::exception &e) {
    throw std::invalid_argument(std::string("invalid socket configuration: ") +
                                e.what());
  }

  validate(opts);
  return opts;
}

inline endpoint make_endpoint(const socket_options &opts) {
  validate(opts);

  nlohmann::json params = opts.params;
  params["vsn"] = std::string(kPhoenixVsn);

  endpoint ep;
  ep.host = opts.host;
  ep.port = opts.port ? *opts.port : (opts.secure ? 443 : 80);
  ep.target =
      (opts.path.empty() ? "/" : opts.path) + "?" + encode_query(params);
  ep.secure = opts.secure;
  return ep;
}

} // namespace phxchan
