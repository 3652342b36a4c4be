#pragma once

#include "phxchan/error.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace phxchan {

using reference = std::uint64_t;

constexpr std::string_view kEventJoin = "phx_join";
constexpr std::string_view kEventReply = "phx_reply";
constexpr std::string_view kEventLeave = "phx_leave";
constexpr std::string_view kEventHeartbeat = "heartbeat";
constexpr std::string_view kHeartbeatTopic = "phoenix";

/// One wire message. `ref` is absent for broadcasts and heartbeats.
struct envelope {
  std::string topic;
  std::string event;
  nlohmann::json payload = nlohmann::json::object();
  std::optional<reference> ref;
};

inline bool operator==(const envelope &a, const envelope &b) {
  return a.topic == b.topic && a.event == b.event && a.payload == b.payload &&
         a.ref == b.ref;
}

inline bool operator!=(const envelope &a, const envelope &b) {
  return !(a == b);
}

inline std::string encode(const envelope &env) {
  nlohmann::json obj = {{"topic", env.topic},
                        {"event", env.event},
                        {"payload", env.payload},
                        {"ref", nullptr}};
  if (env.ref)
    obj["ref"] = *env.ref;
  return obj.dump();
}

namespace detail {

// Refs are echoed back as sent (a number), but peers speaking the string
// form are accepted as long as the string is all digits.
inline std::optional<reference> decode_ref(const nlohmann::json &ref) {
  if (ref.is_number_unsigned())
    return ref.get<reference>();
  if (ref.is_number_integer() && ref.get<std::int64_t>() >= 0)
    return static_cast<reference>(ref.get<std::int64_t>());
  if (ref.is_string()) {
    const auto &text = ref.get_ref<const std::string &>();
    if (text.empty() || text.size() > 19)
      return std::nullopt;
    for (char c : text) {
      if (!std::isdigit(static_cast<unsigned char>(c)))
        return std::nullopt;
    }
    return static_cast<reference>(std::stoull(text));
  }
  return std::nullopt;
}

} // namespace detail

/// Decode one text frame. Throws channel_error(protocol) when the text is
/// not a JSON object with string `topic` and `event` members.
inline envelope decode(const std::string &text) {
  nlohmann::json msg;
  try {
    msg = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error &e) {
    throw channel_error(error_kind::protocol, e.what());
  }

  if (!msg.is_object())
    throw channel_error(error_kind::protocol, "frame is not a JSON object");

  auto topic = msg.find("topic");
  auto event = msg.find("event");
  if (topic == msg.end() || !topic->is_string())
    throw channel_error(error_kind::protocol, "frame has no topic");
  if (event == msg.end() || !event->is_string())
    throw channel_error(error_kind::protocol, "frame has no event");

  envelope env;
  env.topic = topic->get<std::string>();
  env.event = event->get<std::string>();
  auto payload = msg.find("payload");
  env.payload = payload != msg.end() ? *payload : nlohmann::json::object();
  auto ref = msg.find("ref");
  if (ref != msg.end())
    env.ref = detail::decode_ref(*ref);
  return env;
}

inline envelope heartbeat_envelope() {
  return envelope{std::string(kHeartbeatTopic), std::string(kEventHeartbeat),
                  nlohmann::json::object(), std::nullopt};
}

} // namespace phxchan
