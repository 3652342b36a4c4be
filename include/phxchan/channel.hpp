#pragma once

#include "phxchan/connection.hpp"
#include "phxchan/envelope.hpp"
#include "phxchan/error.hpp"
#include "phxchan/subscription.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace phxchan {

/// A topic on a connection. Copies share the inbox that receives the
/// topic's events once joined: `event` deliveries carry `{event, payload}`,
/// plus `closed` and `error` notifications about the connection.
struct channel {
  std::shared_ptr<connection> conn;
  std::string topic;
  nlohmann::json params = nlohmann::json::object();
  std::shared_ptr<inbox> messages = std::make_shared<inbox>();

  std::optional<delivery> receive(std::chrono::milliseconds timeout) const {
    return messages->take_for(timeout);
  }
};

inline channel make_channel(std::shared_ptr<connection> conn,
                            std::string topic,
                            nlohmann::json params = nlohmann::json::object()) {
  if (!conn)
    throw std::invalid_argument("channel requires a connection");
  if (topic.empty())
    throw std::invalid_argument("topic is required");
  return channel{std::move(conn), std::move(topic), std::move(params),
                 std::make_shared<inbox>()};
}

enum class reply_status { ok, error, timeout, exception };

inline const char *to_string(reply_status status) {
  switch (status) {
  case reply_status::ok:
    return "ok";
  case reply_status::error:
    return "error";
  case reply_status::timeout:
    return "timeout";
  case reply_status::exception:
    return "exception";
  }
  return "unknown";
}

/// Outcome of a request/reply exchange. `response` is set for ok and error,
/// `failure` for exception.
struct reply {
  reply_status status = reply_status::timeout;
  nlohmann::json response;
  std::optional<channel_error> failure;

  bool ok() const { return status == reply_status::ok; }

  static reply make_ok(nlohmann::json response) {
    return reply{reply_status::ok, std::move(response), std::nullopt};
  }
  static reply make_error(nlohmann::json response) {
    return reply{reply_status::error, std::move(response), std::nullopt};
  }
  static reply make_timeout() {
    return reply{reply_status::timeout, nullptr, std::nullopt};
  }
  static reply make_exception(channel_error failure) {
    return reply{reply_status::exception, nullptr, std::move(failure)};
  }
};

namespace detail {

inline void send_envelope(const channel &ch, const std::string &event,
                          const nlohmann::json &payload, reference ref) {
  std::string text;
  try {
    text = encode(envelope{ch.topic, event, payload, ref});
  } catch (const nlohmann::json::exception &e) {
    throw channel_error(error_kind::protocol,
                        "cannot encode " + event + ": " + e.what());
  }
  auto stream = ch.conn->current_transport();
  if (!stream)
    throw channel_error(error_kind::transport, "not connected");
  stream->send(frame::text(std::move(text)));
}

inline reply interpret(const delivery &d) {
  switch (d.type) {
  case delivery::kind::closed:
    return reply::make_exception(channel_error(
        error_kind::closed, "connection closed while waiting for reply"));
  case delivery::kind::error:
    return reply::make_exception(channel_error(error_kind::transport, d.error));
  case delivery::kind::event:
    return reply::make_exception(
        channel_error(error_kind::protocol, "unexpected event " + d.event));
  case delivery::kind::reply:
    break;
  }

  const auto &payload = d.payload;
  if (payload.is_object()) {
    auto status = payload.find("status");
    auto response = payload.find("response");
    nlohmann::json body =
        response != payload.end() ? *response : nlohmann::json::object();
    if (status != payload.end() && *status == "ok")
      return reply::make_ok(std::move(body));
    if (status != payload.end() && *status == "error")
      return reply::make_error(std::move(body));
  }
  return reply::make_exception(
      channel_error(error_kind::protocol, "malformed reply", payload));
}

// Removes the reply route however the exchange ends.
class reply_route {
public:
  reply_route(connection &conn, reference ref)
      : conn_(conn), key_(reply_key(ref)) {}
  ~reply_route() { conn_.unsubscribe(key_); }

  reply_route(const reply_route &) = delete;
  reply_route &operator=(const reply_route &) = delete;

private:
  connection &conn_;
  std::string key_;
};

} // namespace detail

/// Sends an event without waiting for a reply. Throws
/// channel_error(transport) when the connection is down or the send fails,
/// and channel_error(protocol) when the payload cannot be encoded.
inline void push(const channel &ch, const std::string &event,
                 const nlohmann::json &payload) {
  detail::send_envelope(ch, event, payload, ch.conn->next_reference());
}

/// Sends an event and waits up to `timeout` (never more than kMaxTimeout)
/// for the phx_reply carrying the same reference.
inline reply push_and_receive(const channel &ch, const std::string &event,
                              const nlohmann::json &payload,
                              std::chrono::milliseconds timeout =
                                  kDefaultTimeout) {
  reference ref = 0;
  try {
    ref = ch.conn->next_reference();
  } catch (const channel_error &e) {
    return reply::make_exception(e);
  }

  auto replies = std::make_shared<inbox>();
  detail::reply_route route(*ch.conn, ref);
  ch.conn->subscribe(subscription::for_reply(ch.topic, ref, replies));

  try {
    detail::send_envelope(ch, event, payload, ref);
  } catch (const channel_error &e) {
    spdlog::debug("push {} on {} failed: {}", event, ch.topic, e.what());
    return reply::make_exception(e);
  }

  auto d = replies->take_for(std::min(timeout, kMaxTimeout));
  if (!d) {
    spdlog::debug("no reply to {} on {} (ref {})", event, ch.topic, ref);
    return reply::make_timeout();
  }
  return detail::interpret(*d);
}

/// Routes the topic's events to `ch.messages`, then sends phx_join. A join
/// that times out leaves no route behind.
inline reply join(const channel &ch,
                  std::chrono::milliseconds timeout = kDefaultTimeout) {
  ch.conn->subscribe(subscription::for_topic(ch.topic, ch.messages));
  auto result =
      push_and_receive(ch, std::string(kEventJoin), ch.params, timeout);
  if (result.status == reply_status::timeout)
    ch.conn->unsubscribe(topic_key(ch.topic));
  return result;
}

inline reply leave(const channel &ch,
                   std::chrono::milliseconds timeout = kDefaultTimeout) {
  ch.conn->unsubscribe(topic_key(ch.topic));
  return push_and_receive(ch, std::string(kEventLeave),
                          nlohmann::json::object(), timeout);
}

} // namespace phxchan
