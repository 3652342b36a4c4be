#pragma once

#include "phxchan/envelope.hpp"
#include "phxchan/mailbox.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace phxchan {

/// What a subscriber finds in its inbox.
struct delivery {
  enum class kind { event, reply, closed, error };

  kind type = kind::event;
  std::string event;
  nlohmann::json payload;
  std::string error;

  static delivery make_event(std::string event, nlohmann::json payload) {
    return delivery{kind::event, std::move(event), std::move(payload), {}};
  }
  static delivery make_reply(nlohmann::json payload) {
    return delivery{kind::reply, {}, std::move(payload), {}};
  }
  static delivery make_closed() {
    return delivery{kind::closed, {}, nullptr, {}};
  }
  static delivery make_error(std::string error) {
    return delivery{kind::error, {}, nullptr, std::move(error)};
  }
};

using inbox = mailbox<delivery>;

enum class route_kind {
  topic, // durable: every envelope on one topic
  reply, // ephemeral: the phx_reply carrying one reference
};

inline std::string topic_key(const std::string &topic) {
  return "channel_" + topic;
}

inline std::string reply_key(reference ref) {
  return "reply_" + std::to_string(ref);
}

struct subscription {
  std::string key;
  route_kind kind = route_kind::topic;
  std::string topic;
  std::optional<reference> ref;
  std::shared_ptr<inbox> owner;

  static subscription for_topic(const std::string &topic,
                                std::shared_ptr<inbox> owner) {
    return subscription{topic_key(topic), route_kind::topic, topic,
                        std::nullopt, std::move(owner)};
  }

  static subscription for_reply(const std::string &topic, reference ref,
                                std::shared_ptr<inbox> owner) {
    return subscription{reply_key(ref), route_kind::reply, topic, ref,
                        std::move(owner)};
  }

  bool matches(const envelope &env) const {
    switch (kind) {
    case route_kind::topic:
      return env.topic == topic;
    case route_kind::reply:
      return env.topic == topic && env.event == kEventReply && env.ref &&
             ref && *env.ref == *ref;
    }
    return false;
  }

  delivery map(const envelope &env) const {
    if (kind == route_kind::reply)
      return delivery::make_reply(env.payload);
    return delivery::make_event(env.event, env.payload);
  }
};

/// Subscription table owned by the connection actor. Not thread-safe.
class subscription_registry {
public:
  /// A colliding key replaces the previous entry.
  void insert(subscription sub) {
    auto key = sub.key;
    auto it = table_.find(key);
    if (it != table_.end()) {
      spdlog::debug("subscription {} replaced", key);
      it->second = std::move(sub);
      return;
    }
    table_.emplace(std::move(key), std::move(sub));
  }

  bool erase(const std::string &key) { return table_.erase(key) > 0; }

  bool contains(const std::string &key) const {
    return table_.find(key) != table_.end();
  }

  size_t size() const { return table_.size(); }

  std::vector<std::string> keys() const {
    std::vector<std::string> out;
    out.reserve(table_.size());
    for (const auto &kv : table_)
      out.push_back(kv.first);
    return out;
  }

  /// Delivers the envelope to every matching owner. Returns the number of
  /// deliveries made.
  size_t route(const envelope &env) const {
    size_t delivered = 0;
    for (const auto &kv : table_) {
      const auto &sub = kv.second;
      if (!sub.owner || !sub.matches(env))
        continue;
      if (sub.owner->post(sub.map(env)))
        ++delivered;
    }
    if (delivered == 0) {
      spdlog::trace("no subscriber for {} on {}", env.event, env.topic);
    }
    return delivered;
  }

  void broadcast(const delivery &d) const {
    for (const auto &kv : table_) {
      if (kv.second.owner && !kv.second.owner->post(d))
        spdlog::trace("inbox of {} is closed", kv.first);
    }
  }

private:
  std::unordered_map<std::string, subscription> table_;
};

} // namespace phxchan
