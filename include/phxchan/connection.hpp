#pragma once

#include "phxchan/envelope.hpp"
#include "phxchan/error.hpp"
#include "phxchan/mailbox.hpp"
#include "phxchan/options.hpp"
#include "phxchan/subscription.hpp"
#include "phxchan/transport.hpp"
#include "phxchan/ws_transport.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace phxchan {

/// Default wait for a reply.
constexpr std::chrono::milliseconds kDefaultTimeout{5000};
/// Hard ceiling on any wait performed on behalf of a caller.
constexpr std::chrono::milliseconds kMaxTimeout{60000};
/// Pause of the receive worker after a failed read or decode.
constexpr std::chrono::milliseconds kErrorBackoff{100};

enum class connection_state {
  idle,
  connecting,
  connected,
  disconnected,
  terminated,
};

inline const char *to_string(connection_state state) {
  switch (state) {
  case connection_state::idle:
    return "idle";
  case connection_state::connecting:
    return "connecting";
  case connection_state::connected:
    return "connected";
  case connection_state::disconnected:
    return "disconnected";
  case connection_state::terminated:
    return "terminated";
  }
  return "unknown";
}

/// The connection actor.
///
/// One thread owns the transport, the reference counter, the subscription
/// table and the heartbeat timer. Every public member is either a call
/// (waits for the actor's answer) or a cast (queued, returns at once); both
/// go through one FIFO mailbox, so a cast followed by a call is observed in
/// that order.
class connection {
public:
  explicit connection(transport_opener opener = ws_transport::open)
      : opener_(std::move(opener)) {
    actor_thread_ = std::thread([this]() { run(); });
  }

  ~connection() { terminate(); }

  connection(const connection &) = delete;
  connection &operator=(const connection &) = delete;

  /// Tears down any current epoch and opens a new one. Throws
  /// channel_error(connect) when the transport cannot be opened and
  /// std::invalid_argument for bad options.
  void connect(const socket_options &opts) {
    call([this, opts]() {
      st_.address = make_endpoint(opts);
      st_.options = opts;
      open_epoch();
    });
  }

  /// Repeats the last connect() with the same options.
  void reconnect() {
    call([this]() {
      if (!st_.address) {
        throw channel_error(error_kind::connect,
                            "reconnect before any connect");
      }
      open_epoch();
    });
  }

  reference next_reference() {
    return call([this]() { return st_.next_ref++; });
  }

  /// The live transport, or nullptr while disconnected.
  std::shared_ptr<transport> current_transport() {
    return call([this]() { return st_.stream; });
  }

  void subscribe(subscription sub) {
    cast([this, sub = std::move(sub)]() mutable {
      spdlog::trace("subscribe {}", sub.key);
      st_.registry.insert(std::move(sub));
    });
  }

  void unsubscribe(const std::string &key) {
    cast([this, key]() {
      spdlog::trace("unsubscribe {}", key);
      st_.registry.erase(key);
    });
  }

  /// Stops the worker, the timer and the transport, then the actor itself.
  /// Later calls throw channel_error(terminated). Safe to call twice.
  void terminate() {
    std::lock_guard<std::mutex> lock(terminate_mu_);
    if (!actor_thread_.joinable())
      return;
    if (!mailbox_.post([this]() { shutdown(); })) {
      spdlog::debug("connection mailbox already closed");
    }
    actor_thread_.join();
  }

  connection_state state() {
    return call([this]() { return st_.state; });
  }

  std::vector<std::string> subscription_keys() {
    return call([this]() { return st_.registry.keys(); });
  }

  bool has_subscription(const std::string &key) {
    return call([this, key]() { return st_.registry.contains(key); });
  }

  bool heartbeat_armed() {
    return call([this]() { return st_.heartbeat_due.has_value(); });
  }

  /// Number of successful connects so far.
  uint64_t epoch() {
    return call([this]() { return st_.epoch; });
  }

  /// Receive workers currently running, across all epochs.
  int live_workers() const { return live_workers_.load(); }

private:
  using command = std::function<void()>;
  using clock = std::chrono::steady_clock;

  // Reads one transport until told to stop or the peer closes, forwarding
  // everything to the actor's mailbox tagged with its epoch.
  class receive_worker {
  public:
    receive_worker(connection &owner, std::shared_ptr<transport> t,
                   uint64_t epoch)
        : owner_(owner), transport_(std::move(t)), epoch_(epoch) {
      ++owner_.live_workers_;
      thread_ = std::thread([this]() { loop(); });
    }

    ~receive_worker() { stop(); }

    receive_worker(const receive_worker &) = delete;
    receive_worker &operator=(const receive_worker &) = delete;

    void request_stop() {
      {
        std::lock_guard<std::mutex> lock(mu_);
        stopping_.store(true);
      }
      cv_.notify_all();
    }

    /// Aborts the transport so a blocked receive returns, then joins.
    void stop() {
      request_stop();
      transport_->abort();
      if (thread_.joinable())
        thread_.join();
    }

  private:
    void loop() {
      while (!stopping_.load()) {
        frame f;
        try {
          f = transport_->receive();
        } catch (const std::exception &e) {
          if (stopping_.load())
            break;
          fail(e.what());
          continue;
        }

        if (f.kind == frame_kind::close) {
          owner_.inbound_closed(epoch_, f.close_code, f.data);
          break;
        }
        if (f.kind == frame_kind::ping) {
          try {
            transport_->send(frame::pong(f.data));
          } catch (const std::exception &e) {
            spdlog::debug("pong not sent: {}", e.what());
          }
          continue;
        }
        if (f.kind == frame_kind::pong)
          continue;

        try {
          owner_.inbound_envelope(epoch_, decode(f.data));
        } catch (const channel_error &e) {
          spdlog::warn("dropping undecodable frame: {}", e.what());
          fail(e.what());
        }
      }
      --owner_.live_workers_;
    }

    void fail(const std::string &error) {
      owner_.inbound_error(epoch_, error);
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait_for(lock, kErrorBackoff, [this]() { return stopping_.load(); });
    }

    connection &owner_;
    std::shared_ptr<transport> transport_;
    uint64_t epoch_;
    std::atomic<bool> stopping_{false};
    std::mutex mu_;
    std::condition_variable cv_;
    std::thread thread_;
  };

  // Touched only on the actor thread.
  struct actor_state {
    connection_state state = connection_state::idle;
    std::optional<socket_options> options;
    std::optional<endpoint> address;
    std::shared_ptr<transport> stream;
    std::unique_ptr<receive_worker> worker;
    std::optional<clock::time_point> heartbeat_due;
    reference next_ref = 0;
    uint64_t epoch = 0;
    subscription_registry registry;
    bool running = true;
  };

  template <typename F> auto call(F fn) -> decltype(fn()) {
    using result = decltype(fn());
    auto promise = std::make_shared<std::promise<result>>();
    auto future = promise->get_future();

    bool posted = mailbox_.post([promise, fn = std::move(fn)]() mutable {
      try {
        if constexpr (std::is_void_v<result>) {
          fn();
          promise->set_value();
        } else {
          promise->set_value(fn());
        }
      } catch (...) {
        promise->set_exception(std::current_exception());
      }
    });
    if (!posted)
      throw channel_error(error_kind::terminated, "connection terminated");

    if (future.wait_for(kMaxTimeout) != std::future_status::ready) {
      throw channel_error(error_kind::timeout,
                          "connection actor did not answer");
    }
    try {
      return future.get();
    } catch (const std::future_error &) {
      throw channel_error(error_kind::terminated, "connection terminated");
    }
  }

  void cast(command cmd) {
    if (!mailbox_.post(std::move(cmd)))
      spdlog::debug("connection terminated, dropping request");
  }

  void run() {
    while (st_.running) {
      if (st_.heartbeat_due && clock::now() >= *st_.heartbeat_due)
        heartbeat();

      auto cmd = st_.heartbeat_due ? mailbox_.take_until(*st_.heartbeat_due)
                                   : mailbox_.take();
      if (cmd)
        (*cmd)();
    }

    // Whatever is still queued is dropped; pending calls see a broken
    // promise and report the connection as terminated.
    mailbox_.close();
    while (mailbox_.take()) {
    }
  }

  void open_epoch() {
    teardown(true);
    st_.state = connection_state::connecting;

    const auto &ep = *st_.address;
    spdlog::info("connecting to {}://{}:{}{}", ep.secure ? "wss" : "ws",
                 ep.host, ep.port, ep.target);

    std::shared_ptr<transport> t;
    try {
      t = opener_(ep, *st_.options);
      if (!t) {
        throw channel_error(error_kind::connect,
                            "transport opener returned null");
      }
    } catch (const std::exception &e) {
      st_.state = st_.epoch > 0 ? connection_state::disconnected
                                : connection_state::idle;
      spdlog::warn("connect to {}:{} failed: {}", ep.host, ep.port, e.what());
      auto *err = dynamic_cast<const channel_error *>(&e);
      if (err && err->kind() == error_kind::connect)
        throw;
      throw channel_error(error_kind::connect, e.what());
    }

    st_.stream = std::move(t);
    ++st_.epoch;
    st_.worker =
        std::make_unique<receive_worker>(*this, st_.stream, st_.epoch);
    st_.heartbeat_due = clock::now() + st_.options->heartbeat_interval;
    st_.state = connection_state::connected;
    spdlog::info("connected to {}:{} (epoch {})", ep.host, ep.port, st_.epoch);
  }

  // A graceful teardown sends a close frame; otherwise the stream is
  // aborted.
  void teardown(bool graceful) {
    st_.heartbeat_due.reset();
    if (st_.worker)
      st_.worker->request_stop();
    if (st_.stream) {
      if (graceful)
        st_.stream->close();
      else
        st_.stream->abort();
    }
    if (st_.worker) {
      st_.worker->stop();
      st_.worker.reset();
    }
    st_.stream.reset();
  }

  void shutdown() {
    teardown(false);
    st_.state = connection_state::terminated;
    st_.running = false;
    spdlog::debug("connection terminated");
  }

  // The heartbeat is not correlated and its failure is not escalated.
  void heartbeat() {
    st_.heartbeat_due = clock::now() + st_.options->heartbeat_interval;
    if (!st_.stream)
      return;
    try {
      st_.stream->send(frame::text(encode(heartbeat_envelope())));
      spdlog::trace("heartbeat sent");
    } catch (const std::exception &e) {
      spdlog::warn("heartbeat failed: {}", e.what());
    }
  }

  bool current_epoch(uint64_t epoch) const {
    return st_.worker && epoch == st_.epoch;
  }

  // Called on worker threads; the work happens on the actor thread.
  void inbound_envelope(uint64_t epoch, envelope env) {
    cast([this, epoch, env = std::move(env)]() {
      if (!current_epoch(epoch))
        return;
      spdlog::trace("received {} on {}", env.event, env.topic);
      st_.registry.route(env);
    });
  }

  void inbound_error(uint64_t epoch, std::string error) {
    cast([this, epoch, error = std::move(error)]() {
      if (!current_epoch(epoch))
        return;
      spdlog::warn("transport error: {}", error);
      st_.registry.broadcast(delivery::make_error(error));
    });
  }

  void inbound_closed(uint64_t epoch, int code, std::string reason) {
    cast([this, epoch, code, reason = std::move(reason)]() {
      if (!current_epoch(epoch))
        return;
      spdlog::info("connection closed by peer ({} {})", code, reason);
      teardown(false);
      st_.state = connection_state::disconnected;
      st_.registry.broadcast(delivery::make_closed());
    });
  }

  transport_opener opener_;
  mailbox<command> mailbox_;
  std::atomic<int> live_workers_{0};
  actor_state st_;
  std::mutex terminate_mu_;
  std::thread actor_thread_;
};

/// Starts a connection actor and connects it.
inline std::shared_ptr<connection>
connect(const socket_options &opts,
        transport_opener opener = ws_transport::open) {
  auto conn = std::make_shared<connection>(std::move(opener));
  conn->connect(opts);
  return conn;
}

inline void reconnect(connection &conn) { conn.reconnect(); }

} // namespace phxchan
