#pragma once

#include "phxchan/envelope.hpp"
#include "phxchan/error.hpp"
#include "phxchan/options.hpp"
#include "phxchan/transport.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace phxchan_test {

/// In-memory transport. Frames pushed with emit() come out of receive() in
/// order; every frame the client sends is recorded and, if a responder is
/// set, handed to it as a decoded envelope.
class mock_transport : public phxchan::transport {
public:
  using responder =
      std::function<void(mock_transport &, const phxchan::envelope &)>;

  void send(const phxchan::frame &f) override {
    responder respond;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (closed_ || fail_sends_) {
        throw phxchan::channel_error(phxchan::error_kind::transport,
                                     "mock send failed");
      }
      sent_.push_back(f);
      respond = responder_;
    }
    if (respond && f.kind == phxchan::frame_kind::text)
      respond(*this, phxchan::decode(f.data));
  }

  phxchan::frame receive() override {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this]() { return closed_ || !inbound_.empty(); });
    if (closed_) {
      throw phxchan::channel_error(phxchan::error_kind::transport,
                                   "mock transport closed");
    }
    auto item = std::move(inbound_.front());
    inbound_.pop_front();
    if (item.fail) {
      throw phxchan::channel_error(phxchan::error_kind::transport,
                                   item.f.data);
    }
    return item.f;
  }

  void close() override {
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
      ++close_count_;
    }
    cv_.notify_all();
  }

  void abort() override {
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
      ++abort_count_;
    }
    cv_.notify_all();
  }

  // --- test helpers ---

  void emit(phxchan::frame f) { enqueue({false, std::move(f)}); }

  void emit_envelope(const phxchan::envelope &env) {
    emit(phxchan::frame::text(phxchan::encode(env)));
  }

  void emit_error(const std::string &message) {
    enqueue({true, phxchan::frame::text(message)});
  }

  void set_responder(responder r) {
    std::lock_guard<std::mutex> lock(mu_);
    responder_ = std::move(r);
  }

  void fail_sends(bool on) {
    std::lock_guard<std::mutex> lock(mu_);
    fail_sends_ = on;
  }

  std::vector<phxchan::frame> sent() const {
    std::lock_guard<std::mutex> lock(mu_);
    return sent_;
  }

  /// Sent text frames decoded back into envelopes.
  std::vector<phxchan::envelope> sent_envelopes() const {
    std::vector<phxchan::envelope> out;
    for (const auto &f : sent()) {
      if (f.kind == phxchan::frame_kind::text)
        out.push_back(phxchan::decode(f.data));
    }
    return out;
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
  }
  int close_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return close_count_;
  }
  int abort_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return abort_count_;
  }

private:
  struct item {
    bool fail = false;
    phxchan::frame f;
  };

  void enqueue(item it) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      inbound_.push_back(std::move(it));
    }
    cv_.notify_all();
  }

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<item> inbound_;
  std::vector<phxchan::frame> sent_;
  responder responder_;
  bool closed_ = false;
  bool fail_sends_ = false;
  int close_count_ = 0;
  int abort_count_ = 0;
};

/// Hands out mock transports to a connection and remembers them.
class mock_server {
public:
  phxchan::transport_opener opener() {
    return [this](const phxchan::endpoint &ep,
                  const phxchan::socket_options &) {
      std::lock_guard<std::mutex> lock(mu_);
      if (refuse_) {
        throw phxchan::channel_error(phxchan::error_kind::connect,
                                     "connection refused");
      }
      auto t = std::make_shared<mock_transport>();
      t->set_responder(responder_);
      endpoints_.push_back(ep);
      opened_.push_back(t);
      return std::shared_ptr<phxchan::transport>(t);
    };
  }

  void refuse(bool on) {
    std::lock_guard<std::mutex> lock(mu_);
    refuse_ = on;
  }

  /// Applies to transports opened from now on.
  void set_responder(mock_transport::responder r) {
    std::lock_guard<std::mutex> lock(mu_);
    responder_ = std::move(r);
  }

  std::shared_ptr<mock_transport> last() const {
    std::lock_guard<std::mutex> lock(mu_);
    return opened_.empty() ? nullptr : opened_.back();
  }

  size_t opened() const {
    std::lock_guard<std::mutex> lock(mu_);
    return opened_.size();
  }

  phxchan::endpoint last_endpoint() const {
    std::lock_guard<std::mutex> lock(mu_);
    return endpoints_.back();
  }

private:
  mutable std::mutex mu_;
  std::vector<std::shared_ptr<mock_transport>> opened_;
  std::vector<phxchan::endpoint> endpoints_;
  mock_transport::responder responder_;
  bool refuse_ = false;
};

/// Replies to every request on any topic with {status, response}.
inline mock_transport::responder reply_with(const std::string &status,
                                            nlohmann::json response) {
  return [status, response](mock_transport &t, const phxchan::envelope &env) {
    if (!env.ref || env.topic == phxchan::kHeartbeatTopic)
      return;
    t.emit_envelope(phxchan::envelope{
        env.topic, std::string(phxchan::kEventReply),
        {{"status", status}, {"response", response}}, env.ref});
  };
}

template <typename Pred>
bool wait_for(Pred pred, std::chrono::milliseconds timeout =
                             std::chrono::milliseconds(2000)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred())
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

} // namespace phxchan_test
