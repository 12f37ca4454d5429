#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <stdexcept>
#include <string>
#include <vector>

#include "fanoutexecutor.hpp"
#include "streamconnection.hpp"
#include "streampolltypes.hpp"

namespace StreamPoll::Testing {
  /**
   * In-memory streams with XREAD semantics: entries strictly after the requested position, streams without
   * such entries left out of the reply.
   */
  class FakeStore {
   public:
    void add(const StreamName &name, StreamPosition position, std::vector<Field> fields = {}) {
      auto lock = std::scoped_lock(mutex);
      streams[name].push_back(StreamEntry{position, std::move(fields)});
    }

    [[nodiscard]] ReadReply read(const ReadRequest &request) const {
      auto lock = std::scoped_lock(mutex);
      lastRequest = request;
      ReadReply reply;
      for (const auto &s : request.streams) {
        auto found = streams.find(s.name);
        if (found == streams.end()) continue;
        StreamBatch batch{s.name, {}};
        for (const auto &entry : found->second) {
          if (request.count.has_value() && batch.entries.size() >= request.count.value()) break;
          if (s.from < entry.position) batch.entries.push_back(entry);
        }
        if (!batch.entries.empty()) reply.streams.push_back(std::move(batch));
      }
      return reply;
    }

    [[nodiscard]] ReadRequest last() const {
      auto lock = std::scoped_lock(mutex);
      return lastRequest;
    }

   private:
    mutable std::mutex mutex;
    std::map<StreamName, std::vector<StreamEntry>> streams;
    mutable ReadRequest lastRequest;
  };

  /**
   * Counters shared by every connection a connector hands out
   */
  struct FakeStats {
    std::atomic<int> live{0};
    std::atomic<int> peakLive{0};
    std::atomic<int> opened{0};
    std::atomic<int> reads{0};
    std::atomic<int> interrupted{0};
    std::atomic<int> connecting{0};

    void enter() {
      auto now = ++live;
      auto prev = peakLive.load();
      while (prev < now && !peakLive.compare_exchange_weak(prev, now)) {
      }
    }
  };

  struct FakeBehaviour {
    std::chrono::milliseconds delay{0};
    std::optional<Failure> readFailure;
    std::optional<ReadReply> cannedReply;
  };

  class FakeConnection : public Connection {
   public:
    FakeConnection(std::shared_ptr<const FakeStore> st, std::shared_ptr<FakeStats> sts, FakeBehaviour bhv)
        : store{std::move(st)}, stats{std::move(sts)}, behaviour{std::move(bhv)} {
      stats->enter();
      stats->opened++;
    }

    ~FakeConnection() override { stats->live--; }

    [[nodiscard]] std::expected<ReadReply, Failure> read(const ReadRequest &request,
                                                         std::optional<Deadline> deadline) override {
      stats->reads++;
      auto wakeAt = std::chrono::steady_clock::now() + behaviour.delay;
      bool timedOut{false};
      {
        auto lock = std::unique_lock(mutex);
        if (deadline.has_value() && deadline.value() < wakeAt) {
          timedOut = !wake.wait_until(lock, deadline.value(), [this] { return interrupted; });
        } else {
          (void)wake.wait_until(lock, wakeAt, [this] { return interrupted; });
        }
        if (interrupted) return std::unexpected(Failure{ErrorKind::TransportError, "interrupted", {}});
      }
      if (timedOut) return std::unexpected(Failure{ErrorKind::Timeout, "recv timeout", {}});
      if (behaviour.readFailure.has_value()) return std::unexpected(behaviour.readFailure.value());
      if (behaviour.cannedReply.has_value()) return behaviour.cannedReply.value();
      return store->read(request);
    }

    void interrupt() noexcept override {
      auto lock = std::scoped_lock(mutex);
      interrupted = true;
      stats->interrupted++;
      wake.notify_all();
    }

    [[nodiscard]] std::expected<ConnectionPointer, Failure> clone() const override {
      return std::make_unique<FakeConnection>(store, stats, behaviour);
    }

    [[nodiscard]] std::string target() const override { return "redis://fake:6379"; }

   private:
    std::shared_ptr<const FakeStore> store;
    std::shared_ptr<FakeStats> stats;
    FakeBehaviour behaviour;
    std::mutex mutex;
    std::condition_variable wake;
    bool interrupted{false};
  };

  /**
   * Hands out fake connections. The n-th call (counting from 0) may be made to fail to connect or to
   * behave differently through `script`.
   */
  struct FakeConnector {
    struct Plan {
      std::optional<Failure> connectFailure;
      FakeBehaviour behaviour;
    };

    std::shared_ptr<FakeStore> store{std::make_shared<FakeStore>()};
    std::shared_ptr<FakeStats> stats{std::make_shared<FakeStats>()};
    std::shared_ptr<std::atomic<size_t>> calls{std::make_shared<std::atomic<size_t>>(0)};
    std::function<Plan(size_t)> script{[](size_t) { return Plan{}; }};

    [[nodiscard]] Connector connector() const {
      return [store = store, stats = stats, calls = calls, script = script](
                 std::optional<Deadline>, std::stop_token) -> std::expected<ConnectionPointer, Failure> {
        auto plan = script((*calls)++);
        if (plan.connectFailure.has_value()) return std::unexpected(plan.connectFailure.value());
        return std::make_unique<FakeConnection>(store, stats, plan.behaviour);
      };
    }
  };

  /**
   * A connector for one job whose connection sleeps for `delay` and then answers from `store`
   */
  [[nodiscard]] inline Connector delayedConnector(std::shared_ptr<const FakeStore> store,
                                                  std::shared_ptr<FakeStats> stats, std::chrono::milliseconds delay) {
    return [store = std::move(store), stats = std::move(stats),
            delay](std::optional<Deadline>, std::stop_token) -> std::expected<ConnectionPointer, Failure> {
      return std::make_unique<FakeConnection>(store, stats, FakeBehaviour{delay, std::nullopt, std::nullopt});
    };
  }

  [[nodiscard]] inline Connector failingConnector(ErrorKind kind, std::string message) {
    return [kind, message = std::move(message)](std::optional<Deadline>,
                                                std::stop_token) -> std::expected<ConnectionPointer, Failure> {
      return std::unexpected(Failure{kind, message, {}});
    };
  }

  [[nodiscard]] inline Connector throwingConnector(std::string message) {
    return [message = std::move(message)](std::optional<Deadline>,
                                          std::stop_token) -> std::expected<ConnectionPointer, Failure> {
      throw std::runtime_error(message);
    };
  }

  /**
   * A connector stuck in its handshake: it returns only when the task is stopped, and never yields a connection
   */
  [[nodiscard]] inline Connector stuckConnector(std::shared_ptr<FakeStats> stats) {
    return [stats = std::move(stats)](std::optional<Deadline>,
                                      std::stop_token tok) -> std::expected<ConnectionPointer, Failure> {
      stats->connecting++;
      std::mutex mutex;
      std::condition_variable_any stopped;
      {
        auto lock = std::unique_lock(mutex);
        (void)stopped.wait(lock, tok, [] { return false; });
      }
      stats->connecting--;
      return std::unexpected(Failure{ErrorKind::Cancelled, "connect cancelled", {}});
    };
  }

  [[nodiscard]] inline ReadRequest requestFor(std::initializer_list<const char *> names,
                                              StreamPosition from = StreamPosition::beginning()) {
    ReadRequest request;
    for (auto name : names) request.streams.push_back(StreamRead{name, from});
    return request;
  }
};  // namespace StreamPoll::Testing
