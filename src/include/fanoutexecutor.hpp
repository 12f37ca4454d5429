#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <expected>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

#include "streamaggregator.hpp"
#include "streamconnection.hpp"
#include "streampolllog.hpp"
#include "streampolltypes.hpp"

namespace StreamPoll {
  /**
   * @brief How completed tasks are handed to the caller
   *
   * * `Batch` The caller waits in `join()` until every task is accounted for
   * * `Streaming` The caller takes each outcome from `next()` as soon as it is available, in completion order
   */
  enum class DeliveryMode { Batch, Streaming };

  enum class TaskState { Created, Connecting, Reading, Completed, Failed, Cancelled };

  [[nodiscard]] constexpr std::string_view toString(TaskState state) noexcept {
    switch (state) {
      case TaskState::Created:
        return "Created";
      case TaskState::Connecting:
        return "Connecting";
      case TaskState::Reading:
        return "Reading";
      case TaskState::Completed:
        return "Completed";
      case TaskState::Failed:
        return "Failed";
      case TaskState::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
  }

  struct ExecutionPolicy {
    DeliveryMode mode{DeliveryMode::Batch};
    std::optional<size_t> maxInFlight;             /**< cap on simultaneously active tasks; unset is unbounded */
    std::optional<std::chrono::milliseconds> timeout; /**< per-task deadline, measured from admission */
  };

  /**
   * Opens the connection a task will own. The arguments are the task's deadline, if it has one, and its stop
   * token; a connector should give up promptly once a stop is requested.
   */
  using Connector =
      std::function<std::expected<ConnectionPointer, Failure>(std::optional<Deadline>, std::stop_token)>;

  /**
   * @brief One unit of fan-out work: a way to connect and the read to issue on that connection
   *
   */
  struct Job {
    Connector connect;
    ReadRequest request;
  };

  struct Outcome {
    size_t index;
    std::expected<ReadReply, Failure> result;
  };

  /**
   * @brief Run one job to completion, turning every failure into a value
   *
   * @param job the connector and request
   * @param deadline the task deadline, if any
   * @param tok cancellation; passed to the connector, and a stop request interrupts the connection while a read
   * is in progress
   * @param state updated as the task moves from connecting to reading
   *
   * @return the reply, or the `Failure` that ended the task
   *
   * @details Nothing escapes: connector and connection failures are returned as they are, exceptions thrown by
   * either become `TransportError`, and a reply that does not fit the request becomes `MalformedReply`. The
   * connection is released before this function returns. A result obtained after the deadline has passed is
   * reported as `Timeout`.
   *
   */
  [[nodiscard]] inline std::expected<ReadReply, Failure> runIsolated(const Job &job, std::optional<Deadline> deadline,
                                                                     std::stop_token tok,
                                                                     std::atomic<TaskState> &state) {
    auto overdue = [&deadline] {
      return deadline.has_value() && std::chrono::steady_clock::now() >= deadline.value();
    };

    std::expected<ReadReply, Failure> result = std::unexpected(Failure{ErrorKind::Cancelled, "cancelled", {}});
    try {
      state.store(TaskState::Connecting, std::memory_order_release);
      if (!job.connect) return std::unexpected(Failure{ErrorKind::AddressError, "no connector", {}});
      auto connection = job.connect(deadline, tok);
      if (!connection) {
        result = std::unexpected(std::move(connection.error()));
      } else if (connection.value() == nullptr) {
        result = std::unexpected(Failure{ErrorKind::TransportError, "connector returned no connection", {}});
      } else {
        auto &conn = *connection.value();
        std::stop_callback onStop(tok, [&conn] { conn.interrupt(); });
        if (tok.stop_requested()) return result;

        state.store(TaskState::Reading, std::memory_order_release);
        result = conn.read(job.request, deadline);
        if (result) {
          if (auto bad = checkReply(job.request, result.value())) result = std::unexpected(std::move(bad.value()));
        }
      }
    } catch (const std::exception &e) {
      result = std::unexpected(Failure{ErrorKind::TransportError, std::format("task threw: {}", e.what()), {}});
    }

    if (overdue() && (result.has_value() || result.error().kind != ErrorKind::Timeout)) {
      result = std::unexpected(Failure{ErrorKind::Timeout, "task exceeded its deadline", {}});
    }
    return result;
  }

  class FanoutExecutor;

  /**
   * @brief A handle on one task of a `FanoutExecutor`
   *
   * @details Handles are valid for as long as the executor that issued them.
   */
  class TaskHandle {
   public:
    TaskHandle(FanoutExecutor &exec, size_t idx) : executor{&exec}, taskIndex{idx} {}

    [[nodiscard]] size_t index() const noexcept { return taskIndex; }
    [[nodiscard]] TaskState state() const;

    /**
     * @brief Cancel this task; it will not deliver a result afterwards
     *
     */
    void cancel();

    /**
     * @brief Block until this task is accounted for and return its outcome
     *
     */
    [[nodiscard]] Outcome wait() const;

   private:
    FanoutExecutor *executor;
    size_t taskIndex;
  };

  /**
   * @class FanoutExecutor
   *
   * @brief Runs many independent read tasks concurrently, each on its own connection
   *
   * @details `execute()` queues one task per job and starts a pool of worker threads. Each task connects,
   * issues one read, releases its connection and records an outcome; no task waits on another. With a cap of
   * C in the policy the pool has at most C workers, so at most C tasks are connecting or reading at any
   * instant, and queued tasks are admitted in submission order as workers free up. The pending queue and
   * the outcome records are the only state the workers share; both are guarded by one mutex.
   *
   * Every job is accounted for exactly once. A task that fails records its `Failure`; a task that is
   * cancelled, whether still queued or mid-flight, records a `Cancelled` failure that the executor
   * synthesises. The task's own result is discarded and never delivered. `join()` returns all
   * outcomes ordered by index. In `Streaming` mode `next()` hands out completed (not cancelled) outcomes
   * in the order they finished.
   *
   * The destructor cancels whatever is outstanding and joins the workers.
   *
   */
  class FanoutExecutor {
   public:
    explicit FanoutExecutor(ExecutionPolicy pol, LoggerPointer log) : policy{pol}, logger{std::move(log)} {
      if (policy.maxInFlight.has_value() && policy.maxInFlight.value() == 0) {
        throw std::invalid_argument("maxInFlight must be at least 1");
      }
    }

    ~FanoutExecutor() {
      cancelAll();
      workers.clear();
    }

    FanoutExecutor(const FanoutExecutor &) = delete;
    FanoutExecutor(FanoutExecutor &&) = delete;
    FanoutExecutor &operator=(const FanoutExecutor &) = delete;
    FanoutExecutor &operator=(FanoutExecutor &&) = delete;

    /**
     * @brief Start one task per job
     *
     * @return a handle per job, in job order
     *
     * @details An executor runs one set of jobs; calling `execute()` a second time throws `std::logic_error`.
     */
    std::vector<TaskHandle> execute(std::vector<Job> jobs) {
      std::vector<TaskHandle> handles;
      {
        auto lock = std::scoped_lock(stateMutex);
        if (started) throw std::logic_error("FanoutExecutor::execute called twice");
        started = true;

        total = jobs.size();
        tasks.reserve(total);
        records.resize(total);
        handles.reserve(total);
        for (auto i{0u}; i < jobs.size(); i++) {
          auto task = std::make_shared<Task>(i, std::move(jobs[i]));
          pending.push_back(task);
          tasks.push_back(std::move(task));
          handles.emplace_back(*this, i);
        }
      }

      auto poolSize = std::min(total, policy.maxInFlight.value_or(total));
      logger->debug("fan-out of {} tasks on {} workers", total, poolSize);
      workers.reserve(poolSize);
      for (auto i{0u}; i < poolSize; i++) {
        workers.emplace_back([this] { workerLoop(); });
      }
      return handles;
    }

    /**
     * @brief Wait until every task is accounted for
     *
     * @return one outcome per job, ordered by index
     */
    [[nodiscard]] std::vector<Outcome> join() {
      auto lock = std::unique_lock(stateMutex);
      changed.wait(lock, [this] { return accounted == total; });
      std::vector<Outcome> out;
      out.reserve(total);
      for (auto &record : records) out.push_back(record.value());
      return out;
    }

    /**
     * @brief Take the next completed outcome as soon as one is available
     *
     * @return the outcome, or `std::nullopt` once every task is accounted for and all completions have been
     * taken
     *
     * @details Only available in `Streaming` mode. Cancelled tasks are never returned here.
     */
    [[nodiscard]] std::optional<Outcome> next() {
      if (policy.mode != DeliveryMode::Streaming) {
        throw std::logic_error("FanoutExecutor::next requires DeliveryMode::Streaming");
      }
      auto lock = std::unique_lock(stateMutex);
      changed.wait(lock, [this] { return !completions.empty() || accounted == total; });
      if (completions.empty()) return std::nullopt;
      auto index = completions.front();
      completions.pop_front();
      return records[index].value();
    }

    /**
     * @brief Cancel every task that has not finished
     *
     */
    void cancelAll() {
      auto lock = std::scoped_lock(stateMutex);
      size_t cancelled{0};
      for (auto &task : tasks) {
        if (!records[task->index].has_value()) {
          cancelLocked(*task);
          cancelled++;
        }
      }
      if (cancelled > 0) logger->info("cancelled {} outstanding tasks", cancelled);
    }

    void cancel(size_t index) {
      auto lock = std::scoped_lock(stateMutex);
      if (index >= tasks.size()) throw std::out_of_range(std::format("no task {}", index));
      if (!records[index].has_value()) cancelLocked(*tasks[index]);
    }

    [[nodiscard]] TaskState state(size_t index) const {
      auto lock = std::scoped_lock(stateMutex);
      if (index >= tasks.size()) throw std::out_of_range(std::format("no task {}", index));
      return tasks[index]->state.load(std::memory_order_acquire);
    }

    [[nodiscard]] Outcome wait(size_t index) {
      auto lock = std::unique_lock(stateMutex);
      if (index >= tasks.size()) throw std::out_of_range(std::format("no task {}", index));
      changed.wait(lock, [this, index] { return records[index].has_value(); });
      return records[index].value();
    }

    [[nodiscard]] size_t size() const {
      auto lock = std::scoped_lock(stateMutex);
      return total;
    }

    [[nodiscard]] size_t activeCount() const {
      auto lock = std::scoped_lock(stateMutex);
      return active;
    }

    [[nodiscard]] size_t peakActive() const {
      auto lock = std::scoped_lock(stateMutex);
      return peak;
    }

   private:
    struct Task {
      Task(size_t idx, Job j) : index{idx}, job{std::move(j)} {}

      size_t index;
      Job job;
      std::stop_source stop;
      std::atomic<TaskState> state{TaskState::Created};
      bool queued{true};
    };

    ExecutionPolicy policy;
    LoggerPointer logger;
    mutable std::mutex stateMutex;
    std::condition_variable changed;
    std::vector<std::shared_ptr<Task>> tasks;
    std::deque<std::shared_ptr<Task>> pending;
    std::vector<std::optional<Outcome>> records;
    std::deque<size_t> completions;
    size_t total{0};
    size_t accounted{0};
    size_t active{0};
    size_t peak{0};
    bool started{false};
    std::vector<std::jthread> workers;

    void cancelLocked(Task &task) {
      task.stop.request_stop();
      if (task.queued) {
        task.queued = false;
        std::erase_if(pending, [&task](const auto &p) { return p.get() == &task; });
        recordCancelledLocked(task);
      }
    }

    void recordCancelledLocked(Task &task) {
      task.state.store(TaskState::Cancelled, std::memory_order_release);
      records[task.index] = Outcome{task.index, std::unexpected(Failure{ErrorKind::Cancelled, "task cancelled",
                                                                        task.job.request.names()})};
      accounted++;
      changed.notify_all();
    }

    void workerLoop() {
      while (true) {
        std::shared_ptr<Task> task;
        std::optional<Deadline> deadline;
        {
          auto lock = std::scoped_lock(stateMutex);
          if (pending.empty()) return;
          task = std::move(pending.front());
          pending.pop_front();
          task->queued = false;
          active++;
          peak = std::max(peak, active);
          if (policy.timeout.has_value()) deadline = std::chrono::steady_clock::now() + policy.timeout.value();
          logger->trace("task {} admitted, {} active", task->index, active);
        }

        auto result = runIsolated(task->job, deadline, task->stop.get_token(), task->state);

        {
          auto lock = std::scoped_lock(stateMutex);
          active--;
          if (task->stop.stop_requested()) {
            recordCancelledLocked(*task);
            continue;
          }
          if (result) {
            task->state.store(TaskState::Completed, std::memory_order_release);
            logger->debug("task {} completed with {} streams", task->index, result->streams.size());
          } else {
            if (result.error().streams.empty()) result.error().streams = task->job.request.names();
            task->state.store(TaskState::Failed, std::memory_order_release);
            logger->warn("task {} failed: {} ({})", task->index, result.error().message,
                         toString(result.error().kind));
          }
          records[task->index] = Outcome{task->index, std::move(result)};
          completions.push_back(task->index);
          accounted++;
          changed.notify_all();
        }
      }
    }
  };

  inline TaskState TaskHandle::state() const { return executor->state(taskIndex); }

  inline void TaskHandle::cancel() { executor->cancel(taskIndex); }

  inline Outcome TaskHandle::wait() const { return executor->wait(taskIndex); }
};  // namespace StreamPoll
