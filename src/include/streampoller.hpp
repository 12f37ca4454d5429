#pragma once
#include <chrono>
#include <condition_variable>
#include <expected>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <utility>
#include <vector>

#include "fanoutexecutor.hpp"
#include "streamaggregator.hpp"
#include "streamconnection.hpp"
#include "streampollconfig.hpp"
#include "streampolllog.hpp"
#include "streampolltypes.hpp"
#include "streamrequest.hpp"

namespace StreamPoll {
  struct PollOptions {
    std::optional<size_t> concurrencyCap;
    std::optional<std::chrono::milliseconds> timeout;
    size_t streamsPerTask{0}; /**< streams per task and per connection; 0 puts every stream in one task */
    std::optional<size_t> count;
    EmptyStreamPolicy emptyStreams{EmptyStreamPolicy::Omit};

    [[nodiscard]] static PollOptions from(const PollSettings &settings) {
      return PollOptions{settings.concurrency, settings.timeout, settings.streamsPerTask, settings.count,
                         settings.emptyStreams};
    }
  };

  /**
   * @brief The complete accounting of one poll round
   *
   * @details Every requested stream appears exactly once: in `streams` if its task succeeded (and, under
   * `EmptyStreamPolicy::Omit`, only if it had entries), or in the `streams` list of one of the `failures`.
   */
  struct PollResult {
    StreamMap streams;
    std::vector<Failure> failures;

    [[nodiscard]] bool ok() const noexcept { return failures.empty(); }
  };

  /**
   * @brief Fixed cadence sleeps between rounds; reactive cadence lets the server block until data arrives
   *
   */
  enum class Cadence { Fixed, Reactive };

  struct FollowOptions {
    PollOptions poll;
    Cadence cadence{Cadence::Fixed};
    std::chrono::milliseconds interval{1000}; /**< pause between rounds (fixed cadence) */
    unsigned blockMillis{1000};               /**< server-side wait per round (reactive cadence) */

    [[nodiscard]] static FollowOptions from(const PollSettings &settings) {
      FollowOptions out{PollOptions::from(settings)};
      out.interval = settings.interval;
      if (settings.blockMillis.has_value()) {
        out.cadence = Cadence::Reactive;
        out.blockMillis = settings.blockMillis.value();
      }
      return out;
    }
  };

  using TaskCallback = std::function<void(const ReadRequest &, const std::expected<StreamMap, Failure> &)>;
  using RoundCallback = std::function<void(const PollResult &)>;

  /**
   * @class StreamPoller
   *
   * @brief Reads many streams concurrently and reports a uniform, complete result
   *
   * @details A poll builds one request from the stream names and start positions, splits it into tasks of
   * `streamsPerTask` streams, and runs the tasks on a `FanoutExecutor`. Each task opens its own connection
   * through the connector, so the connector must be safe to call from several threads at once
   * (`Provisioner::open` is). Failed tasks never affect the others; their failures are listed in the result
   * with the streams they covered.
   *
   */
  class StreamPoller {
   public:
    StreamPoller(Connector conn, Diagnostics &diag) : connector{std::move(conn)}, diagnostics{diag} {}

    StreamPoller(const Provisioner &provisioner, Diagnostics &diag)
        : StreamPoller(
              [provisioner](std::optional<Deadline> deadline, std::stop_token tok) {
                return provisioner.open(deadline, std::move(tok));
              },
              diag) {}

    /**
     * @brief Poll every stream once from the same start position
     *
     */
    [[nodiscard]] PollResult poll(std::span<const StreamName> names, StreamPosition start,
                                  const PollOptions &options = {}) {
      return run(prepare(buildRequest(names, start), options), options, DeliveryMode::Batch, {}, {});
    }

    /**
     * @brief Poll every stream once from its own start position
     *
     * @throws RequestError if `names` and `positions` differ in length or a name is repeated
     */
    [[nodiscard]] PollResult poll(std::span<const StreamName> names, std::span<const StreamPosition> positions,
                                  const PollOptions &options = {}) {
      return run(prepare(buildRequest(names, positions), options), options, DeliveryMode::Batch, {}, {});
    }

    /**
     * @brief Poll once, handing each task's result to `onTask` as soon as it completes
     *
     * @return the same complete accounting `poll()` returns
     *
     * @details `onTask` runs on the calling thread, in completion order. Cancelled tasks are not passed to it.
     */
    PollResult pollEach(std::span<const StreamName> names, std::span<const StreamPosition> positions,
                        const PollOptions &options, const TaskCallback &onTask, std::stop_token tok = {}) {
      return run(prepare(buildRequest(names, positions), options), options, DeliveryMode::Streaming, onTask, tok);
    }

    /**
     * @brief Poll repeatedly until `tok` is stopped
     *
     * @param names the streams to follow
     * @param start where each stream starts
     * @param options cadence and per-round options
     * @param onRound called on the calling thread with the result of each round
     * @param tok stops the loop; a round in progress is cancelled
     *
     * @return the number of rounds completed
     *
     * @details Each stream resumes after the last entry delivered for it. A stream whose task failed keeps its
     * position and is read again in the next round.
     */
    size_t follow(std::span<const StreamName> names, StreamPosition start, const FollowOptions &options,
                  const RoundCallback &onRound, std::stop_token tok) {
      std::vector<StreamName> streams(names.begin(), names.end());
      std::vector<StreamPosition> positions(streams.size(), start);
      (void)buildRequest(streams, positions);

      auto roundOptions = options.poll;
      if (options.cadence == Cadence::Reactive && roundOptions.timeout.has_value()) {
        roundOptions.timeout = roundOptions.timeout.value() + std::chrono::milliseconds{options.blockMillis};
      }

      size_t rounds{0};
      std::mutex pauseMutex;
      std::condition_variable_any pause;

      while (!tok.stop_requested()) {
        auto request = prepare(buildRequest(streams, positions), roundOptions);
        if (options.cadence == Cadence::Reactive) request.blockMillis = options.blockMillis;

        auto result = run(request, roundOptions, DeliveryMode::Batch, {}, tok);
        if (tok.stop_requested()) break;
        rounds++;

        for (auto i{0u}; i < streams.size(); i++) {
          auto found = result.streams.find(streams[i]);
          if (found != result.streams.end() && !found->second.empty()) {
            positions[i] = found->second.back().position;
          }
        }
        onRound(result);

        if (options.cadence == Cadence::Fixed) {
          auto lock = std::unique_lock(pauseMutex);
          (void)pause.wait_for(lock, tok, options.interval, [] { return false; });
        }
      }
      diagnostics.logger()->info("follow stopped after {} rounds", rounds);
      return rounds;
    }

   private:
    Connector connector;
    Diagnostics &diagnostics;

    [[nodiscard]] static ReadRequest prepare(ReadRequest request, const PollOptions &options) {
      request.count = options.count;
      return request;
    }

    PollResult run(const ReadRequest &request, const PollOptions &options, DeliveryMode mode,
                   const TaskCallback &onTask, std::stop_token tok) {
      auto batches = partitionRequest(request, options.streamsPerTask);

      std::vector<Job> jobs;
      jobs.reserve(batches.size());
      for (auto &batch : batches) jobs.push_back(Job{connector, std::move(batch)});

      FanoutExecutor executor(ExecutionPolicy{mode, options.concurrencyCap, options.timeout},
                              diagnostics.logger());
      (void)executor.execute(jobs);
      std::stop_callback onStop(tok, [&executor] { executor.cancelAll(); });

      if (mode == DeliveryMode::Streaming) {
        while (auto outcome = executor.next()) {
          const auto &taskRequest = jobs[outcome->index].request;
          if (outcome->result) {
            auto names = taskRequest.names();
            onTask(taskRequest, aggregate(outcome->result.value(), options.emptyStreams, names));
          } else {
            onTask(taskRequest, std::unexpected(outcome->result.error()));
          }
        }
      }

      PollResult result;
      for (auto &outcome : executor.join()) {
        if (outcome.result) {
          merge(result.streams, outcome.result.value());
          if (options.emptyStreams == EmptyStreamPolicy::Include) {
            includeEmpty(result.streams, jobs[outcome.index].request.names());
          }
        } else {
          result.failures.push_back(std::move(outcome.result.error()));
        }
      }

      diagnostics.logger()->info("polled {} streams in {} tasks: {} with entries, {} failed tasks",
                                 request.size(), jobs.size(), result.streams.size(), result.failures.size());
      return result;
    }
  };

  /**
   * @brief Poll streams once against a configured endpoint
   *
   * @param provisioner opens the connections
   * @param names the streams to read
   * @param startPositions one start position per stream
   * @param concurrencyCap the most tasks in flight at once; unset is unbounded
   * @param timeout the per-task deadline; unset is none
   * @param diagnostics where the poll logs
   *
   * @details One task (and one connection) is used per stream, so every stream fails or succeeds on its own.
   */
  [[nodiscard]] inline PollResult pollStreams(const Provisioner &provisioner, std::span<const StreamName> names,
                                              std::span<const StreamPosition> startPositions,
                                              std::optional<size_t> concurrencyCap,
                                              std::optional<std::chrono::milliseconds> timeout,
                                              Diagnostics &diagnostics) {
    StreamPoller poller(provisioner, diagnostics);
    PollOptions options;
    options.concurrencyCap = concurrencyCap;
    options.timeout = timeout;
    options.streamsPerTask = 1;
    return poller.poll(names, startPositions, options);
  }
};  // namespace StreamPoll
