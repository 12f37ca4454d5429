#pragma once
#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace StreamPoll {
  using LoggerPointer = std::shared_ptr<spdlog::logger>;

  constexpr size_t logQueueSize = 8192;

  /**
   * @brief The diagnostic context shared by a poller, its executor and its connections
   *
   * @details A `Diagnostics` object owns one sink and a private spdlog thread pool with a single worker
   * thread. Worker tasks only enqueue records; the pool's thread drains them into the sink. Nothing is
   * registered in spdlog's global registry, so several independent pollers can coexist in one process.
   * The object is handed by reference to each component that logs and must outlive them.
   *
   */
  class Diagnostics {
   public:
    /**
     * @brief Create an asynchronous logger writing to `sink`
     *
     * @param name the logger name that appears in each record
     * @param sink the single sink; defaults to a coloured stderr sink
     * @param level the initial level
     */
    explicit Diagnostics(std::string name, spdlog::sink_ptr sink = nullptr,
                         spdlog::level::level_enum level = spdlog::level::info)
        : pool{std::make_shared<spdlog::details::thread_pool>(logQueueSize, 1)} {
      if (!sink) sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      logPtr = std::make_shared<spdlog::async_logger>(std::move(name), std::move(sink), pool,
                                                      spdlog::async_overflow_policy::block);
      logPtr->set_level(level);
    }

    Diagnostics(const Diagnostics &) = delete;
    Diagnostics &operator=(const Diagnostics &) = delete;

    ~Diagnostics() {
      if (logPtr) logPtr->flush();
    }

    /**
     * @brief A diagnostics context that discards everything
     *
     */
    [[nodiscard]] static Diagnostics &null() {
      static Diagnostics quiet{"null", std::make_shared<spdlog::sinks::null_sink_mt>(), spdlog::level::off};
      return quiet;
    }

    [[nodiscard]] const LoggerPointer &logger() const noexcept { return logPtr; }

    /**
     * @brief Set the level from its name (`trace`, `debug`, `info`, `warn`, `error`, `critical`, `off`)
     *
     * @details Unknown names select `off`, as `spdlog::level::from_str` does.
     */
    void setLevel(std::string_view name) { logPtr->set_level(spdlog::level::from_str(std::string(name))); }

    void setLevel(spdlog::level::level_enum level) { logPtr->set_level(level); }

    void flush() { logPtr->flush(); }

   private:
    std::shared_ptr<spdlog::details::thread_pool> pool;
    LoggerPointer logPtr;
  };
};  // namespace StreamPoll
