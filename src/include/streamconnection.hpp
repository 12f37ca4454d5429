#pragma once

#include <hiredis/hiredis.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <expected>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "streampollconfig.hpp"
#include "streampolllog.hpp"
#include "streampolltypes.hpp"
#include "streamrequest.hpp"

namespace StreamPoll {
  using Deadline = std::chrono::steady_clock::time_point;

  inline std::once_flag sigSetup;

  constexpr unsigned tcpTimeoutMillis = 3600 * 1000;
  constexpr std::chrono::seconds connectTimeout{10}; /**< bounds connect and each handshake step without a deadline */

  /**
   * @brief The custom deleter for the RAII `std::unique_ptr` that encapsulates a `redisReply` pointer
   *
   */
  struct ReplyDeleter {
    void operator()(redisReply *reply) const noexcept {
      if (reply) ::freeReplyObject(reply);
    }
  };

  /**
   * @brief The custom deleter for the RAII `std::unique_ptr` that encapsulates a `redisContext` pointer
   *
   */
  struct ContextDeleter {
    void operator()(redisContext *ctx) const noexcept {
      if (ctx) ::redisFree(ctx);
    }
  };

  using ReplyPointer = std::unique_ptr<redisReply, ReplyDeleter>;
  using ContextPointer = std::unique_ptr<redisContext, ContextDeleter>;

  class Connection;
  using ConnectionPointer = std::unique_ptr<Connection>;

  /**
   * @class Connection
   *
   * @brief A live, authenticated channel to the stream store
   *
   * @details A connection is owned by exactly one worker task at a time. Apart from `interrupt()`, none of
   * its member functions may be called concurrently. `clone()` opens an independent connection with the same
   * parameters; the two share no socket state.
   *
   */
  class Connection {
   public:
    virtual ~Connection() = default;

    /**
     * @brief Issue one batched, non-blocking read
     *
     * @param request the streams and start positions to read
     * @param deadline if set, the read fails with `Timeout` once this instant has passed
     *
     * @return the reply, or a `Failure` describing why none was obtained
     */
    [[nodiscard]] virtual std::expected<ReadReply, Failure> read(const ReadRequest &request,
                                                                 std::optional<Deadline> deadline) = 0;

    /**
     * @brief Unblock a read in progress from another thread
     *
     * @details The interrupted read returns a `TransportError`. The connection is unusable afterwards.
     */
    virtual void interrupt() noexcept = 0;

    [[nodiscard]] virtual std::expected<ConnectionPointer, Failure> clone() const = 0;

    /**
     * @brief The canonical target string, with any secret masked
     *
     */
    [[nodiscard]] virtual std::string target() const = 0;
  };

  /**
   * @brief Classify an error reply sent by the server
   *
   */
  [[nodiscard]] inline ErrorKind classifyErrorReply(std::string_view message) noexcept {
    if (message.starts_with("NOAUTH") || message.starts_with("WRONGPASS") || message.starts_with("NOPERM")) {
      return ErrorKind::AuthError;
    }
    return ErrorKind::CommandError;
  }

  /**
   * @brief Convert the error state of a hiredis context into a `Failure`
   *
   * @param ctx the context; may be `nullptr` if allocation failed
   * @param connecting whether the error happened while the connection was being established
   *
   * @details Name resolution failures are reported by hiredis as `REDIS_ERR_OTHER` during connect; these
   * become `AddressError`. Socket timeouts become `Timeout`; protocol errors become `MalformedReply`;
   * everything else is a `TransportError`.
   */
  [[nodiscard]] inline Failure contextFailure(const redisContext *ctx, bool connecting = false) {
    if (ctx == nullptr) return Failure{ErrorKind::TransportError, "could not allocate redis context", {}};
    std::string message{ctx->errstr};
    switch (ctx->err) {
      case REDIS_ERR_TIMEOUT:
        return Failure{ErrorKind::Timeout, std::move(message), {}};
      case REDIS_ERR_IO:
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ETIMEDOUT) {
          return Failure{ErrorKind::Timeout, std::move(message), {}};
        }
        return Failure{ErrorKind::TransportError, std::move(message), {}};
      case REDIS_ERR_PROTOCOL:
        return Failure{ErrorKind::MalformedReply, std::move(message), {}};
      case REDIS_ERR_OTHER:
        return Failure{connecting ? ErrorKind::AddressError : ErrorKind::TransportError, std::move(message), {}};
      default:
        return Failure{ErrorKind::TransportError, std::move(message), {}};
    }
  }

  namespace detail {
    [[nodiscard]] inline std::string_view replyText(const redisReply *reply) noexcept {
      if (reply->str == nullptr) return {};
      return std::string_view{reply->str, reply->len};
    }

    [[nodiscard]] inline bool isArrayLike(const redisReply *reply) noexcept {
      return reply->type == REDIS_REPLY_ARRAY || reply->type == REDIS_REPLY_SET ||
             reply->type == REDIS_REPLY_PUSH;
    }

    [[nodiscard]] inline bool isText(const redisReply *reply) noexcept {
      return reply->type == REDIS_REPLY_STRING || reply->type == REDIS_REPLY_STATUS ||
             reply->type == REDIS_REPLY_VERB;
    }

    inline std::unexpected<Failure> malformed(std::string message) {
      return std::unexpected(Failure{ErrorKind::MalformedReply, std::move(message), {}});
    }

    [[nodiscard]] inline std::expected<FieldValue, Failure> parseValue(const redisReply *reply) {
      if (reply == nullptr || reply->type == REDIS_REPLY_NIL) return FieldValue{};
      if (isText(reply)) return FieldValue{std::string(replyText(reply))};
      if (reply->type == REDIS_REPLY_INTEGER) return FieldValue{static_cast<long long>(reply->integer)};
      return malformed(std::format("unexpected field value of reply type {}", reply->type));
    }

    [[nodiscard]] inline std::expected<StreamEntry, Failure> parseEntry(const redisReply *reply) {
      if (reply == nullptr || !isArrayLike(reply) || reply->elements != 2) {
        return malformed("stream entry is not an [id, fields] pair");
      }
      auto *id = reply->element[0];
      if (id == nullptr || !isText(id)) return malformed("stream entry id is not a string");
      auto position = StreamPosition::parse(replyText(id));
      if (!position) return malformed(std::format("unparsable stream entry id '{}'", replyText(id)));

      StreamEntry entry{position.value(), {}};
      auto *fields = reply->element[1];
      // a nil field list marks an entry deleted after it was delivered
      if (fields == nullptr || fields->type == REDIS_REPLY_NIL) return entry;
      if (!isArrayLike(fields) && fields->type != REDIS_REPLY_MAP) {
        return malformed(std::format("fields of entry {} are not a list", entry.position));
      }
      if (fields->elements % 2 != 0) {
        return malformed(std::format("entry {} has an odd number of field elements", entry.position));
      }

      entry.fields.reserve(fields->elements / 2);
      for (auto i{0u}; i < fields->elements; i += 2) {
        auto *name = fields->element[i];
        if (name == nullptr || !isText(name)) {
          return malformed(std::format("field name of entry {} is not a string", entry.position));
        }
        auto value = parseValue(fields->element[i + 1]);
        if (!value) return std::unexpected(std::move(value.error()));
        entry.fields.emplace_back(std::string(replyText(name)), std::move(value.value()));
      }
      return entry;
    }

    [[nodiscard]] inline std::expected<StreamBatch, Failure> parseBatch(const redisReply *name,
                                                                       const redisReply *entries) {
      if (name == nullptr || !isText(name)) return malformed("stream name is not a string");
      StreamBatch batch{std::string(replyText(name)), {}};
      if (entries == nullptr || !isArrayLike(entries)) {
        return malformed(std::format("entries of stream '{}' are not a list", batch.name));
      }

      batch.entries.reserve(entries->elements);
      for (auto i{0u}; i < entries->elements; i++) {
        auto entry = parseEntry(entries->element[i]);
        if (!entry) return std::unexpected(std::move(entry.error()));
        if (!batch.entries.empty() && !(batch.entries.back().position < entry->position)) {
          return malformed(std::format("positions of stream '{}' do not increase at {}", batch.name,
                                       entry->position));
        }
        batch.entries.push_back(std::move(entry.value()));
      }
      return batch;
    }
  };  // namespace detail

  /**
   * @brief Convert an `XREAD` reply into a `ReadReply`
   *
   * @param reply the reply as returned by hiredis
   *
   * @return the normalised reply, or a `Failure` of kind `MalformedReply`
   *
   * @details Both reply formats are understood: RESP2 sends an array of `[name, entries]` pairs, RESP3 a map
   * from name to entries. A nil reply means no stream had anything to return and yields an empty
   * `ReadReply`. The order of streams in the reply is preserved. Entry positions must strictly increase
   * within each stream.
   *
   */
  [[nodiscard]] inline std::expected<ReadReply, Failure> parseReadReply(const redisReply *reply) {
    if (reply == nullptr) return detail::malformed("no reply");
    if (reply->type == REDIS_REPLY_NIL) return ReadReply{};
    if (reply->type == REDIS_REPLY_ERROR) {
      return std::unexpected(
          Failure{classifyErrorReply(detail::replyText(reply)), std::string(detail::replyText(reply)), {}});
    }

    ReadReply out;
    if (reply->type == REDIS_REPLY_MAP) {
      if (reply->elements % 2 != 0) return detail::malformed("map reply with an odd number of elements");
      out.streams.reserve(reply->elements / 2);
      for (auto i{0u}; i < reply->elements; i += 2) {
        auto batch = detail::parseBatch(reply->element[i], reply->element[i + 1]);
        if (!batch) return std::unexpected(std::move(batch.error()));
        out.streams.push_back(std::move(batch.value()));
      }
      return out;
    }

    if (!detail::isArrayLike(reply)) {
      return detail::malformed(std::format("unexpected XREAD reply type {}", reply->type));
    }
    out.streams.reserve(reply->elements);
    for (auto i{0u}; i < reply->elements; i++) {
      auto *pair = reply->element[i];
      if (pair == nullptr || !detail::isArrayLike(pair) || pair->elements != 2) {
        return detail::malformed("stream reply is not a [name, entries] pair");
      }
      auto batch = detail::parseBatch(pair->element[0], pair->element[1]);
      if (!batch) return std::unexpected(std::move(batch.error()));
      out.streams.push_back(std::move(batch.value()));
    }
    return out;
  }

  /**
   * @brief Send a command in ARGV format on a context
   *
   * @return the reply, or `nullptr` if the context is in an error state
   */
  [[nodiscard]] inline ReplyPointer commandArgv(redisContext *ctx, std::span<const std::string_view> args) {
    std::vector<const char *> argv;
    argv.reserve(args.size());
    std::vector<size_t> lens;
    lens.reserve(args.size());
    for (auto sv : args) {
      argv.push_back(sv.data());
      lens.push_back(sv.size());
    }
    return ReplyPointer(static_cast<redisReply *>(
        ::redisCommandArgv(ctx, static_cast<int>(argv.size()), argv.data(), lens.data())));
  }

  [[nodiscard]] inline std::optional<timeval> remainingTime(std::optional<Deadline> deadline) {
    if (!deadline.has_value()) return timeval{0, 0};
    auto left = std::chrono::duration_cast<std::chrono::microseconds>(deadline.value() -
                                                                      std::chrono::steady_clock::now());
    if (left.count() <= 0) return std::nullopt;
    return timeval{static_cast<time_t>(left.count() / 1000000), static_cast<suseconds_t>(left.count() % 1000000)};
  }

  inline void ignoreSigpipe() {
    std::call_once(sigSetup, [] {
      struct sigaction sigAct{};
      sigAct.sa_flags = 0;
      sigemptyset(&sigAct.sa_mask);
      sigAct.sa_handler = SIG_IGN;
      sigaction(SIGPIPE, &sigAct, nullptr);
    });
  }

  [[nodiscard]] inline std::expected<ConnectionPointer, Failure> openConnection(const Config &cfg,
                                                                                std::optional<Deadline> deadline,
                                                                                LoggerPointer log,
                                                                                std::stop_token tok = {});

  /**
   * @class RedisConnection
   *
   * @brief A `Connection` over a blocking hiredis context
   *
   * @details Socket timeouts are set from the deadline of each read, so a read never outlives its task.
   * `interrupt()` shuts the socket down, which makes a blocked `recv` return at once.
   *
   */
  class RedisConnection : public Connection {
   public:
    RedisConnection(Config cfg, ContextPointer ctx, LoggerPointer log)
        : config{std::move(cfg)}, context{std::move(ctx)}, logger{std::move(log)}, socket{context->fd} {}

    ~RedisConnection() override {
      auto lock = std::scoped_lock(socketMutex);
      socket = -1;
    }

    RedisConnection(const RedisConnection &) = delete;
    RedisConnection &operator=(const RedisConnection &) = delete;

    [[nodiscard]] std::expected<ReadReply, Failure> read(const ReadRequest &request,
                                                         std::optional<Deadline> deadline) override {
      if (context->err) return std::unexpected(contextFailure(context.get()));

      auto timeout = remainingTime(deadline);
      if (!timeout) return std::unexpected(Failure{ErrorKind::Timeout, "deadline passed before XREAD", {}});
      if (::redisSetTimeout(context.get(), timeout.value()) != REDIS_OK) {
        return std::unexpected(contextFailure(context.get()));
      }

      auto args = xreadArguments(request);
      std::vector<std::string_view> argv(args.begin(), args.end());
      auto replyPtr = commandArgv(context.get(), argv);
      if (replyPtr == nullptr || context->err) return std::unexpected(contextFailure(context.get()));
      logger->trace("XREAD {} streams on {} -> reply type {}", request.size(), target(), replyPtr->type);
      return parseReadReply(replyPtr.get());
    }

    void interrupt() noexcept override {
      auto lock = std::scoped_lock(socketMutex);
      if (socket >= 0) (void)::shutdown(socket, SHUT_RDWR);
    }

    [[nodiscard]] std::expected<ConnectionPointer, Failure> clone() const override {
      return openConnection(config, std::nullopt, logger, {});
    }

    [[nodiscard]] std::string target() const override { return config.target(true); }

   private:
    Config config;
    ContextPointer context;
    LoggerPointer logger;
    std::mutex socketMutex;
    int socket;
  };

  /**
   * @brief Open, authenticate and prepare a connection
   *
   * @param cfg the connection parameters
   * @param deadline if set, bounds the time spent connecting and in the handshake; otherwise `connectTimeout`
   * bounds each step
   * @param log the logger of the owning component
   * @param tok a stop request shuts the socket down and ends the handshake with `Cancelled`
   *
   * @details The endpoint is validated before any I/O. When a secret is configured, `AUTH` is sent
   * (with the username if one is set). A configured database is selected, and RESP3 is negotiated if
   * requested. Each step's failure is reported with its own kind.
   */
  [[nodiscard]] inline std::expected<ConnectionPointer, Failure> openConnection(const Config &cfg,
                                                                                std::optional<Deadline> deadline,
                                                                                LoggerPointer log,
                                                                                std::stop_token tok) {
    ignoreSigpipe();
    auto endpoint = cfg.endpoint();
    if (auto invalid = validateEndpoint(endpoint)) return std::unexpected(std::move(invalid.value()));

    auto cancelled = [] { return std::unexpected(Failure{ErrorKind::Cancelled, "connect cancelled", {}}); };
    if (tok.stop_requested()) return cancelled();

    auto stepTimeout = [&deadline]() -> std::optional<timeval> {
      if (!deadline.has_value()) return timeval{static_cast<time_t>(connectTimeout.count()), 0};
      return remainingTime(deadline);
    };

    auto timeout = stepTimeout();
    if (!timeout) return std::unexpected(Failure{ErrorKind::Timeout, "deadline passed before connect", {}});

    ContextPointer ctx(::redisConnectWithTimeout(endpoint.host.c_str(), endpoint.port, timeout.value()));
    if (ctx == nullptr || ctx->err) {
      auto failure = contextFailure(ctx.get(), true);
      log->warn("connect to {} failed: {} ({})", cfg.target(true), failure.message, toString(failure.kind));
      return std::unexpected(std::move(failure));
    }

    // from here on a stop request unblocks any handshake step in progress
    std::mutex socketMutex;
    int socket{ctx->fd};
    std::stop_callback onStop(tok, [&socketMutex, &socket] {
      auto lock = std::scoped_lock(socketMutex);
      if (socket >= 0) (void)::shutdown(socket, SHUT_RDWR);
    });
    auto release = [&socketMutex, &socket] {
      auto lock = std::scoped_lock(socketMutex);
      socket = -1;
    };

    auto left = stepTimeout();
    if (!left) return std::unexpected(Failure{ErrorKind::Timeout, "deadline passed during connect", {}});
    if (::redisSetTimeout(ctx.get(), left.value()) != REDIS_OK) {
      return std::unexpected(contextFailure(ctx.get()));
    }

    auto handshake = [&](std::span<const std::string_view> args, ErrorKind rejected) -> std::optional<Failure> {
      if (tok.stop_requested()) return Failure{ErrorKind::Cancelled, "connect cancelled", {}};
      auto replyPtr = commandArgv(ctx.get(), args);
      if (tok.stop_requested()) return Failure{ErrorKind::Cancelled, "connect cancelled", {}};
      if (replyPtr == nullptr || ctx->err) return contextFailure(ctx.get());
      if (replyPtr->type == REDIS_REPLY_ERROR) {
        return Failure{rejected, std::format("{} rejected: {}", args[0], detail::replyText(replyPtr.get())), {}};
      }
      return std::nullopt;
    };

    auto credentials = cfg.credentials();
    if (credentials.hasSecret()) {
      std::optional<Failure> authFailure;
      if (credentials.username.has_value()) {
        auto argv = std::array<std::string_view, 3>{"AUTH", credentials.username.value(),
                                                    credentials.password.value()};
        authFailure = handshake(argv, ErrorKind::AuthError);
      } else {
        auto argv = std::array<std::string_view, 2>{"AUTH", credentials.password.value()};
        authFailure = handshake(argv, ErrorKind::AuthError);
      }
      if (authFailure) {
        log->warn("authentication on {} failed: {}", cfg.target(true), authFailure->message);
        return std::unexpected(std::move(authFailure.value()));
      }
    }

    if (cfg.database().has_value()) {
      auto dbText = std::to_string(cfg.database().value());
      auto argv = std::array<std::string_view, 2>{"SELECT", dbText};
      if (auto failure = handshake(argv, ErrorKind::CommandError)) return std::unexpected(std::move(failure.value()));
    }

    if (cfg.resp3()) {
      auto argv = std::array<std::string_view, 2>{"HELLO", "3"};
      if (auto failure = handshake(argv, ErrorKind::CommandError)) return std::unexpected(std::move(failure.value()));
    }

    release();
    if (tok.stop_requested()) return cancelled();

    if ((::redisEnableKeepAlive(ctx.get())) != REDIS_OK) {
      return std::unexpected(Failure{ErrorKind::TransportError, "enable keep-alive failed", {}});
    }
    if ((::redisSetTcpUserTimeout(ctx.get(), tcpTimeoutMillis)) != REDIS_OK) {
      return std::unexpected(Failure{ErrorKind::TransportError, "set TCP user timeout failed", {}});
    }

    log->debug("connected to {}", cfg.target(true));
    return std::make_unique<RedisConnection>(cfg, std::move(ctx), std::move(log));
  }

  /**
   * @class Provisioner
   *
   * @brief Opens independent connections to one configured endpoint
   *
   * @details A `Provisioner` holds only connection parameters. It is cheap to copy and may be shared by
   * any number of workers; every call to `open()` dials a new socket that the caller then owns.
   *
   */
  class Provisioner {
   public:
    explicit Provisioner(Config cfg, LoggerPointer log) : config{std::move(cfg)}, logger{std::move(log)} {}

    /**
     * @brief Construct a provisioner for an endpoint and optional credentials
     *
     */
    Provisioner(const Endpoint &endpoint, const Credentials &credentials, LoggerPointer log)
        : config{endpoint.host, endpoint.port, std::nullopt, credentials.username, credentials.password},
          logger{std::move(log)} {}

    [[nodiscard]] std::expected<ConnectionPointer, Failure> open(std::optional<Deadline> deadline = std::nullopt,
                                                                 std::stop_token tok = {}) const {
      return openConnection(config, deadline, logger, std::move(tok));
    }

    [[nodiscard]] const Config &configuration() const noexcept { return config; }

   private:
    Config config;
    LoggerPointer logger;
  };
};  // namespace StreamPoll
