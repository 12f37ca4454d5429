#pragma once
#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <toml++/toml.hpp>
#include <utility>
#include <vector>

#include "streampolltypes.hpp"

namespace StreamPoll {
  namespace fs = std::filesystem;

  constexpr const char *const DEFAULT_HOST = "localhost";
  constexpr int DEFAULT_PORT = 6379;
  constexpr std::string_view targetScheme = "redis://";

  /**
   * @brief The host and port of a Redis server
   *
   */
  struct Endpoint {
    std::string host{DEFAULT_HOST};
    int port{DEFAULT_PORT};

    bool operator==(const Endpoint &) const = default;
  };

  /**
   * @brief Optional credentials for `AUTH`
   *
   * @details A secret that is absent or empty means no authentication is attempted.
   */
  struct Credentials {
    std::optional<std::string> username;
    std::optional<std::string> password;

    [[nodiscard]] bool hasSecret() const noexcept { return password.has_value() && !password->empty(); }

    bool operator==(const Credentials &) const = default;
  };

  /**
   * @brief Everything a connection target string can carry
   *
   */
  struct Target {
    Endpoint endpoint;
    Credentials credentials;
    std::optional<int> db;
  };

  /**
   * @brief Check that an endpoint can be dialled
   *
   * @return a `Failure` of kind `AddressError` if the host is empty or the port is out of range
   */
  [[nodiscard]] inline std::optional<Failure> validateEndpoint(const Endpoint &endpoint) {
    if (endpoint.host.empty()) {
      return Failure{ErrorKind::AddressError, "empty host name", {}};
    }
    if (endpoint.port < 1 || endpoint.port > 65535) {
      return Failure{ErrorKind::AddressError, std::format("port {} out of range", endpoint.port), {}};
    }
    return std::nullopt;
  }

  /**
   * @brief Build the canonical connection target string
   *
   * @param endpoint the server host and port
   * @param credentials the credentials; the secret is embedded only if it is non-empty
   * @param db the database number, appended as a path segment if present
   * @param maskSecret replace the secret with `***` (for logs)
   *
   * @return a string of the form `redis://[[user]:secret@]host:port[/db]`
   *
   * @details When no secret is configured the credential segment is left out altogether: the result never
   * contains an empty `:@` segment. IPv6 literals are bracketed.
   */
  [[nodiscard]] inline std::string connectionTarget(const Endpoint &endpoint, const Credentials &credentials,
                                                    std::optional<int> db = std::nullopt,
                                                    bool maskSecret = false) {
    std::string target{targetScheme};
    if (credentials.hasSecret()) {
      target += std::format("{}:{}@", credentials.username.value_or(""),
                            maskSecret ? "***" : credentials.password.value());
    }
    if (endpoint.host.find(':') != std::string::npos) {
      target += std::format("[{}]:{}", endpoint.host, endpoint.port);
    } else {
      target += std::format("{}:{}", endpoint.host, endpoint.port);
    }
    if (db.has_value()) target += std::format("/{}", db.value());
    return target;
  }

  /**
   * @brief Parse a `redis://` target string
   *
   * @param url `redis://[[user]:password@]host[:port][/db]`
   *
   * @return the parsed target or a `Failure` of kind `AddressError`
   */
  [[nodiscard]] inline std::expected<Target, Failure> parseTarget(std::string_view url) {
    auto fail = [url](std::string_view why) {
      return std::unexpected(Failure{ErrorKind::AddressError, std::format("bad target '{}': {}", url, why), {}});
    };

    if (!url.starts_with(targetScheme)) return fail("expected redis:// scheme");
    auto rest = url.substr(targetScheme.size());

    Target target;

    if (auto at = rest.rfind('@'); at != std::string_view::npos) {
      auto userinfo = rest.substr(0, at);
      rest = rest.substr(at + 1);
      if (auto colon = userinfo.find(':'); colon != std::string_view::npos) {
        if (colon > 0) target.credentials.username = std::string(userinfo.substr(0, colon));
        auto secret = userinfo.substr(colon + 1);
        if (!secret.empty()) target.credentials.password = std::string(secret);
      } else if (!userinfo.empty()) {
        target.credentials.username = std::string(userinfo);
      }
    }

    std::string_view hostport = rest;
    if (auto slash = rest.find('/'); slash != std::string_view::npos) {
      hostport = rest.substr(0, slash);
      auto dbText = rest.substr(slash + 1);
      if (!dbText.empty()) {
        int db{0};
        auto [ptr, ec] = std::from_chars(dbText.data(), dbText.data() + dbText.size(), db);
        if (ec != std::errc{} || ptr != dbText.data() + dbText.size() || db < 0) return fail("bad database number");
        target.db = db;
      }
    }

    std::string_view portText;
    if (hostport.starts_with('[')) {
      auto close = hostport.find(']');
      if (close == std::string_view::npos) return fail("unterminated IPv6 literal");
      target.endpoint.host = std::string(hostport.substr(1, close - 1));
      auto after = hostport.substr(close + 1);
      if (!after.empty()) {
        if (!after.starts_with(':')) return fail("junk after IPv6 literal");
        portText = after.substr(1);
      }
    } else if (auto colon = hostport.rfind(':'); colon != std::string_view::npos) {
      target.endpoint.host = std::string(hostport.substr(0, colon));
      portText = hostport.substr(colon + 1);
    } else {
      target.endpoint.host = std::string(hostport);
    }

    if (!portText.empty()) {
      int port{0};
      auto [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
      if (ec != std::errc{} || ptr != portText.data() + portText.size()) return fail("bad port");
      target.endpoint.port = port;
    }

    if (auto invalid = validateEndpoint(target.endpoint)) return fail(invalid->message);
    return target;
  }

  /**
   * @brief Poll settings read from the `[poll]` section of a configuration file
   *
   */
  struct PollSettings {
    std::vector<StreamName> streams;
    StreamPosition start{StreamPosition::beginning()};
    std::optional<size_t> concurrency;
    std::optional<std::chrono::milliseconds> timeout;
    size_t streamsPerTask{0};
    std::optional<size_t> count;
    EmptyStreamPolicy emptyStreams{EmptyStreamPolicy::Omit};
    std::chrono::milliseconds interval{1000};
    std::optional<unsigned> blockMillis;
    std::string logLevel{"info"};
  };

  /**
   * @brief A class to handle connection and poll configuration
   *
   * @details The configuration object has the following fields:
   * * `hostname` The Redis server host
   * * `port` The Redis server port
   * * `db` The database to be used (none selected by default)
   * * `useAuth` Whether `AUTH` authentication should be used (default false)
   * * `username` The username to be used if AUTH authentication is required
   * * `password` The password to be used if AUTH authentication is required
   * * `useResp3` Whether the RESP3 reply format should be negotiated (default false)
   * * `poll` The settings of the `[poll]` section
   */
  class Config {
   public:
    explicit Config(const std::string &hostname_, int port_, std::optional<int> db_ = std::nullopt,
                    std::optional<std::string> un_ = std::nullopt,
                    std::optional<std::string> pw_ = std::nullopt, bool ur3_ = false)
        : hostname{hostname_}, port{port_}, db{db_}, username(std::move(un_)), password(std::move(pw_)),
          useResp3(ur3_) {
      useAuth = password.has_value() && !password->empty();
    };

    /**
     * @brief Construct a Config from a parsed target
     *
     */
    explicit Config(const Target &target, bool ur3_ = false)
        : Config(target.endpoint.host, target.endpoint.port, target.db, target.credentials.username,
                 target.credentials.password, ur3_) {}

    Config(const Config &config) = default;
    Config(Config &&config) = default;
    Config &operator=(const Config &config) = default;
    Config &operator=(Config &&config) = default;

    /**
     * @brief Construct a new Config object from a TOML file
     *
     * @param configFilePath The path to the configuration file
     *
     * @details The file has a mandatory `[redis]` table and an optional `[poll]` table:
     * ```toml
     * [redis]
     * hostname = "localhost"
     * port = 6379
     * db = 0
     * useauth = true
     * username = "default"
     * password = "secret"
     * useresp3 = false
     * url = "redis://:secret@localhost:6379/0"   # overrides the fields above
     *
     * [poll]
     * streams = ["s1", "s2"]
     * start = "0-0"
     * concurrency = 200
     * timeoutms = 1000
     * streamspertask = 0
     * count = 100
     * emptystreams = "omit"
     * intervalms = 1000
     * blockms = 0
     * loglevel = "info"
     * ```
     * All fields are optional. If not present, a field will take the default value.
     */
    explicit Config(const fs::path &configFilePath)
        : hostname{DEFAULT_HOST}, port{DEFAULT_PORT}, db(std::nullopt), useAuth{false}, username(std::nullopt),
          password(std::nullopt), useResp3{false} {
      auto filepath = fs::weakly_canonical(fs::absolute(configFilePath));
      if (!fs::exists(filepath))
        throw std::runtime_error(std::format("Configuration file not found at: {}", filepath.string()));

      toml::table config;

      try {
        config = toml::parse_file(filepath.string());
      } catch (const toml::parse_error &err) {
        throw std::runtime_error(
            std::format("Failed to parse configuration file {}:\n{}", filepath.string(), err.description()));
      }

      auto redis = config["redis"];

      if (!redis.is_table()) {
        throw std::runtime_error(std::format("Missing [redis] section in {}", filepath.string()));
      }

      if (auto url = redis["url"].value<std::string>(); url.has_value()) {
        auto target = parseTarget(url.value());
        if (!target) {
          throw std::runtime_error(std::format("{}: {}", filepath.string(), target.error().message));
        }
        hostname = target->endpoint.host;
        port = target->endpoint.port;
        db = target->db;
        username = target->credentials.username;
        password = target->credentials.password;
        useAuth = target->credentials.hasSecret();
      } else {
        hostname = redis["hostname"].value_or(DEFAULT_HOST);
        port = redis["port"].value_or(DEFAULT_PORT);
        db = redis["db"].value<int>();
        auto auth = redis["useauth"].value_or(false);
        std::optional<std::string> un = redis["username"].value<std::string>();
        std::optional<std::string> pw = redis["password"].value<std::string>();

        if (auth && pw.has_value()) {
          useAuth = true;
          if (un.has_value()) username = un;
          password = pw;
        }
      }
      if (db.has_value()) {
        db = std::clamp(db.value(), 0, 15);
      }
      useResp3 = redis["useresp3"].value_or(false);

      if (auto pollTable = config["poll"]; pollTable.is_table()) {
        readPollSettings(pollTable, filepath);
      }
    }

    [[nodiscard]] Endpoint endpoint() const { return Endpoint{hostname, port}; }

    [[nodiscard]] Credentials credentials() const {
      if (!useAuth) return Credentials{};
      return Credentials{username, password};
    }

    [[nodiscard]] std::optional<int> database() const noexcept { return db; }
    [[nodiscard]] bool resp3() const noexcept { return useResp3; }

    /**
     * @brief The canonical target string of this configuration, with the secret masked
     *
     */
    [[nodiscard]] std::string target(bool maskSecret = true) const {
      return connectionTarget(endpoint(), credentials(), db, maskSecret);
    }

    [[nodiscard]] const PollSettings &pollSettings() const noexcept { return poll; }
    [[nodiscard]] PollSettings &pollSettings() noexcept { return poll; }

   private:
    std::string hostname;
    int port;
    std::optional<int> db;
    bool useAuth;
    std::optional<std::string> username;
    std::optional<std::string> password;
    bool useResp3;
    PollSettings poll;

    void readPollSettings(toml::node_view<toml::node> table, const fs::path &filepath) {
      if (auto streams = table["streams"].as_array()) {
        for (auto &&node : *streams) {
          auto name = node.value<std::string>();
          if (!name.has_value()) {
            throw std::runtime_error(std::format("{}: [poll] streams must be strings", filepath.string()));
          }
          poll.streams.push_back(std::move(name.value()));
        }
      }

      if (auto start = table["start"].value<std::string>(); start.has_value()) {
        auto position = StreamPosition::parse(start.value());
        if (!position) {
          throw std::runtime_error(
              std::format("{}: [poll] start '{}' is not a stream ID", filepath.string(), start.value()));
        }
        poll.start = position.value();
      }

      if (auto concurrency = table["concurrency"].value_or(int64_t{0}); concurrency > 0) {
        poll.concurrency = static_cast<size_t>(concurrency);
      }
      if (auto timeout = table["timeoutms"].value_or(int64_t{0}); timeout > 0) {
        poll.timeout = std::chrono::milliseconds{timeout};
      }
      poll.streamsPerTask = static_cast<size_t>(std::max<int64_t>(table["streamspertask"].value_or(int64_t{0}), 0));
      if (auto count = table["count"].value_or(int64_t{0}); count > 0) {
        poll.count = static_cast<size_t>(count);
      }

      auto empty = table["emptystreams"].value_or(std::string{"omit"});
      if (empty == "omit") {
        poll.emptyStreams = EmptyStreamPolicy::Omit;
      } else if (empty == "include") {
        poll.emptyStreams = EmptyStreamPolicy::Include;
      } else {
        throw std::runtime_error(std::format("{}: [poll] emptystreams must be \"omit\" or \"include\", not '{}'",
                                             filepath.string(), empty));
      }

      if (auto interval = table["intervalms"].value_or(int64_t{1000}); interval >= 0) {
        poll.interval = std::chrono::milliseconds{interval};
      }
      if (auto block = table["blockms"].value_or(int64_t{0}); block > 0) {
        poll.blockMillis = static_cast<unsigned>(block);
      }
      poll.logLevel = table["loglevel"].value_or(std::string{"info"});
    }

    friend std::string text(Config const &cfg) {
      return std::format(
          "hostname: {}\n    port: {}\n      db: {}\n useAuth: {}\nusername: {}\npassword: {}\nuseResp3: {}\n "
          "streams: {}",
          cfg.hostname, cfg.port, cfg.db.value_or(0), cfg.useAuth, cfg.username.value_or("nil"),
          cfg.password.has_value() ? "***" : "nil", cfg.useResp3, cfg.poll.streams.size());
    }

    friend struct std::formatter<Config, char>;
  };
};  // namespace StreamPoll

template <>
struct std::formatter<StreamPoll::Config, char> {
  constexpr auto parse(std::format_parse_context &pc) { return pc.begin(); }

  template <typename Ctx>
  auto format(StreamPoll::Config const &cfg, Ctx &ctx) const {
    return std::format_to(ctx.out(), "{}", text(cfg));
  }
};
