#pragma once

#include <charconv>
#include <compare>
#include <cstdint>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace StreamPoll {
  using StreamName = std::string;

  /**
   * @brief A position (entry ID) inside a Redis stream
   *
   * @details Redis entry IDs are a millisecond timestamp and a per-millisecond sequence number, written
   * `<millis>-<seq>`. Positions compare lexicographically on (millis, seq). The value `0-0` stands for the
   * beginning of the stream: a read from `0-0` returns the earliest retained entry.
   *
   */
  struct StreamPosition {
    uint64_t millis{0};
    uint64_t seq{0};

    [[nodiscard]] static constexpr StreamPosition beginning() noexcept { return StreamPosition{0, 0}; }

    /**
     * @brief Parse an entry ID
     *
     * @param text `<millis>-<seq>` or a bare `<millis>` (sequence 0, as Redis accepts it)
     *
     * @return the position, or `std::nullopt` if `text` is not a valid ID
     */
    [[nodiscard]] static std::optional<StreamPosition> parse(std::string_view text) noexcept {
      auto parseNumber = [](std::string_view digits) -> std::optional<uint64_t> {
        if (digits.empty()) return std::nullopt;
        uint64_t value{0};
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (ec != std::errc{} || ptr != digits.data() + digits.size()) return std::nullopt;
        return value;
      };

      auto dash = text.find('-');
      auto millis = parseNumber(text.substr(0, dash));
      if (!millis) return std::nullopt;
      if (dash == std::string_view::npos) return StreamPosition{*millis, 0};
      auto seq = parseNumber(text.substr(dash + 1));
      if (!seq) return std::nullopt;
      return StreamPosition{*millis, *seq};
    }

    [[nodiscard]] std::string text() const { return std::format("{}-{}", millis, seq); }

    constexpr auto operator<=>(const StreamPosition &) const = default;
  };

  /**
   * @brief A field value as stored in a stream entry: nil, a byte sequence or an integer
   *
   * @details Byte sequences are passed through as they arrive; no character encoding is assumed.
   */
  using FieldValue = std::variant<std::monostate, std::string, long long>;
  using Field = std::pair<std::string, FieldValue>;

  struct StreamEntry {
    StreamPosition position;
    std::vector<Field> fields; /**< in the order the producer wrote them */

    bool operator==(const StreamEntry &) const = default;
  };

  /**
   * @brief One (stream, start position) pair of a batched read
   *
   */
  struct StreamRead {
    StreamName name;
    StreamPosition from;

    bool operator==(const StreamRead &) const = default;
  };

  /**
   * @brief A batched read of several streams, issued as a single `XREAD`
   *
   * @details `count` maps to `XREAD COUNT`. `blockMillis` maps to `XREAD BLOCK` and is only set by the
   * reactive follow cadence; a plain poll never blocks on the server.
   */
  struct ReadRequest {
    std::vector<StreamRead> streams;
    std::optional<size_t> count;
    std::optional<unsigned> blockMillis;

    [[nodiscard]] size_t size() const noexcept { return streams.size(); }
    [[nodiscard]] bool empty() const noexcept { return streams.empty(); }

    [[nodiscard]] std::vector<StreamName> names() const {
      std::vector<StreamName> out;
      out.reserve(streams.size());
      for (const auto &s : streams) out.push_back(s.name);
      return out;
    }
  };

  struct StreamBatch {
    StreamName name;
    std::vector<StreamEntry> entries;

    bool operator==(const StreamBatch &) const = default;
  };

  /**
   * @brief The reply to a `ReadRequest`
   *
   * @details Streams that had no entries after the requested position, and streams that do not exist, are
   * absent from the reply. They are not represented by empty batches.
   */
  struct ReadReply {
    std::vector<StreamBatch> streams;

    bool operator==(const ReadReply &) const = default;
  };

  /**
   * @brief How streams that are absent from a reply are represented in aggregated results
   *
   * @details Redis omits streams with no new entries (and nonexistent streams) from an `XREAD` reply. `Omit`
   * keeps that behaviour; `Include` gives every requested stream a key, with an empty sequence if needed.
   */
  enum class EmptyStreamPolicy { Omit, Include };

  enum class ErrorKind {
    AddressError,
    AuthError,
    TransportError,
    Timeout,
    MalformedReply,
    ArityMismatch,
    DuplicateStream,
    CommandError,
    Cancelled
  };

  [[nodiscard]] constexpr std::string_view toString(ErrorKind kind) noexcept {
    switch (kind) {
      case ErrorKind::AddressError:
        return "AddressError";
      case ErrorKind::AuthError:
        return "AuthError";
      case ErrorKind::TransportError:
        return "TransportError";
      case ErrorKind::Timeout:
        return "Timeout";
      case ErrorKind::MalformedReply:
        return "MalformedReply";
      case ErrorKind::ArityMismatch:
        return "ArityMismatch";
      case ErrorKind::DuplicateStream:
        return "DuplicateStream";
      case ErrorKind::CommandError:
        return "CommandError";
      case ErrorKind::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
  }

  /**
   * @brief A failure captured as a value
   *
   * @details Every I/O-origin failure of a worker task is reported as a `Failure` rather than thrown. When a
   * failure belongs to a task, `streams` lists the streams that task was reading, so the caller can account
   * for each stream it asked for.
   */
  struct Failure {
    ErrorKind kind;
    std::string message;
    std::vector<StreamName> streams;
  };

  /**
   * @brief Thrown for caller programming errors detected before any I/O takes place
   *
   */
  class RequestError : public std::invalid_argument {
   public:
    RequestError(ErrorKind kind_, const std::string &what) : std::invalid_argument(what), errorKind{kind_} {}

    [[nodiscard]] ErrorKind kind() const noexcept { return errorKind; }

   private:
    ErrorKind errorKind;
  };
};  // namespace StreamPoll

template <>
struct std::formatter<StreamPoll::StreamPosition, char> {
  constexpr auto parse(std::format_parse_context &pc) { return pc.begin(); }

  template <typename Ctx>
  auto format(StreamPoll::StreamPosition const &pos, Ctx &ctx) const {
    return std::format_to(ctx.out(), "{}-{}", pos.millis, pos.seq);
  }
};

template <>
struct std::formatter<StreamPoll::ErrorKind, char> {
  constexpr auto parse(std::format_parse_context &pc) { return pc.begin(); }

  template <typename Ctx>
  auto format(StreamPoll::ErrorKind const &kind, Ctx &ctx) const {
    return std::format_to(ctx.out(), "{}", StreamPoll::toString(kind));
  }
};
