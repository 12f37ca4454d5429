#pragma once
#include <algorithm>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "streampolltypes.hpp"

namespace StreamPoll {
  /**
   * @brief Pair every stream name with its own start position
   *
   * @param names the streams to read, in caller order
   * @param positions the start position of each stream, positionally paired with `names`
   *
   * @return a `ReadRequest` preserving the order of `names`
   *
   * @details No I/O takes place. A length mismatch or a repeated stream name is a programming error in the
   * caller and throws `RequestError` before anything is sent.
   *
   */
  [[nodiscard]] inline ReadRequest buildRequest(std::span<const StreamName> names,
                                                std::span<const StreamPosition> positions) {
    if (names.size() != positions.size()) {
      throw RequestError(ErrorKind::ArityMismatch,
                         std::format("{} stream names but {} start positions", names.size(), positions.size()));
    }

    ReadRequest request;
    request.streams.reserve(names.size());
    std::unordered_set<std::string_view> seen;
    for (auto i{0u}; i < names.size(); i++) {
      if (!seen.insert(names[i]).second) {
        throw RequestError(ErrorKind::DuplicateStream, std::format("stream '{}' requested twice", names[i]));
      }
      request.streams.push_back(StreamRead{names[i], positions[i]});
    }
    return request;
  }

  /**
   * @brief Read every stream from the same start position (typically the beginning)
   *
   */
  [[nodiscard]] inline ReadRequest buildRequest(std::span<const StreamName> names,
                                                StreamPosition start = StreamPosition::beginning()) {
    std::vector<StreamPosition> positions(names.size(), start);
    return buildRequest(names, positions);
  }

  /**
   * @brief Render a request as `XREAD` arguments
   *
   * @return `XREAD [COUNT n] [BLOCK ms] STREAMS key1 ... keyN id1 ... idN`
   *
   * @details The returned strings own their storage; pass views of them to `redisCommandArgv`.
   */
  [[nodiscard]] inline std::vector<std::string> xreadArguments(const ReadRequest &request) {
    std::vector<std::string> args;
    args.reserve(2 * request.size() + 6);
    args.emplace_back("XREAD");
    if (request.count.has_value()) {
      args.emplace_back("COUNT");
      args.push_back(std::to_string(request.count.value()));
    }
    if (request.blockMillis.has_value()) {
      args.emplace_back("BLOCK");
      args.push_back(std::to_string(request.blockMillis.value()));
    }
    args.emplace_back("STREAMS");
    for (const auto &s : request.streams) args.push_back(s.name);
    for (const auto &s : request.streams) args.push_back(s.from.text());
    return args;
  }

  /**
   * @brief Split a request into consecutive batches of at most `streamsPerTask` streams
   *
   * @details Order is preserved across and within batches. `COUNT` and `BLOCK` options are copied to each
   * batch. A `streamsPerTask` of zero keeps the request whole. An empty request yields no batches.
   */
  [[nodiscard]] inline std::vector<ReadRequest> partitionRequest(const ReadRequest &request, size_t streamsPerTask) {
    std::vector<ReadRequest> batches;
    if (request.empty()) return batches;
    if (streamsPerTask == 0 || streamsPerTask >= request.size()) {
      batches.push_back(request);
      return batches;
    }

    batches.reserve((request.size() + streamsPerTask - 1) / streamsPerTask);
    for (size_t first{0}; first < request.size(); first += streamsPerTask) {
      auto last = std::min(first + streamsPerTask, request.size());
      ReadRequest batch;
      batch.count = request.count;
      batch.blockMillis = request.blockMillis;
      batch.streams.assign(request.streams.begin() + first, request.streams.begin() + last);
      batches.push_back(std::move(batch));
    }
    return batches;
  }
};  // namespace StreamPoll
