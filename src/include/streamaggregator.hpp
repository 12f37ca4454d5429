#pragma once
#include <format>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <unordered_set>
#include <vector>

#include "streampolltypes.hpp"

namespace StreamPoll {
  /**
   * Aggregated entries keyed by stream name. Within each stream the entries keep their read order, which is
   * ascending by position.
   */
  using StreamMap = std::map<StreamName, std::vector<StreamEntry>>;

  /**
   * @brief Check a reply against the request that produced it
   *
   * @return a `MalformedReply` failure if the reply names a stream that was not requested, names a stream
   * twice, or has positions that do not strictly increase within a stream
   */
  [[nodiscard]] inline std::optional<Failure> checkReply(const ReadRequest &request, const ReadReply &reply) {
    std::unordered_set<std::string_view> requested;
    for (const auto &s : request.streams) requested.insert(s.name);

    std::unordered_set<std::string_view> seen;
    for (const auto &batch : reply.streams) {
      if (!requested.contains(batch.name)) {
        return Failure{ErrorKind::MalformedReply, std::format("reply contains unrequested stream '{}'", batch.name),
                       {}};
      }
      if (!seen.insert(batch.name).second) {
        return Failure{ErrorKind::MalformedReply, std::format("reply lists stream '{}' twice", batch.name), {}};
      }
      for (auto i{1u}; i < batch.entries.size(); i++) {
        if (!(batch.entries[i - 1].position < batch.entries[i].position)) {
          return Failure{ErrorKind::MalformedReply,
                         std::format("positions of stream '{}' do not increase at {}", batch.name,
                                     batch.entries[i].position),
                         {}};
        }
      }
    }
    return std::nullopt;
  }

  /**
   * @brief Append the batches of a reply to an aggregate
   *
   * @details Entries are copied unmodified. Batches without entries create no key.
   */
  inline void merge(StreamMap &into, const ReadReply &reply) {
    for (const auto &batch : reply.streams) {
      if (batch.entries.empty()) continue;
      auto &entries = into[batch.name];
      entries.insert(entries.end(), batch.entries.begin(), batch.entries.end());
    }
  }

  /**
   * @brief Give every requested stream a key, empty if it has no entries
   *
   */
  inline void includeEmpty(StreamMap &into, std::span<const StreamName> requested) {
    for (const auto &name : requested) (void)into.try_emplace(name);
  }

  /**
   * @brief Normalise a reply into a mapping from stream name to entries
   *
   * @param reply the reply to aggregate
   * @param policy whether streams missing from the reply are left out (`Omit`, the store's own behaviour) or
   * given an empty sequence (`Include`)
   * @param requested the streams that were asked for; only consulted under `Include`
   *
   * @details Aggregation is pure: the same reply always gives the same mapping. Field values are passed through
   * as they are; decoding byte sequences is up to the caller.
   *
   */
  [[nodiscard]] inline StreamMap aggregate(const ReadReply &reply, EmptyStreamPolicy policy = EmptyStreamPolicy::Omit,
                                           std::span<const StreamName> requested = {}) {
    StreamMap out;
    merge(out, reply);
    if (policy == EmptyStreamPolicy::Include) includeEmpty(out, requested);
    return out;
  }

  /**
   * @brief The position of the last entry of each stream in a reply
   *
   */
  [[nodiscard]] inline std::map<StreamName, StreamPosition> lastPositions(const ReadReply &reply) {
    std::map<StreamName, StreamPosition> out;
    for (const auto &batch : reply.streams) {
      if (!batch.entries.empty()) out[batch.name] = batch.entries.back().position;
    }
    return out;
  }
};  // namespace StreamPoll
