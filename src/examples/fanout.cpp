#include <chrono>
#include <expected>
#include <format>
#include <print>
#include <vector>

#include "streampoll.hpp"

using namespace std::chrono_literals;

int main() {
  StreamPoll::Diagnostics diagnostics("fanout");
  StreamPoll::Provisioner provisioner(StreamPoll::Endpoint{"localhost", 6379}, StreamPoll::Credentials{},
                                      diagnostics.logger());

  std::vector<StreamPoll::StreamName> names;
  for (auto i{0u}; i < 1000; i++) names.push_back(std::format("fanout:{}", i));
  std::vector<StreamPoll::StreamPosition> positions(names.size(), StreamPoll::StreamPosition::beginning());

  /**
   * One connection per stream, at most 100 open at any time, and a second to finish each read
   *
   */
  auto started = std::chrono::steady_clock::now();
  auto result = StreamPoll::pollStreams(provisioner, names, positions, 100, 1s, diagnostics);
  auto took = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

  std::println("{} streams with entries, {} failed, in {}", result.streams.size(), result.failures.size(), took);

  /**
   * The same streams again, results reported task by task as they complete
   *
   */
  StreamPoll::StreamPoller poller(provisioner, diagnostics);
  StreamPoll::PollOptions options;
  options.concurrencyCap = 100;
  options.streamsPerTask = 50;
  options.timeout = 1s;
  size_t tasks{0};
  (void)poller.pollEach(names, positions, options,
                        [&tasks](const StreamPoll::ReadRequest &request,
                                 const std::expected<StreamPoll::StreamMap, StreamPoll::Failure> &outcome) {
                          tasks++;
                          if (outcome) {
                            std::println("task for {} streams: {} with entries", request.size(), outcome->size());
                          } else {
                            std::println("task for {} streams failed: {}", request.size(), outcome.error().message);
                          }
                        });
  std::println("{} tasks", tasks);

  return 0;
}
