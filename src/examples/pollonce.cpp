#include <format>
#include <print>
#include <string>
#include <variant>

#include "streampoll.hpp"

namespace {
  std::string show(const StreamPoll::FieldValue &value) {
    if (auto s = std::get_if<std::string>(&value)) return *s;
    if (auto n = std::get_if<long long>(&value)) return std::to_string(*n);
    return "(nil)";
  }
};  // namespace

int main(int argc, char *argv[]) {
  StreamPoll::Config config(argc > 1 ? argv[1] : "config/config_example.toml");
  const auto &settings = config.pollSettings();

  StreamPoll::Diagnostics diagnostics("pollonce");
  diagnostics.setLevel(settings.logLevel);

  StreamPoll::Provisioner provisioner(config, diagnostics.logger());
  StreamPoll::StreamPoller poller(provisioner, diagnostics);

  // one round over every configured stream, from the configured start position
  auto result = poller.poll(settings.streams, settings.start, StreamPoll::PollOptions::from(settings));

  for (const auto &[name, entries] : result.streams) {
    std::println("{}: {} entries", name, entries.size());
    for (const auto &entry : entries) {
      std::print("  {}", entry.position);
      for (const auto &[field, value] : entry.fields) std::print(" {}={}", field, show(value));
      std::println("");
    }
  }

  for (const auto &failure : result.failures) {
    std::println("FAILED {} ({} streams): {}", failure.kind, failure.streams.size(), failure.message);
  }

  return result.ok() ? 0 : 1;
}
