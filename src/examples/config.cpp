#include <format>
#include <print>

#include "streampollconfig.hpp"

int main() {
  /**
   * Explicit constructor only needs hostname and port; all other parameters are optional
   *
   */
  StreamPoll::Config cfg_hostport("localhost", 6379);
  std::println("{}", cfg_hostport);
  std::println("target: {}", cfg_hostport.target());

  /**
   * With a password the target carries a credential segment, masked unless asked for in full
   *
   */
  StreamPoll::Config cfg_auth("localhost", 6379, 2, "poller", "secret");
  std::println("\n{}", cfg_auth);
  std::println("masked: {}\n  full: {}", cfg_auth.target(), cfg_auth.target(false));

  /**
   * A Config can be built from a target string
   *
   */
  auto parsed = StreamPoll::parseTarget("redis://:secret@[::1]:6380/1");
  if (parsed) {
    StreamPoll::Config cfg_url(parsed.value());
    std::println("\nFrom target string:\n{}", cfg_url);
  } else {
    std::println("bad target: {}", parsed.error().message);
  }

  /**
   * A Config can be loaded from a file containing TOML
   *
   */
  StreamPoll::Config cfg_file("config/config_example.toml");
  std::println("\nFrom TOML file:\n{}", cfg_file);
  std::println("streams to poll: {}", cfg_file.pollSettings().streams.size());

  return 0;
}
