#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <print>
#include <stop_token>
#include <thread>

#include "streampoll.hpp"

int main(int argc, char *argv[]) {
  StreamPoll::Config config(argc > 1 ? argv[1] : "config/config_example.toml");
  const auto &settings = config.pollSettings();

  // block SIGINT and SIGTERM in every thread; one thread waits for them and stops the loop
  sigset_t stopSignals;
  sigemptyset(&stopSignals);
  sigaddset(&stopSignals, SIGINT);
  sigaddset(&stopSignals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &stopSignals, nullptr);

  std::stop_source stopAll;
  std::jthread signalWaiter([&stopSignals, &stopAll] {
    int sig{0};
    (void)sigwait(&stopSignals, &sig);
    (void)stopAll.request_stop();
  });

  StreamPoll::Diagnostics diagnostics("follow");
  diagnostics.setLevel(settings.logLevel);

  StreamPoll::Provisioner provisioner(config, diagnostics.logger());
  StreamPoll::StreamPoller poller(provisioner, diagnostics);

  /**
   * With `blockms` set in [poll] each round waits on the server for new entries; otherwise rounds are spaced
   * `intervalms` apart. Ctrl-C stops the loop and cancels the round in progress.
   *
   */
  auto options = StreamPoll::FollowOptions::from(settings);
  size_t rounds{0};
  try {
    rounds = poller.follow(
        settings.streams, settings.start, options,
        [](const StreamPoll::PollResult &result) {
          for (const auto &[name, entries] : result.streams) {
            if (!entries.empty()) std::println("{}: {} new, last {}", name, entries.size(), entries.back().position);
          }
          for (const auto &failure : result.failures) {
            std::println("FAILED {}: {}", failure.kind, failure.message);
          }
        },
        stopAll.get_token());
  } catch (const StreamPoll::RequestError &e) {
    std::println("bad stream list: {}", e.what());
  }

  // release the waiter if the loop ended without a signal
  if (!stopAll.stop_requested()) ::kill(::getpid(), SIGTERM);

  std::println("{} rounds", rounds);
  return 0;
}
