// Round-robin poller over a set of simulated queues.
//
// The poll thread owns the bitmap (the single writer): it marks queues
// active when work arrives, calls scan() every iteration to find active
// queues, drains them and clears their bits. Monitor threads hold readers
// and sample queue state with get() while the poller runs.
//
// Usage: active_queue_poller [queues] [seconds] [monitors]

#include <fmt/format.h>

#include <pthread.h>
#include <signal.h>

#include <atomic>
#include <bit>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstdio>
#include <exception>
#include <functional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "scanbits/scanbits.hpp"

namespace {

// Shared run state, created in main and handed to every loop by reference
struct RunState {
  std::atomic<bool> running{true};
  std::atomic<uint64_t> arrivals{0};
  std::atomic<uint64_t> serviced{0};
  std::atomic<uint64_t> scans{0};
  std::atomic<uint64_t> samples{0};
  std::atomic<uint64_t> active_samples{0};

  void stop() noexcept { running.store(false, std::memory_order_release); }
  [[nodiscard]] bool is_running() const noexcept {
    return running.load(std::memory_order_acquire);
  }
};

struct Options {
  uint32_t queues{4096};
  uint32_t seconds{2};
  uint32_t monitors{2};
};

Options parse_options(int argc, char** argv) {
  Options options;
  if (argc > 1) options.queues = static_cast<uint32_t>(std::stoul(argv[1]));
  if (argc > 2) options.seconds = static_cast<uint32_t>(std::stoul(argv[2]));
  if (argc > 3) options.monitors = static_cast<uint32_t>(std::stoul(argv[3]));
  return options;
}

// Work arrives on random queues; active queues are found through scan()
void poll_loop(scanbits::Bitmap& bitmap, std::vector<uint32_t>& backlog, RunState& state) {
  std::mt19937 rng(1);
  std::uniform_int_distribution<uint32_t> queue_dist(0, bitmap.size() - 1);
  std::uniform_int_distribution<uint32_t> burst_dist(1, 32);

  while (state.is_running()) {
    // Enqueue a few bursts
    for (int i = 0; i < 4; ++i) {
      const uint32_t queue = queue_dist(rng);
      backlog[queue] += burst_dist(rng);
      bitmap.set(queue);
      state.arrivals.fetch_add(1, std::memory_order_relaxed);
    }

    auto result = bitmap.scan();
    state.scans.fetch_add(1, std::memory_order_relaxed);
    if (!result) continue;

    for (uint64_t slab = result->slab; slab != 0; slab &= slab - 1) {
      const uint32_t queue = result->pos + static_cast<uint32_t>(std::countr_zero(slab));
      // Drain at most a burst per visit so busy queues share the poller
      const uint32_t take = backlog[queue] < 16 ? backlog[queue] : 16;
      backlog[queue] -= take;
      if (backlog[queue] == 0) {
        bitmap.clear(queue);
      }
      state.serviced.fetch_add(take, std::memory_order_relaxed);
    }
  }
}

void monitor_loop(scanbits::BitmapReader reader, uint32_t seed, RunState& state) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<uint32_t> queue_dist(0, reader.size() - 1);

  while (state.is_running()) {
    const uint32_t queue = queue_dist(rng);
    reader.prefetch0(queue);
    if (reader.get(queue)) {
      state.active_samples.fetch_add(1, std::memory_order_relaxed);
    }
    state.samples.fetch_add(1, std::memory_order_relaxed);
  }
}

// Collects SIGINT/SIGTERM, or stops the run once the deadline passes
void signal_loop(const sigset_t& signals, std::chrono::seconds limit, RunState& state) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  const timespec tick{0, 50 * 1000 * 1000};

  while (state.is_running()) {
    siginfo_t info;
    const int sig = sigtimedwait(&signals, &info, &tick);
    if (sig == SIGINT || sig == SIGTERM) {
      fmt::print("signal {} received, stopping\n", sig);
      state.stop();
    } else if (std::chrono::steady_clock::now() >= deadline) {
      state.stop();
    }
  }
}

}  // namespace

int main(int argc, char** argv) {
  Options options;
  try {
    options = parse_options(argc, argv);
  } catch (const std::exception& e) {
    fmt::print(stderr, "usage: {} [queues] [seconds] [monitors]: {}\n", argv[0], e.what());
    return EXIT_FAILURE;
  }

  // Block the signals before any thread starts so only signal_loop sees them
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  try {
    auto owned = scanbits::make_bitmap(options.queues);
    owned.region.lock();
    std::vector<uint32_t> backlog(options.queues, 0);

    fmt::print("polling {} queues for {}s: {} bitmap bytes, {} blocks, {} monitors\n",
               options.queues, options.seconds, owned.bitmap.layout().footprint,
               owned.bitmap.block_count(), options.monitors);

    RunState state;
    std::thread signal_thread(signal_loop, std::cref(signals),
                              std::chrono::seconds(options.seconds), std::ref(state));

    std::vector<std::thread> monitors;
    for (uint32_t i = 0; i < options.monitors; ++i) {
      monitors.emplace_back(monitor_loop, owned.bitmap.reader(), i + 100, std::ref(state));
    }

    poll_loop(owned.bitmap, backlog, state);

    for (auto& t : monitors) {
      t.join();
    }
    signal_thread.join();

    const uint64_t samples = state.samples.load();
    fmt::print("arrivals {}, serviced {}, scans {}, monitor samples {} ({:.1f}% active)\n",
               state.arrivals.load(), state.serviced.load(), state.scans.load(), samples,
               samples == 0 ? 0.0 : 100.0 * static_cast<double>(state.active_samples.load()) /
                                        static_cast<double>(samples));
  } catch (const std::exception& e) {
    fmt::print(stderr, "error: {}\n", e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
