#include "utils/Shutdown.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <thread>

namespace rcs::runtime {

namespace {
std::atomic_bool g_shutdown_requested{false};

void handle_shutdown_signal(int) {
  g_shutdown_requested.store(true, std::memory_order_relaxed);
}
} // namespace

void request_shutdown() noexcept {
  g_shutdown_requested.store(true, std::memory_order_relaxed);
}

bool should_shutdown() noexcept {
  return g_shutdown_requested.load(std::memory_order_relaxed);
}

void install_shutdown_signal_handlers() {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);
}

bool wait_for_shutdown(std::chrono::milliseconds timeout) {
  auto const deadline = std::chrono::steady_clock::now() + timeout;
  while (!should_shutdown()) {
    auto const now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    auto const step = std::min<std::chrono::steady_clock::duration>(
        deadline - now, std::chrono::milliseconds(50));
    std::this_thread::sleep_for(step);
  }
  return true;
}

} // namespace rcs::runtime
