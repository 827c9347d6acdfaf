#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace rcs::daemon
{

// Runs posted tasks one at a time, in posting order, on a single worker
// thread. shutdown() runs every task already queued before joining.
class SerialExecutor
{
  public:
    SerialExecutor();
    SerialExecutor(SerialExecutor const &) = delete;
    SerialExecutor &operator=(SerialExecutor const &) = delete;
    ~SerialExecutor();

    void start();
    // Must not be called from a task.
    void shutdown();
    bool is_running() const noexcept;
    // Returns false once shutdown() has begun.
    bool post(std::function<void()> task);

  private:
    void loop();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> tasks_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<bool> exit_requested_{false};
};

} // namespace rcs::daemon
