#include "daemon/SerialExecutor.hpp"

#include "utils/Log.hpp"

#include <exception>
#include <thread>
#include <utility>

namespace rcs::daemon
{

SerialExecutor::SerialExecutor() = default;

SerialExecutor::~SerialExecutor()
{
    shutdown();
}

void SerialExecutor::start()
{
    if (worker_.joinable())
    {
        return;
    }
    exit_requested_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    worker_ = std::thread([this] { loop(); });
}

void SerialExecutor::shutdown()
{
    {
        std::lock_guard<std::mutex> guard(mutex_);
        exit_requested_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
    if (worker_.joinable())
    {
        worker_.join();
    }
    running_.store(false, std::memory_order_release);
}

bool SerialExecutor::is_running() const noexcept
{
    return running_.load(std::memory_order_acquire);
}

bool SerialExecutor::post(std::function<void()> task)
{
    if (!task)
    {
        return false;
    }
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (exit_requested_.load(std::memory_order_acquire))
        {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void SerialExecutor::loop()
{
    while (true)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock,
                     [this]
                     {
                         return exit_requested_.load(
                                    std::memory_order_acquire) ||
                                !tasks_.empty();
                     });
            if (tasks_.empty())
            {
                break;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        // A throwing subscriber must not stop delivery to the others.
        try
        {
            task();
        }
        catch (std::exception const &ex)
        {
            RCS_LOG_ERROR("event task threw: {}", ex.what());
        }
        catch (...)
        {
            RCS_LOG_ERROR("event task threw a non-standard exception");
        }
    }
    running_.store(false, std::memory_order_release);
}

} // namespace rcs::daemon
