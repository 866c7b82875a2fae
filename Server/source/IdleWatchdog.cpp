#include "IdleWatchdog.hpp"

IdleWatchdog::IdleWatchdog(std::chrono::milliseconds timeout, std::function<void()> on_expire)
    : timeout_(timeout)
    , on_expire_(std::move(on_expire))
    , deadline_(std::chrono::steady_clock::now() + timeout)
{
    if (timeout_.count() > 0)
        thread_ = std::thread(&IdleWatchdog::Run, this);
}

IdleWatchdog::~IdleWatchdog()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable())
        thread_.join();
}

void IdleWatchdog::Suspend() noexcept
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        suspended_ = true;
    }
    cv_.notify_all();
}

void IdleWatchdog::Resume() noexcept
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        suspended_ = false;
        deadline_ = std::chrono::steady_clock::now() + timeout_;
    }
    cv_.notify_all();
}

bool IdleWatchdog::Expired() const noexcept
{
    return expired_.load(std::memory_order_acquire);
}

void IdleWatchdog::Run()
{
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stopping_) {
        if (suspended_) {
            cv_.wait(lock, [this] { return stopping_ || !suspended_; });
            continue;
        }

        const auto deadline = deadline_;
        cv_.wait_until(lock, deadline, [this] { return stopping_ || suspended_; });

        if (stopping_)
            break;

        // Resume() may have moved the deadline while we slept
        if (suspended_ || std::chrono::steady_clock::now() < deadline_)
            continue;

        expired_.store(true, std::memory_order_release);
        lock.unlock();

        if (on_expire_)
            on_expire_();

        return;
    }
}
