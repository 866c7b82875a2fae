#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

// Calls on_expire once if the watchdog stays armed for longer than timeout
// without Resume() being called again. While suspended the deadline does not
// run; Resume() rearms it with a full timeout. A zero timeout disables the
// watchdog.
class IdleWatchdog
{
public:
	IdleWatchdog(std::chrono::milliseconds timeout, std::function<void()> on_expire);
	~IdleWatchdog();

	IdleWatchdog(const IdleWatchdog&) = delete;
	IdleWatchdog& operator=(const IdleWatchdog&) = delete;

public:
	void Suspend() noexcept;
	void Resume() noexcept;

	bool Expired() const noexcept;

private:
	void Run();

private:
	const std::chrono::milliseconds timeout_;
	std::function<void()> on_expire_;

	std::mutex mutex_;
	std::condition_variable cv_;
	std::chrono::steady_clock::time_point deadline_;
	bool suspended_ = false;
	bool stopping_ = false;

	std::atomic<bool> expired_{false};
	std::thread thread_;
};
