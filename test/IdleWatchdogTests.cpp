#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "IdleWatchdog.hpp"

using namespace std::chrono_literals;

TEST(IdleWatchdog, FiresWhenIdle)
{
	std::atomic<int> fired{0};
	IdleWatchdog watchdog(50ms, [&] { fired++; });

	std::this_thread::sleep_for(300ms);
	EXPECT_TRUE(watchdog.Expired());
	EXPECT_EQ(fired.load(), 1);
}

TEST(IdleWatchdog, ResumeKeepsItQuiet)
{
	std::atomic<int> fired{0};
	IdleWatchdog watchdog(200ms, [&] { fired++; });

	for (int i = 0; i < 10; ++i) {
		std::this_thread::sleep_for(40ms);
		watchdog.Resume();
	}

	EXPECT_FALSE(watchdog.Expired());
	EXPECT_EQ(fired.load(), 0);
}

TEST(IdleWatchdog, ZeroTimeoutDisables)
{
	std::atomic<int> fired{0};
	{
		IdleWatchdog watchdog(0ms, [&] { fired++; });
		std::this_thread::sleep_for(50ms);
		EXPECT_FALSE(watchdog.Expired());
	}
	EXPECT_EQ(fired.load(), 0);
}

TEST(IdleWatchdog, DestructionStopsPendingTimer)
{
	std::atomic<int> fired{0};
	{
		IdleWatchdog watchdog(10s, [&] { fired++; });
	}
	EXPECT_EQ(fired.load(), 0);
}

TEST(IdleWatchdog, SuspendedTimeDoesNotCount)
{
	std::atomic<int> fired{0};
	IdleWatchdog watchdog(100ms, [&] { fired++; });

	watchdog.Suspend();
	std::this_thread::sleep_for(300ms);
	EXPECT_FALSE(watchdog.Expired());

	// rearmed with a full timeout
	watchdog.Resume();
	std::this_thread::sleep_for(30ms);
	EXPECT_EQ(fired.load(), 0);

	std::this_thread::sleep_for(400ms);
	EXPECT_TRUE(watchdog.Expired());
	EXPECT_EQ(fired.load(), 1);
}
