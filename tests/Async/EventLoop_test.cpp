/*
 * LiveVault - Async Library Tests
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include <LiveVault/Async/EventLoop.hpp>
#include <LiveVault/Async/Join.hpp>

#include "../TestSupport/RecordingLogger.hpp"

using namespace LiveVault::Async;
using LiveVault::Tests::RecordingLogger;

class EventLoopTest : public ::testing::Test {
protected:
	void SetUp() override
	{
		loop = std::make_shared<EventLoop>(logger);
		loop->start();
	}

	void TearDown() override { loop->stop(); }

	std::shared_ptr<RecordingLogger> logger = std::make_shared<RecordingLogger>();
	std::shared_ptr<EventLoop> loop;
};

TEST_F(EventLoopTest, ScheduleMovesCoroutineOntoLoopThread)
{
	auto task = [](EventLoop &loop) -> Task<std::thread::id> {
		co_await loop.schedule();
		co_return std::this_thread::get_id();
	};

	std::thread::id loopThread = join(task(*loop));
	EXPECT_NE(loopThread, std::this_thread::get_id());
	EXPECT_EQ(join(task(*loop)), loopThread);
}

TEST_F(EventLoopTest, ResumeAfterWaitsAtLeastTheDelay)
{
	auto task = [](EventLoop &loop) -> Task<std::chrono::steady_clock::duration> {
		const auto start = std::chrono::steady_clock::now();
		co_await loop.resumeAfter(std::chrono::milliseconds(30));
		co_return std::chrono::steady_clock::now() - start;
	};

	EXPECT_GE(join(task(*loop)), std::chrono::milliseconds(30));
}

TEST_F(EventLoopTest, TimersFireInDeadlineOrder)
{
	std::vector<int> order;
	std::atomic<int> finished{0};

	auto sleeper = [&](int id, int delayMs) -> Task<void> {
		co_await loop->resumeAfter(std::chrono::milliseconds(delayMs));
		order.push_back(id);
		++finished;
	};

	loop->launch(sleeper(2, 40));
	loop->launch(sleeper(1, 10));

	for (int i = 0; i < 200 && finished.load() < 2; ++i) {
		std::this_thread::sleep_for(std::chrono::milliseconds(5));
	}
	ASSERT_EQ(finished.load(), 2);
	EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST_F(EventLoopTest, TimerSleepsOnLoop)
{
	std::shared_ptr<ITimer> timer = loop->timer();
	auto task = [](std::shared_ptr<ITimer> t) -> Task<int> {
		co_await t->sleepFor(std::chrono::milliseconds(1));
		co_return 7;
	};
	EXPECT_EQ(join(task(timer)), 7);
}

TEST_F(EventLoopTest, LauncherLogsFailures)
{
	std::atomic<bool> done{false};
	auto failing = [&done]() -> Task<void> {
		done = true;
		throw std::runtime_error("handler failed");
		co_return;
	};

	loop->launcher()(failing());

	for (int i = 0; i < 200 && !logger->contains(LiveVault::Logger::LogLevel::Error, "DetachedTaskError"); ++i) {
		std::this_thread::sleep_for(std::chrono::milliseconds(5));
	}
	EXPECT_TRUE(done.load());
	EXPECT_TRUE(logger->contains(LiveVault::Logger::LogLevel::Error, "DetachedTaskError"));
}
