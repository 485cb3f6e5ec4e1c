/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * LiveVault Async Library
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

#include <LiveVault/Logger/ILogger.hpp>

#include "DetachedTask.hpp"
#include "ITimer.hpp"
#include "Task.hpp"

namespace LiveVault::Async {

/**
 * Single-threaded executor for event handler coroutines.
 *
 * Every coroutine resumed by the loop runs on the loop thread, so handlers
 * only interleave at their co_await points. Coroutines still waiting when
 * the loop stops are never resumed, so stop the loop only at shutdown.
 */
class EventLoop : public std::enable_shared_from_this<EventLoop> {
public:
	using Clock = std::chrono::steady_clock;

	class ScheduleAwaiter {
	public:
		explicit ScheduleAwaiter(EventLoop &loop, Clock::time_point when) noexcept : loop_(loop), when_(when) {}

		bool await_ready() const noexcept { return false; }
		void await_suspend(std::coroutine_handle<> h) { loop_.enqueue(h, when_); }
		void await_resume() const noexcept {}

	private:
		EventLoop &loop_;
		Clock::time_point when_;
	};

	explicit EventLoop(std::shared_ptr<const Logger::ILogger> logger);
	~EventLoop() noexcept;

	EventLoop(const EventLoop &) = delete;
	EventLoop &operator=(const EventLoop &) = delete;
	EventLoop(EventLoop &&) = delete;
	EventLoop &operator=(EventLoop &&) = delete;

	void start();
	void stop() noexcept;

	[[nodiscard]] bool isRunning() const noexcept;

	/// Moves the awaiting coroutine onto the loop thread.
	[[nodiscard]] ScheduleAwaiter schedule() noexcept { return ScheduleAwaiter(*this, Clock::time_point::min()); }

	/// Resumes the awaiting coroutine on the loop thread once `delay` has elapsed.
	[[nodiscard]] ScheduleAwaiter resumeAfter(std::chrono::milliseconds delay) noexcept
	{
		return ScheduleAwaiter(*this, Clock::now() + delay);
	}

	/// Runs the task on the loop thread. Errors escaping the task are logged.
	void launch(Task<void> task);

	[[nodiscard]] TaskLauncher launcher();

	[[nodiscard]] std::shared_ptr<ITimer> timer();

private:
	void enqueue(std::coroutine_handle<> h, Clock::time_point when);
	void run() noexcept;

	const std::shared_ptr<const Logger::ILogger> logger_;

	mutable std::mutex mutex_;
	std::condition_variable cv_;
	std::deque<std::coroutine_handle<>> ready_;
	std::multimap<Clock::time_point, std::coroutine_handle<>> timers_;
	bool running_ = false;
	bool stopRequested_ = false;
	std::thread thread_;
};

} // namespace LiveVault::Async
