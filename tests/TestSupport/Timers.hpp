/*
 * LiveVault - Test Support
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <chrono>
#include <coroutine>
#include <deque>
#include <mutex>
#include <vector>

#include <LiveVault/Async/ITimer.hpp>

namespace LiveVault::Tests {

/// Completes every sleep immediately and records the requested delays.
class ImmediateTimer final : public Async::ITimer {
public:
	Async::Task<void> sleepFor(std::chrono::milliseconds delay) override
	{
		delays.push_back(delay);
		co_return;
	}

	std::vector<std::chrono::milliseconds> delays;
};

/// Sleeps stay suspended until the test fires them, in the order they were requested.
class ManualTimer final : public Async::ITimer {
public:
	Async::Task<void> sleepFor(std::chrono::milliseconds delay) override
	{
		delays.push_back(delay);
		co_await Sleep{*this};
	}

	std::size_t pending() const noexcept { return waiting_.size(); }

	/// Resumes the oldest sleeper on the calling thread. Returns false when none is waiting.
	bool fireNext()
	{
		if (waiting_.empty())
			return false;
		std::coroutine_handle<> h = waiting_.front();
		waiting_.pop_front();
		h.resume();
		return true;
	}

	std::vector<std::chrono::milliseconds> delays;

private:
	struct Sleep {
		ManualTimer &timer;

		bool await_ready() const noexcept { return false; }
		void await_suspend(std::coroutine_handle<> h) { timer.waiting_.push_back(h); }
		void await_resume() const noexcept {}
	};

	std::deque<std::coroutine_handle<>> waiting_;
};

} // namespace LiveVault::Tests
