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

#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <utility>

#include "Task.hpp"

namespace LiveVault::Async {

namespace Detail {

struct JoinState {
	std::mutex mutex;
	std::condition_variable cv;
	bool done = false;
	std::exception_ptr error;
};

struct JoinRoutine {
	struct promise_type {
		JoinRoutine get_return_object() noexcept { return {}; }
		std::suspend_never initial_suspend() noexcept { return {}; }
		std::suspend_never final_suspend() noexcept { return {}; }
		void return_void() noexcept {}
		void unhandled_exception() noexcept { std::terminate(); }
	};
};

template<typename T> JoinRoutine runJoined(Task<T> task, JoinState &state, std::optional<T> &result)
{
	try {
		result.emplace(co_await task);
	} catch (...) {
		state.error = std::current_exception();
	}

	std::scoped_lock lock(state.mutex);
	state.done = true;
	state.cv.notify_one();
}

inline JoinRoutine runJoined(Task<void> task, JoinState &state)
{
	try {
		co_await task;
	} catch (...) {
		state.error = std::current_exception();
	}

	std::scoped_lock lock(state.mutex);
	state.done = true;
	state.cv.notify_one();
}

} // namespace Detail

/**
 * Blocks the calling thread until the task completes, possibly on another
 * thread, and rethrows its exception. Never call this from a thread the task
 * needs in order to make progress.
 */
inline void join(Task<void> task)
{
	if (!task)
		return;

	Detail::JoinState state;
	Detail::runJoined(std::move(task), state);

	std::unique_lock lock(state.mutex);
	state.cv.wait(lock, [&state] { return state.done; });

	if (state.error) {
		std::rethrow_exception(state.error);
	}
}

template<typename T> T join(Task<T> task)
{
	Detail::JoinState state;
	std::optional<T> result;
	Detail::runJoined(std::move(task), state, result);

	std::unique_lock lock(state.mutex);
	state.cv.wait(lock, [&state] { return state.done; });

	if (state.error) {
		std::rethrow_exception(state.error);
	}
	return std::move(*result);
}

} // namespace LiveVault::Async
