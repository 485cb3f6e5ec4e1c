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

/**
 * @brief Lazily started C++20 coroutine task.
 *
 * A Task<T> does nothing until it is awaited (or started as the root of a
 * chain). On completion control passes straight back to the awaiting
 * coroutine through symmetric transfer, so long await chains do not grow
 * the native stack. Exceptions thrown inside the coroutine are stored and
 * rethrown from co_await.
 *
 * Ownership is unique: destroying a Task destroys its coroutine frame.
 */

#include <coroutine>
#include <exception>
#include <stdexcept>
#include <utility>
#include <variant>

namespace LiveVault::Async {

template<typename PromiseType> struct TaskFinalAwaiter {
	bool await_ready() noexcept { return false; }

	std::coroutine_handle<> await_suspend(std::coroutine_handle<PromiseType> h) noexcept
	{
		if (auto continuation = h.promise().continuation) {
			return continuation;
		}
		return std::noop_coroutine();
	}

	void await_resume() noexcept {}
};

template<typename T> struct TaskPromiseBase {
	// monostate while running, then either the value or the exception.
	std::variant<std::monostate, T, std::exception_ptr> result_;

	void return_value(T v) { result_.template emplace<1>(std::move(v)); }
	void unhandled_exception() { result_.template emplace<2>(std::current_exception()); }

	T extract_value()
	{
		if (result_.index() == 2) {
			std::rethrow_exception(std::get<2>(result_));
		} else if (result_.index() == 0) {
			throw std::logic_error("TaskNotReadyError(TaskPromiseBase::extract_value)");
		}
		return std::move(std::get<1>(result_));
	}
};

template<> struct TaskPromiseBase<void> {
	bool done_ = false;
	std::exception_ptr error_;

	void return_void() noexcept { done_ = true; }
	void unhandled_exception() noexcept { error_ = std::current_exception(); }

	void extract_value()
	{
		if (error_) {
			std::rethrow_exception(error_);
		} else if (!done_) {
			throw std::logic_error("TaskNotReadyError(TaskPromiseBase::extract_value)");
		}
	}
};

template<typename T> struct [[nodiscard("A Task does nothing unless awaited or started")]] Task {
	struct promise_type : TaskPromiseBase<T> {
		std::coroutine_handle<> continuation = nullptr;

		Task get_return_object() { return Task{std::coroutine_handle<promise_type>::from_promise(*this)}; }

		std::suspend_always initial_suspend() noexcept { return {}; }
		auto final_suspend() noexcept { return TaskFinalAwaiter<promise_type>{}; }
	};

	Task() noexcept = default;

	explicit Task(std::coroutine_handle<promise_type> h) noexcept : handle_(h) {}

	~Task()
	{
		if (handle_)
			handle_.destroy();
	}

	Task(const Task &) = delete;
	Task &operator=(const Task &) = delete;

	Task(Task &&other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}
	Task &operator=(Task &&other) noexcept
	{
		if (this != &other) {
			if (handle_)
				handle_.destroy();
			handle_ = std::exchange(other.handle_, nullptr);
		}
		return *this;
	}

	explicit operator bool() const noexcept { return handle_ != nullptr; }

	[[nodiscard]] bool await_ready() const noexcept { return !handle_ || handle_.done(); }

	std::coroutine_handle<> await_suspend(std::coroutine_handle<> caller) noexcept
	{
		handle_.promise().continuation = caller;
		return handle_;
	}

	T await_resume() { return handle_.promise().extract_value(); }

	/// Runs a root task until its first suspension. No-op on an empty or finished task.
	void start()
	{
		if (handle_ && !handle_.done())
			handle_.resume();
	}

	[[nodiscard]] bool done() const noexcept { return handle_ && handle_.done(); }

private:
	std::coroutine_handle<promise_type> handle_ = nullptr;
};

} // namespace LiveVault::Async
