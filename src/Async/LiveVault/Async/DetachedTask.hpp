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

#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>

#include <LiveVault/Logger/ILogger.hpp>

#include "Task.hpp"

namespace LiveVault::Async {

namespace Detail {

struct DetachedRoutine {
	struct promise_type {
		DetachedRoutine get_return_object() noexcept { return {}; }
		std::suspend_never initial_suspend() noexcept { return {}; }
		std::suspend_never final_suspend() noexcept { return {}; }
		void return_void() noexcept {}
		void unhandled_exception() noexcept { std::terminate(); }
	};
};

inline DetachedRoutine runDetached(Task<void> task, std::shared_ptr<const Logger::ILogger> logger)
{
	try {
		co_await task;
	} catch (const std::exception &e) {
		logger->error("DetachedTaskError", {{"exception", e.what()}});
	} catch (...) {
		logger->error("DetachedTaskUnknownError");
	}
}

} // namespace Detail

/// Receives ownership of a task and decides where it runs.
using TaskLauncher = std::function<void(Task<void>)>;

/**
 * Starts the task on the calling thread and lets it finish on its own.
 * The coroutine frame frees itself when the task completes. Exceptions that
 * escape the task are logged, never rethrown.
 */
inline void launchDetached(Task<void> task, std::shared_ptr<const Logger::ILogger> logger)
{
	if (!task)
		throw std::invalid_argument("TaskIsEmptyError(launchDetached)");
	if (!logger)
		throw std::invalid_argument("LoggerIsNullError(launchDetached)");

	Detail::runDetached(std::move(task), std::move(logger));
}

} // namespace LiveVault::Async
