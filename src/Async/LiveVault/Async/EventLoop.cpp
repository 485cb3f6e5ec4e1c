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

#include "EventLoop.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace LiveVault::Async {

namespace {

class EventLoopTimer final : public ITimer {
public:
	explicit EventLoopTimer(std::weak_ptr<EventLoop> loop) : loop_(std::move(loop)) {}

	Task<void> sleepFor(std::chrono::milliseconds delay) override
	{
		std::shared_ptr<EventLoop> loop = loop_.lock();
		if (!loop) {
			throw std::runtime_error("EventLoopExpiredError(EventLoopTimer::sleepFor)");
		}
		co_await loop->resumeAfter(delay);
	}

private:
	std::weak_ptr<EventLoop> loop_;
};

Task<void> onLoop(EventLoop &loop, Task<void> task)
{
	co_await loop.schedule();
	co_await task;
}

} // anonymous namespace

EventLoop::EventLoop(std::shared_ptr<const Logger::ILogger> logger) : logger_(std::move(logger))
{
	if (!logger_) {
		throw std::invalid_argument("LoggerIsNullError(EventLoop::EventLoop)");
	}
}

EventLoop::~EventLoop() noexcept
{
	stop();
}

void EventLoop::start()
{
	std::scoped_lock lock(mutex_);
	if (running_) {
		logger_->error("EventLoopAlreadyRunningError");
		throw std::logic_error("EventLoopAlreadyRunningError(EventLoop::start)");
	}
	running_ = true;
	stopRequested_ = false;
	thread_ = std::thread([this] { run(); });
}

void EventLoop::stop() noexcept
{
	{
		std::scoped_lock lock(mutex_);
		if (!running_)
			return;
		stopRequested_ = true;
	}
	cv_.notify_all();

	if (thread_.joinable()) {
		if (thread_.get_id() == std::this_thread::get_id()) {
			thread_.detach();
		} else {
			thread_.join();
		}
	}

	std::deque<std::coroutine_handle<>> ready;
	std::multimap<Clock::time_point, std::coroutine_handle<>> timers;
	{
		std::scoped_lock lock(mutex_);
		running_ = false;
		ready.swap(ready_);
		timers.swap(timers_);
	}

	// The frames belong to the awaiting tasks, so they are abandoned here rather than destroyed.
	if (!ready.empty() || !timers.empty()) {
		logger_->warn("EventLoopStoppedWithPendingWork",
			      {{"ready", std::to_string(ready.size())}, {"timers", std::to_string(timers.size())}});
	}
}

bool EventLoop::isRunning() const noexcept
{
	std::scoped_lock lock(mutex_);
	return running_ && !stopRequested_;
}

void EventLoop::launch(Task<void> task)
{
	launchDetached(onLoop(*this, std::move(task)), logger_);
}

TaskLauncher EventLoop::launcher()
{
	std::weak_ptr<EventLoop> weak = weak_from_this();
	return [weak, logger = logger_](Task<void> task) {
		if (std::shared_ptr<EventLoop> loop = weak.lock()) {
			loop->launch(std::move(task));
		} else {
			logger->warn("EventLoopExpiredTaskDropped");
		}
	};
}

std::shared_ptr<ITimer> EventLoop::timer()
{
	return std::make_shared<EventLoopTimer>(weak_from_this());
}

void EventLoop::enqueue(std::coroutine_handle<> h, Clock::time_point when)
{
	{
		std::scoped_lock lock(mutex_);
		if (when == Clock::time_point::min()) {
			ready_.push_back(h);
		} else {
			timers_.emplace(when, h);
		}
	}
	cv_.notify_one();
}

void EventLoop::run() noexcept
{
	std::unique_lock lock(mutex_);
	while (!stopRequested_) {
		Clock::time_point now = Clock::now();
		while (!timers_.empty() && timers_.begin()->first <= now) {
			ready_.push_back(timers_.begin()->second);
			timers_.erase(timers_.begin());
		}

		if (ready_.empty()) {
			if (timers_.empty()) {
				cv_.wait(lock);
			} else {
				cv_.wait_until(lock, timers_.begin()->first);
			}
			continue;
		}

		std::vector<std::coroutine_handle<>> batch(ready_.begin(), ready_.end());
		ready_.clear();

		lock.unlock();
		for (auto h : batch) {
			h.resume();
		}
		lock.lock();
	}
}

} // namespace LiveVault::Async
