#include "worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace horizon {

WorkerPool::WorkerPool(std::string name, int workers, std::size_t maxQueue)
	: name_(std::move(name)), workerCount_(std::max(1, workers)), maxQueue_(std::max<std::size_t>(1, maxQueue)) {
	running_ = true;
	workers_.reserve(workerCount_);
	for (int i = 0; i < workerCount_; i++) {
		workers_.emplace_back([this]() { workerLoop(); });
	}
}

WorkerPool::~WorkerPool() {
	stop();
}

bool WorkerPool::submit(Job job) {
	{
		std::lock_guard<std::mutex> lock(mu_);
		if (!running_ || queue_.size() >= maxQueue_) {
			rejected_++;
			return false;
		}
		queue_.push(std::move(job));
	}
	cv_.notify_one();
	return true;
}

void WorkerPool::stop() {
	{
		std::lock_guard<std::mutex> lock(mu_);
		if (!running_) return;
		running_ = false;
	}
	cv_.notify_all();
	for (auto &t : workers_) {
		if (t.joinable()) t.join();
	}
	workers_.clear();
	std::cout << "[WorkerPool] " << name_ << " stopped" << std::endl;
}

std::size_t WorkerPool::pending() const {
	std::lock_guard<std::mutex> lock(mu_);
	return queue_.size();
}

void WorkerPool::workerLoop() {
	for (;;) {
		Job job;
		{
			std::unique_lock<std::mutex> lock(mu_);
			cv_.wait(lock, [&]() { return !running_ || !queue_.empty(); });
			if (queue_.empty()) return;
			job = std::move(queue_.front());
			queue_.pop();
		}
		try {
			job();
		} catch (const std::exception &e) {
			std::cerr << "[WorkerPool] " << name_ << " job failed: " << e.what() << std::endl;
		}
	}
}

} // namespace horizon
