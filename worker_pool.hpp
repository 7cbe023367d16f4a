#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace horizon {

// Fixed set of threads draining a bounded FIFO of jobs. Used to keep blocking
// work off the HTTP event loops.
class WorkerPool {
public:
	using Job = std::function<void()>;

	WorkerPool(std::string name, int workers, std::size_t maxQueue);
	~WorkerPool();

	WorkerPool(const WorkerPool &) = delete;
	WorkerPool &operator=(const WorkerPool &) = delete;

	// False when the pool is stopped or the queue is full; the job is not run.
	bool submit(Job job);

	// Runs every job already queued, then joins the workers.
	void stop();

	std::size_t pending() const;
	std::size_t capacity() const { return maxQueue_; }
	int workers() const { return workerCount_; }
	uint64_t rejected() const { return rejected_.load(); }

private:
	void workerLoop();

	std::string name_;
	int workerCount_;
	std::size_t maxQueue_;
	std::atomic<bool> running_{false};
	std::atomic<uint64_t> rejected_{0};
	std::vector<std::thread> workers_;
	std::queue<Job> queue_;
	mutable std::mutex mu_;
	std::condition_variable cv_;
};

} // namespace horizon
