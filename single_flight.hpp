#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "context.hpp"

namespace horizon {

// Collapses concurrent calls with the same key into one execution. Each
// flight runs on its own thread under its own context; callers only wait.
// A flight is cancelled once every caller waiting on it has given up.
template <typename T>
class SingleFlight {
public:
	using Task = std::function<T(const ContextPtr &flightCtx)>;

	SingleFlight() = default;
	~SingleFlight() { shutdown(); }

	SingleFlight(const SingleFlight &) = delete;
	SingleFlight &operator=(const SingleFlight &) = delete;

	// Joins the flight for key or starts one bounded by flightDeadline. Throws
	// whatever the task throws, or Cancelled/Timeout (tagged with stage) when
	// the caller's context finishes first.
	T run(const std::string &key, const ContextPtr &caller, Context::Clock::time_point flightDeadline, Stage stage,
		  Task task, bool *joined = nullptr) {
		std::shared_ptr<Flight> flight;
		{
			std::lock_guard<std::mutex> lock(mu_);
			if (stopping_) throw RiskError(ErrorCode::Cancelled, stage, "engine-stopping");
			reapLocked();
			auto it = flights_.find(key);
			if (it != flights_.end()) {
				flight = it->second;
				if (joined) *joined = true;
				joinedCount_++;
			} else {
				flight = std::make_shared<Flight>();
				flight->ctx = Context::withDeadline(Context::background(), flightDeadline);
				flight->future = flight->promise.get_future().share();
				flights_[key] = flight;
				if (joined) *joined = false;
				launchLocked(key, flight, std::move(task));
			}
			flight->waiters++;
		}

		// woken by the flight finishing, or by the caller being cancelled or expiring
		auto waiter = Context::withCancel(caller ? caller : Context::background());
		{
			std::lock_guard<std::mutex> lock(mu_);
			if (!flight->finished) flight->wakers.push_back(waiter);
		}
		while (flight->future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
			if (caller && caller->done()) {
				abandon(key, flight);
				caller->check(stage);
			}
			waiter->waitFor(std::chrono::seconds(1));
		}
		{
			std::lock_guard<std::mutex> lock(mu_);
			flight->waiters--;
		}
		return flight->future.get();
	}

	std::size_t inFlight() const {
		std::lock_guard<std::mutex> lock(mu_);
		return flights_.size();
	}

	uint64_t joinedCount() const {
		std::lock_guard<std::mutex> lock(mu_);
		return joinedCount_;
	}

	// Cancels every running flight and joins their threads.
	void shutdown() {
		std::list<Worker> workers;
		{
			std::lock_guard<std::mutex> lock(mu_);
			stopping_ = true;
			for (auto &kv : flights_) kv.second->ctx->cancel();
			flights_.clear();
			workers.swap(workers_);
		}
		for (auto &w : workers) {
			if (w.thread.joinable()) w.thread.join();
		}
	}

private:
	struct Flight {
		ContextPtr ctx;
		std::promise<T> promise;
		std::shared_future<T> future;
		int waiters{0};
		bool finished{false};
		std::vector<ContextPtr> wakers;
	};

	struct Worker {
		std::thread thread;
		std::shared_ptr<std::atomic<bool>> finished;
	};

	void launchLocked(const std::string &key, const std::shared_ptr<Flight> &flight, Task task) {
		auto finished = std::make_shared<std::atomic<bool>>(false);
		Worker w;
		w.finished = finished;
		w.thread = std::thread([this, key, flight, finished, task = std::move(task)]() {
			try {
				flight->promise.set_value(task(flight->ctx));
			} catch (...) {
				flight->promise.set_exception(std::current_exception());
			}
			std::vector<ContextPtr> wakers;
			{
				std::lock_guard<std::mutex> lock(mu_);
				flight->finished = true;
				wakers.swap(flight->wakers);
				auto it = flights_.find(key);
				if (it != flights_.end() && it->second == flight) flights_.erase(it);
			}
			for (auto &w : wakers) w->cancel();
			finished->store(true);
		});
		workers_.push_back(std::move(w));
	}

	void abandon(const std::string &key, const std::shared_ptr<Flight> &flight) {
		std::lock_guard<std::mutex> lock(mu_);
		flight->waiters--;
		if (flight->waiters > 0) return;
		flight->ctx->cancel();
		auto it = flights_.find(key);
		if (it != flights_.end() && it->second == flight) flights_.erase(it);
	}

	void reapLocked() {
		for (auto it = workers_.begin(); it != workers_.end();) {
			if (it->finished->load()) {
				if (it->thread.joinable()) it->thread.join();
				it = workers_.erase(it);
			} else {
				++it;
			}
		}
	}

	mutable std::mutex mu_;
	std::unordered_map<std::string, std::shared_ptr<Flight>> flights_;
	std::list<Worker> workers_;
	uint64_t joinedCount_{0};
	bool stopping_{false};
};

} // namespace horizon
