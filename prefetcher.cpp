#include "prefetcher.hpp"

#include <iostream>

namespace horizon {

Prefetcher::Prefetcher(std::shared_ptr<ResultCache> cache, PrefetchOptions options, Refresher refresher, PauseCheck paused)
	: cache_(std::move(cache)), options_(options), refresher_(std::move(refresher)), paused_(std::move(paused)) {}

Prefetcher::~Prefetcher() {
	stop();
}

void Prefetcher::start() {
	if (running_.exchange(true)) return;
	worker_ = std::thread([this]() {
		while (running_.load()) {
			{
				std::unique_lock<std::mutex> lock(mu_);
				cv_.wait_for(lock, options_.interval, [this]() { return !running_.load(); });
			}
			if (!running_.load()) break;
			try {
				runCycle();
			} catch (const std::exception &e) {
				std::cerr << "[Prefetcher] cycle failed: " << e.what() << std::endl;
			}
		}
	});
	std::cout << "[Prefetcher] started interval=" << options_.interval.count() << "ms threshold="
			  << options_.popularityThreshold << std::endl;
}

void Prefetcher::stop() {
	{
		std::lock_guard<std::mutex> lock(mu_);
		if (!running_.exchange(false)) return;
	}
	cv_.notify_all();
	if (worker_.joinable()) worker_.join();
}

int Prefetcher::runCycle() {
	cycles_++;
	if (paused_ && paused_()) {
		skipped_++;
		return 0;
	}
	auto candidates = cache_->prefetchCandidates(options_.popularityThreshold, options_.refreshAhead, options_.maxItems);
	int done = 0;
	for (auto &c : candidates) {
		if (paused_ && paused_()) break;
		try {
			refresher_(c.key, c.origin);
			cache_->decayAccess(c.key);
			done++;
		} catch (const std::exception &e) {
			failures_++;
			std::cerr << "[Prefetcher] refresh " << c.key << " failed: " << e.what() << std::endl;
		}
	}
	refreshed_ += (uint64_t)done;
	if (done > 0) std::cout << "[Prefetcher] refreshed " << done << "/" << candidates.size() << " entries" << std::endl;
	return done;
}

json Prefetcher::stats() const {
	return json{
		{"running", running_.load()},
		{"cycles", cycles_.load()},
		{"refreshed", refreshed_.load()},
		{"failures", failures_.load()},
		{"skipped", skipped_.load()},
		{"intervalMs", options_.interval.count()},
		{"popularityThreshold", options_.popularityThreshold},
		{"refreshAheadMs", options_.refreshAhead.count()},
		{"maxItems", options_.maxItems}
	};
}

} // namespace horizon
