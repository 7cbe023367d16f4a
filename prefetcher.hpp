#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "result_cache.hpp"

namespace horizon {

// Re-warms popular entries that are about to expire. The refresher recomputes
// the value for (key, origin) and writes it back into the cache itself.
class Prefetcher {
public:
	using Refresher = std::function<void(const std::string &key, const json &origin)>;
	using PauseCheck = std::function<bool()>;

	Prefetcher(std::shared_ptr<ResultCache> cache, PrefetchOptions options, Refresher refresher, PauseCheck paused = nullptr);
	~Prefetcher();

	void start();
	void stop();
	bool running() const { return running_.load(); }

	// One pass over the candidates; returns how many were refreshed.
	int runCycle();

	json stats() const;

private:
	std::shared_ptr<ResultCache> cache_;
	PrefetchOptions options_;
	Refresher refresher_;
	PauseCheck paused_;

	std::atomic<bool> running_{false};
	std::mutex mu_;
	std::condition_variable cv_;
	std::thread worker_;

	std::atomic<uint64_t> cycles_{0};
	std::atomic<uint64_t> refreshed_{0};
	std::atomic<uint64_t> failures_{0};
	std::atomic<uint64_t> skipped_{0};
};

} // namespace horizon
