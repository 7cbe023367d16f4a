#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "context.hpp"
#include "metrics.hpp"

namespace horizon {

using json = nlohmann::json;

struct CachedValue {
	std::string value;
	Millis ttl{0};
};

// Shared (cross-instance) TTL store. Implementations throw on backend failure;
// the cache turns those into misses.
class SharedCacheBackend {
public:
	virtual ~SharedCacheBackend() = default;
	virtual std::optional<CachedValue> get(const std::string &key) = 0;
	virtual void set(const std::string &key, const std::string &value, Millis ttl) = 0;
	virtual std::size_t delPattern(const std::string &pattern) = 0;
	virtual void addTags(const std::string &key, const std::vector<std::string> &tags, Millis ttl) = 0;
	virtual std::size_t delTag(const std::string &tag) = 0;
	virtual bool ping() = 0;
	virtual std::string name() const = 0;
};

using SharedCachePtr = std::shared_ptr<SharedCacheBackend>;

bool globMatch(const std::string &pattern, const std::string &text);

struct PrefetchCandidate {
	std::string key;
	json origin;
	uint64_t accessCount{0};
	Millis remaining{0};
};

// Two-tier cache: bounded LRU+TTL L1 in process, optional shared L2.
class ResultCache {
public:
	using Clock = std::chrono::steady_clock;

	ResultCache(CacheOptions options, SharedCachePtr l2 = nullptr, MetricsPtr metrics = nullptr);
	~ResultCache();

	ResultCache(const ResultCache &) = delete;
	ResultCache &operator=(const ResultCache &) = delete;

	void start();
	void stop();

	std::optional<std::string> get(const std::string &key, const ContextPtr &ctx = nullptr);
	void set(const std::string &key, const std::string &value, Millis ttl,
			 const std::vector<std::string> &tags = {}, const json &origin = json());

	std::size_t invalidate(const std::string &pattern);
	std::size_t invalidateTag(const std::string &tag);
	std::size_t sweepExpired();

	std::vector<PrefetchCandidate> prefetchCandidates(int popularityThreshold, Millis refreshAhead, int maxItems) const;
	void decayAccess(const std::string &key);
	uint64_t accessCount(const std::string &key) const;

	std::size_t size() const;
	bool hasL2() const { return l2_ != nullptr; }
	json stats() const;

private:
	struct Entry {
		std::string value;
		Clock::time_point expiresAt;
		uint64_t accessCount{0};
		std::vector<std::string> tags;
		json origin;
		std::list<std::string>::iterator it;
	};

	struct TierCounters {
		std::atomic<uint64_t> hits{0};
		std::atomic<uint64_t> misses{0};
		std::atomic<uint64_t> evictions{0};
		std::atomic<uint64_t> expirations{0};
		std::atomic<uint64_t> errors{0};
		json toJson() const;
	};

	void putLocal(const std::string &key, const std::string &value, Clock::time_point expiresAt,
				  const std::vector<std::string> &tags, const json &origin, uint64_t accessCount);
	void eraseLocked(std::unordered_map<std::string, Entry>::iterator it);
	void record(const char *tier, const char *result);
	std::string l2Key(const std::string &key) const { return options_.keyPrefix + key; }

	CacheOptions options_;
	SharedCachePtr l2_;
	MetricsPtr metrics_;

	mutable std::mutex mu_;
	std::unordered_map<std::string, Entry> entries_;
	std::list<std::string> lru_;
	std::unordered_map<std::string, std::unordered_set<std::string>> tagIndex_;

	TierCounters l1Stats_;
	TierCounters l2Stats_;
	std::atomic<uint64_t> sets_{0};

	std::atomic<bool> running_{false};
	std::mutex sweepMu_;
	std::condition_variable sweepCv_;
	std::thread sweeper_;
};

} // namespace horizon
