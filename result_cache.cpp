#include "result_cache.hpp"

#include <algorithm>
#include <iostream>

namespace horizon {

bool globMatch(const std::string &pattern, const std::string &text) {
	size_t p = 0;
	size_t t = 0;
	size_t star = std::string::npos;
	size_t mark = 0;
	while (t < text.size()) {
		if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
			p++;
			t++;
		} else if (p < pattern.size() && pattern[p] == '*') {
			star = p++;
			mark = t;
		} else if (star != std::string::npos) {
			p = star + 1;
			t = ++mark;
		} else {
			return false;
		}
	}
	while (p < pattern.size() && pattern[p] == '*') p++;
	return p == pattern.size();
}

json ResultCache::TierCounters::toJson() const {
	uint64_t h = hits.load();
	uint64_t m = misses.load();
	return json{
		{"hits", h},
		{"misses", m},
		{"hitRate", (h + m) ? (double)h / (double)(h + m) : 0.0},
		{"evictions", evictions.load()},
		{"expirations", expirations.load()},
		{"errors", errors.load()}
	};
}

ResultCache::ResultCache(CacheOptions options, SharedCachePtr l2, MetricsPtr metrics)
	: options_(std::move(options)), l2_(std::move(l2)), metrics_(std::move(metrics)) {
	if (options_.l1MaxEntries < 1) options_.l1MaxEntries = 1;
}

ResultCache::~ResultCache() {
	stop();
}

void ResultCache::start() {
	if (running_.exchange(true)) return;
	sweeper_ = std::thread([this]() {
		while (running_.load()) {
			{
				std::unique_lock<std::mutex> lock(sweepMu_);
				sweepCv_.wait_for(lock, options_.sweepInterval, [this]() { return !running_.load(); });
			}
			if (!running_.load()) break;
			try {
				sweepExpired();
			} catch (const std::exception &e) {
				std::cerr << "[ResultCache] sweep failed: " << e.what() << std::endl;
			}
		}
	});
}

void ResultCache::stop() {
	{
		std::lock_guard<std::mutex> lock(sweepMu_);
		if (!running_.exchange(false)) return;
	}
	sweepCv_.notify_all();
	if (sweeper_.joinable()) sweeper_.join();
}

void ResultCache::record(const char *tier, const char *result) {
	if (metrics_) metrics_->increment("horizon_cache_requests_total", {{"tier", tier}, {"result", result}});
}

void ResultCache::eraseLocked(std::unordered_map<std::string, Entry>::iterator it) {
	for (auto &tag : it->second.tags) {
		auto t = tagIndex_.find(tag);
		if (t == tagIndex_.end()) continue;
		t->second.erase(it->first);
		if (t->second.empty()) tagIndex_.erase(t);
	}
	lru_.erase(it->second.it);
	entries_.erase(it);
}

void ResultCache::putLocal(const std::string &key, const std::string &value, Clock::time_point expiresAt,
						   const std::vector<std::string> &tags, const json &origin, uint64_t accessCount) {
	uint64_t evicted = 0;
	{
		std::lock_guard<std::mutex> lock(mu_);
		auto existing = entries_.find(key);
		if (existing != entries_.end()) {
			accessCount = std::max(accessCount, existing->second.accessCount);
			eraseLocked(existing);
		}
		lru_.push_front(key);
		Entry e;
		e.value = value;
		e.expiresAt = expiresAt;
		e.accessCount = accessCount;
		e.tags = tags;
		e.origin = origin;
		e.it = lru_.begin();
		entries_[key] = std::move(e);
		for (auto &tag : tags) tagIndex_[tag].insert(key);
		while ((int)entries_.size() > options_.l1MaxEntries) {
			auto victim = entries_.find(lru_.back());
			if (victim == entries_.end()) {
				lru_.pop_back();
				continue;
			}
			eraseLocked(victim);
			evicted++;
		}
	}
	if (evicted) {
		l1Stats_.evictions += evicted;
		if (metrics_) metrics_->increment("horizon_cache_evictions_total", {{"tier", "l1"}}, (double)evicted);
	}
}

std::optional<std::string> ResultCache::get(const std::string &key, const ContextPtr &ctx) {
	{
		std::lock_guard<std::mutex> lock(mu_);
		auto it = entries_.find(key);
		if (it != entries_.end()) {
			if (Clock::now() < it->second.expiresAt) {
				it->second.accessCount++;
				lru_.splice(lru_.begin(), lru_, it->second.it);
				l1Stats_.hits++;
				std::string out = it->second.value;
				record("l1", "hit");
				return out;
			}
			eraseLocked(it);
			l1Stats_.expirations++;
		}
	}
	l1Stats_.misses++;
	record("l1", "miss");

	if (!l2_) return std::nullopt;
	if (ctx) ctx->check(Stage::Cache);
	std::optional<CachedValue> remote;
	try {
		remote = l2_->get(l2Key(key));
	} catch (const std::exception &e) {
		l2Stats_.errors++;
		record("l2", "error");
		std::cerr << "[ResultCache] l2 get failed (" << l2_->name() << "): " << e.what() << std::endl;
		return std::nullopt;
	}
	if (!remote || remote->ttl.count() <= 0) {
		l2Stats_.misses++;
		record("l2", "miss");
		return std::nullopt;
	}

	std::string value = remote->value;
	std::vector<std::string> tags;
	json origin;
	try {
		auto envelope = json::parse(remote->value);
		if (envelope.is_object() && envelope.contains("v") && envelope["v"].is_string()) {
			value = envelope["v"].get<std::string>();
			if (envelope.contains("t")) tags = envelope["t"].get<std::vector<std::string>>();
			if (envelope.contains("o")) origin = envelope["o"];
		}
	} catch (const json::exception &e) {
		l2Stats_.errors++;
		record("l2", "error");
		std::cerr << "[ResultCache] l2 envelope unreadable for " << key << ": " << e.what() << std::endl;
		return std::nullopt;
	}
	l2Stats_.hits++;
	record("l2", "hit");
	putLocal(key, value, Clock::now() + remote->ttl, tags, origin, 1);
	return value;
}

void ResultCache::set(const std::string &key, const std::string &value, Millis ttl,
					  const std::vector<std::string> &tags, const json &origin) {
	if (ttl.count() <= 0) return;
	sets_++;
	putLocal(key, value, Clock::now() + ttl, tags, origin, 0);
	if (!l2_) return;
	try {
		json envelope{{"v", value}, {"t", tags}, {"o", origin}};
		l2_->set(l2Key(key), envelope.dump(), ttl);
		if (!tags.empty()) l2_->addTags(l2Key(key), tags, ttl);
	} catch (const std::exception &e) {
		l2Stats_.errors++;
		record("l2", "error");
		std::cerr << "[ResultCache] l2 set failed (" << l2_->name() << "): " << e.what() << std::endl;
	}
}

std::size_t ResultCache::invalidate(const std::string &pattern) {
	std::size_t removed = 0;
	{
		std::lock_guard<std::mutex> lock(mu_);
		for (auto it = entries_.begin(); it != entries_.end();) {
			auto next = std::next(it);
			if (globMatch(pattern, it->first)) {
				eraseLocked(it);
				removed++;
			}
			it = next;
		}
	}
	if (l2_) {
		try {
			removed += l2_->delPattern(l2Key(pattern));
		} catch (const std::exception &e) {
			l2Stats_.errors++;
			record("l2", "error");
			std::cerr << "[ResultCache] l2 invalidate failed: " << e.what() << std::endl;
		}
	}
	std::cout << "[ResultCache] invalidated pattern '" << pattern << "' (" << removed << " keys)" << std::endl;
	return removed;
}

std::size_t ResultCache::invalidateTag(const std::string &tag) {
	std::size_t removed = 0;
	{
		std::lock_guard<std::mutex> lock(mu_);
		auto t = tagIndex_.find(tag);
		if (t != tagIndex_.end()) {
			auto keys = t->second;
			for (auto &key : keys) {
				auto it = entries_.find(key);
				if (it == entries_.end()) continue;
				eraseLocked(it);
				removed++;
			}
		}
	}
	if (l2_) {
		try {
			removed += l2_->delTag(tag);
		} catch (const std::exception &e) {
			l2Stats_.errors++;
			record("l2", "error");
			std::cerr << "[ResultCache] l2 tag invalidate failed: " << e.what() << std::endl;
		}
	}
	std::cout << "[ResultCache] invalidated tag '" << tag << "' (" << removed << " keys)" << std::endl;
	return removed;
}

std::size_t ResultCache::sweepExpired() {
	std::size_t removed = 0;
	{
		std::lock_guard<std::mutex> lock(mu_);
		auto now = Clock::now();
		for (auto it = entries_.begin(); it != entries_.end();) {
			auto next = std::next(it);
			if (it->second.expiresAt <= now) {
				eraseLocked(it);
				removed++;
			}
			it = next;
		}
	}
	l1Stats_.expirations += removed;
	return removed;
}

std::vector<PrefetchCandidate> ResultCache::prefetchCandidates(int popularityThreshold, Millis refreshAhead, int maxItems) const {
	std::vector<PrefetchCandidate> out;
	{
		std::lock_guard<std::mutex> lock(mu_);
		auto now = Clock::now();
		for (auto &kv : entries_) {
			const auto &e = kv.second;
			if (e.expiresAt <= now || e.origin.is_null()) continue;
			if ((int64_t)e.accessCount < popularityThreshold) continue;
			auto remaining = std::chrono::duration_cast<Millis>(e.expiresAt - now);
			if (remaining >= refreshAhead) continue;
			out.push_back(PrefetchCandidate{kv.first, e.origin, e.accessCount, remaining});
		}
	}
	std::sort(out.begin(), out.end(), [](const PrefetchCandidate &a, const PrefetchCandidate &b) {
		if (a.accessCount != b.accessCount) return a.accessCount > b.accessCount;
		return a.remaining < b.remaining;
	});
	if (maxItems >= 0 && (int)out.size() > maxItems) out.resize((size_t)maxItems);
	return out;
}

void ResultCache::decayAccess(const std::string &key) {
	std::lock_guard<std::mutex> lock(mu_);
	auto it = entries_.find(key);
	if (it != entries_.end()) it->second.accessCount /= 2;
}

uint64_t ResultCache::accessCount(const std::string &key) const {
	std::lock_guard<std::mutex> lock(mu_);
	auto it = entries_.find(key);
	return it == entries_.end() ? 0 : it->second.accessCount;
}

std::size_t ResultCache::size() const {
	std::lock_guard<std::mutex> lock(mu_);
	return entries_.size();
}

json ResultCache::stats() const {
	json out{
		{"l1", l1Stats_.toJson()},
		{"sets", sets_.load()},
		{"size", size()},
		{"capacity", options_.l1MaxEntries}
	};
	if (l2_) {
		out["l2"] = l2Stats_.toJson();
		out["l2"]["backend"] = l2_->name();
	} else {
		out["l2"] = nullptr;
	}
	return out;
}

} // namespace horizon
