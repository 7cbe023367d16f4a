#ifdef HAVE_REDIS

#include "redis_backend.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <vector>

namespace horizon {

RedisCacheBackend::RedisCacheBackend(const RedisOptions &options, std::string keyPrefix)
	: keyPrefix_(std::move(keyPrefix)) {
	sw::redis::ConnectionOptions opts(options.url);
	opts.connect_timeout = std::chrono::milliseconds(options.connectTimeoutMs);
	opts.socket_timeout = std::chrono::milliseconds(options.socketTimeoutMs);
	sw::redis::ConnectionPoolOptions pool;
	pool.size = (std::size_t)std::max(1, options.poolSize);
	pool.wait_timeout = std::chrono::milliseconds(options.socketTimeoutMs);
	redis_ = std::make_unique<sw::redis::Redis>(opts, pool);
	std::cout << "[RedisCacheBackend] pool=" << pool.size << " url=" << options.url << std::endl;
}

std::optional<CachedValue> RedisCacheBackend::get(const std::string &key) {
	auto value = redis_->get(key);
	if (!value) return std::nullopt;
	long long ttl = redis_->pttl(key);
	// -2: expired between the two calls, -1: no expiry set
	if (ttl == -2) return std::nullopt;
	CachedValue out;
	out.value = *value;
	out.ttl = Millis(ttl < 0 ? 0 : ttl);
	return out;
}

void RedisCacheBackend::set(const std::string &key, const std::string &value, Millis ttl) {
	redis_->set(key, value, ttl);
}

std::size_t RedisCacheBackend::delPattern(const std::string &pattern) {
	std::size_t removed = 0;
	long long cursor = 0;
	do {
		std::vector<std::string> keys;
		cursor = redis_->scan(cursor, pattern, 200, std::back_inserter(keys));
		if (!keys.empty()) removed += (std::size_t)redis_->del(keys.begin(), keys.end());
	} while (cursor != 0);
	return removed;
}

void RedisCacheBackend::addTags(const std::string &key, const std::vector<std::string> &tags, Millis ttl) {
	auto pipe = redis_->pipeline(false);
	for (auto &tag : tags) {
		pipe.sadd(tagKey(tag), key);
		// the set expires together with its most recently written member
		pipe.pexpire(tagKey(tag), ttl);
	}
	pipe.exec();
}

std::size_t RedisCacheBackend::delTag(const std::string &tag) {
	std::vector<std::string> keys;
	redis_->smembers(tagKey(tag), std::back_inserter(keys));
	std::size_t removed = 0;
	if (!keys.empty()) removed = (std::size_t)redis_->del(keys.begin(), keys.end());
	redis_->del(tagKey(tag));
	return removed;
}

bool RedisCacheBackend::ping() {
	try {
		return redis_->ping() == "PONG";
	} catch (const sw::redis::Error &e) {
		std::cerr << "[RedisCacheBackend] ping failed: " << e.what() << std::endl;
		return false;
	}
}

} // namespace horizon

#endif
