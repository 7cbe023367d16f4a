#pragma once

#ifdef HAVE_REDIS

#include <memory>
#include <string>

#include <sw/redis++/redis++.h>

#include "config.hpp"
#include "result_cache.hpp"

namespace horizon {

// L2 tier on a pooled sw::redis::Redis client. Tag membership lives in
// Redis sets under <prefix>tag:<tag>.
class RedisCacheBackend : public SharedCacheBackend {
public:
	RedisCacheBackend(const RedisOptions &options, std::string keyPrefix);

	std::optional<CachedValue> get(const std::string &key) override;
	void set(const std::string &key, const std::string &value, Millis ttl) override;
	std::size_t delPattern(const std::string &pattern) override;
	void addTags(const std::string &key, const std::vector<std::string> &tags, Millis ttl) override;
	std::size_t delTag(const std::string &tag) override;
	bool ping() override;
	std::string name() const override { return "redis"; }

private:
	std::string tagKey(const std::string &tag) const { return keyPrefix_ + "tag:" + tag; }

	std::string keyPrefix_;
	std::unique_ptr<sw::redis::Redis> redis_;
};

} // namespace horizon

#endif
