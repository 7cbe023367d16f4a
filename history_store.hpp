#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "kv_store.hpp"

namespace horizon {

// Append-only log of validation runs. Records are keyed run:<seq> with a
// zero-padded sequence so key order is append order on every backend.
class ValidationHistoryStore {
public:
	explicit ValidationHistoryStore(KeyValueStorePtr store);

	uint64_t append(const json &record);
	// Newest first.
	std::vector<json> recent(std::size_t limit) const;
	uint64_t size() const;
	void flush();

private:
	static std::string keyFor(uint64_t seq);

	KeyValueStorePtr store_;
	mutable std::mutex mu_;
	uint64_t nextSeq_{1};
};

} // namespace horizon
