#include "history_store.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace horizon {

ValidationHistoryStore::ValidationHistoryStore(KeyValueStorePtr store) : store_(std::move(store)) {
	if (!store_) throw std::runtime_error("history-store-requires-backend");
	for (auto &kv : store_->entries("run:")) {
		try {
			uint64_t seq = std::stoull(kv.first.substr(4));
			nextSeq_ = std::max(nextSeq_, seq + 1);
		} catch (const std::exception &) {
			continue;
		}
	}
}

std::string ValidationHistoryStore::keyFor(uint64_t seq) {
	char buf[32];
	std::snprintf(buf, sizeof(buf), "run:%020llu", (unsigned long long)seq);
	return buf;
}

uint64_t ValidationHistoryStore::append(const json &record) {
	std::lock_guard<std::mutex> lock(mu_);
	uint64_t seq = nextSeq_++;
	json stored = record;
	stored["seq"] = seq;
	if (!stored.contains("recordedAtMs")) {
		stored["recordedAtMs"] = (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::system_clock::now().time_since_epoch()).count();
	}
	store_->put(keyFor(seq), stored);
	return seq;
}

std::vector<json> ValidationHistoryStore::recent(std::size_t limit) const {
	auto all = store_->entries("run:");
	std::sort(all.begin(), all.end(), [](const auto &a, const auto &b) { return a.first > b.first; });
	std::vector<json> out;
	for (auto &kv : all) {
		if (out.size() >= limit) break;
		out.push_back(kv.second);
	}
	return out;
}

uint64_t ValidationHistoryStore::size() const {
	std::lock_guard<std::mutex> lock(mu_);
	return nextSeq_ - 1;
}

void ValidationHistoryStore::flush() {
	store_->flush();
}

} // namespace horizon
