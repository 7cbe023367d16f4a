#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#ifdef HAVE_LMDB
#include <lmdb.h>
#endif

namespace horizon {

using json = nlohmann::json;
namespace fs = std::filesystem;

void ensureDir(const fs::path &p);

class KeyValueStore {
public:
	virtual ~KeyValueStore() = default;
	virtual std::optional<json> get(const std::string &key) = 0;
	virtual void put(const std::string &key, const json &value) = 0;
	virtual void del(const std::string &key) = 0;
	// Ordered by key for LMDB, by insertion for the file store.
	virtual std::vector<std::pair<std::string, json>> entries(const std::string &prefix) = 0;
	virtual void flush() {}
	virtual std::string kind() const = 0;
};

using KeyValueStorePtr = std::shared_ptr<KeyValueStore>;

#ifdef HAVE_LMDB
class LmdbStore : public KeyValueStore {
public:
	LmdbStore(const std::string &name, const fs::path &rootDir, std::size_t mapSizeBytes);
	~LmdbStore() override;

	bool ok() const { return ok_; }

	std::optional<json> get(const std::string &key) override;
	void put(const std::string &key, const json &value) override;
	void del(const std::string &key) override;
	std::vector<std::pair<std::string, json>> entries(const std::string &prefix) override;
	std::string kind() const override { return "lmdb"; }

private:
	void check(int rc, const char *op) const;

	std::string name_;
	fs::path rootDir_;
	std::size_t mapSizeBytes_;
	bool ok_{false};
	MDB_env *env_{nullptr};
	MDB_dbi dbi_{0};
	std::mutex writeMu_;
};
#endif

class JsonFileStore : public KeyValueStore {
public:
	JsonFileStore(const std::string &name, const fs::path &rootDir, std::chrono::milliseconds flushInterval = std::chrono::seconds(10));
	~JsonFileStore() override;

	std::optional<json> get(const std::string &key) override;
	void put(const std::string &key, const json &value) override;
	void del(const std::string &key) override;
	std::vector<std::pair<std::string, json>> entries(const std::string &prefix) override;
	void flush() override;
	std::string kind() const override { return "json-file"; }

	const fs::path &file() const { return file_; }

private:
	void load();
	void startFlushThread();
	void stopFlushThread();

	std::string name_;
	fs::path rootDir_;
	fs::path file_;
	std::chrono::milliseconds flushInterval_;
	bool dirty_{false};
	std::unordered_map<std::string, json> data_;
	std::vector<std::string> order_;
	std::mutex mu_;
	std::atomic<bool> running_{false};
	std::mutex flushMu_;
	std::condition_variable flushCv_;
	std::thread flushThread_;
};

// Key-prefix view over another store.
class NamespacedStore : public KeyValueStore {
public:
	NamespacedStore(KeyValueStorePtr base, const std::string &ns);

	std::optional<json> get(const std::string &key) override { return base_->get(prefix_ + key); }
	void put(const std::string &key, const json &value) override { base_->put(prefix_ + key, value); }
	void del(const std::string &key) override { base_->del(prefix_ + key); }
	std::vector<std::pair<std::string, json>> entries(const std::string &prefix) override;
	void flush() override { base_->flush(); }
	std::string kind() const override { return base_->kind(); }

private:
	KeyValueStorePtr base_;
	std::string prefix_;
};

// LMDB when it is compiled in and opens, JSON file otherwise.
KeyValueStorePtr openStore(const std::string &name, const fs::path &rootDir, std::size_t mapSizeBytes);

} // namespace horizon
