#include "kv_store.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace horizon {

void ensureDir(const fs::path &p) {
	std::error_code ec;
	fs::create_directories(p, ec);
	if (ec) throw std::runtime_error("mkdir-failed:" + p.string() + ":" + ec.message());
}

// ------------------ LMDB ------------------

#ifdef HAVE_LMDB
LmdbStore::LmdbStore(const std::string &name, const fs::path &rootDir, std::size_t mapSizeBytes)
	: name_(name), rootDir_(rootDir), mapSizeBytes_(mapSizeBytes) {
	fs::path envPath = rootDir_ / name_;
	ensureDir(envPath);
	if (mdb_env_create(&env_) != 0) {
		env_ = nullptr;
		std::cerr << "[LmdbStore] env create failed for " << name_ << std::endl;
		return;
	}
	mdb_env_set_maxreaders(env_, 64);
	mdb_env_set_mapsize(env_, mapSizeBytes_);
	mdb_env_set_maxdbs(env_, 4);
	int rc = mdb_env_open(env_, envPath.string().c_str(), 0, 0664);
	if (rc != 0) {
		std::cerr << "[LmdbStore] open " << envPath.string() << " failed: " << mdb_strerror(rc) << std::endl;
		mdb_env_close(env_);
		env_ = nullptr;
		return;
	}
	MDB_txn *txn = nullptr;
	if (mdb_txn_begin(env_, nullptr, 0, &txn) != 0) return;
	if (mdb_dbi_open(txn, "default", MDB_CREATE, &dbi_) != 0) {
		mdb_txn_abort(txn);
		return;
	}
	ok_ = mdb_txn_commit(txn) == 0;
}

LmdbStore::~LmdbStore() {
	if (env_) {
		mdb_dbi_close(env_, dbi_);
		mdb_env_close(env_);
	}
}

void LmdbStore::check(int rc, const char *op) const {
	if (rc != 0) throw std::runtime_error(std::string("lmdb-") + op + ":" + name_ + ":" + mdb_strerror(rc));
}

std::optional<json> LmdbStore::get(const std::string &key) {
	if (!ok_) return std::nullopt;
	MDB_txn *txn = nullptr;
	check(mdb_txn_begin(env_, nullptr, MDB_RDONLY, &txn), "txn");
	MDB_val k{key.size(), (void *)key.data()};
	MDB_val v;
	int rc = mdb_get(txn, dbi_, &k, &v);
	std::string raw = rc == 0 ? std::string((char *)v.mv_data, v.mv_size) : std::string();
	mdb_txn_abort(txn);
	if (rc == MDB_NOTFOUND) return std::nullopt;
	check(rc, "get");
	return json::parse(raw);
}

void LmdbStore::put(const std::string &key, const json &value) {
	if (!ok_) throw std::runtime_error("lmdb-unavailable:" + name_);
	std::lock_guard<std::mutex> lock(writeMu_);
	MDB_txn *txn = nullptr;
	check(mdb_txn_begin(env_, nullptr, 0, &txn), "txn");
	std::string encoded = value.dump();
	MDB_val k{key.size(), (void *)key.data()};
	MDB_val v{encoded.size(), (void *)encoded.data()};
	int rc = mdb_put(txn, dbi_, &k, &v, 0);
	if (rc != 0) {
		mdb_txn_abort(txn);
		check(rc, "put");
	}
	check(mdb_txn_commit(txn), "commit");
}

void LmdbStore::del(const std::string &key) {
	if (!ok_) return;
	std::lock_guard<std::mutex> lock(writeMu_);
	MDB_txn *txn = nullptr;
	check(mdb_txn_begin(env_, nullptr, 0, &txn), "txn");
	MDB_val k{key.size(), (void *)key.data()};
	int rc = mdb_del(txn, dbi_, &k, nullptr);
	if (rc != 0 && rc != MDB_NOTFOUND) {
		mdb_txn_abort(txn);
		check(rc, "del");
	}
	check(mdb_txn_commit(txn), "commit");
}

std::vector<std::pair<std::string, json>> LmdbStore::entries(const std::string &prefix) {
	std::vector<std::pair<std::string, json>> out;
	if (!ok_) return out;
	MDB_txn *txn = nullptr;
	MDB_cursor *cursor = nullptr;
	check(mdb_txn_begin(env_, nullptr, MDB_RDONLY, &txn), "txn");
	int rc = mdb_cursor_open(txn, dbi_, &cursor);
	if (rc != 0) {
		mdb_txn_abort(txn);
		check(rc, "cursor");
	}
	MDB_val k, v;
	std::string start = prefix;
	k.mv_size = start.size();
	k.mv_data = (void *)start.data();
	rc = mdb_cursor_get(cursor, &k, &v, prefix.empty() ? MDB_FIRST : MDB_SET_RANGE);
	while (rc == 0) {
		std::string key((char *)k.mv_data, k.mv_size);
		if (!prefix.empty() && key.rfind(prefix, 0) != 0) break;
		std::string raw((char *)v.mv_data, v.mv_size);
		try {
			out.push_back({key, json::parse(raw)});
		} catch (const json::exception &e) {
			std::cerr << "[LmdbStore] skipping unreadable record " << key << ": " << e.what() << std::endl;
		}
		rc = mdb_cursor_get(cursor, &k, &v, MDB_NEXT);
	}
	mdb_cursor_close(cursor);
	mdb_txn_abort(txn);
	return out;
}
#endif

// ------------------ JSON file ------------------

JsonFileStore::JsonFileStore(const std::string &name, const fs::path &rootDir, std::chrono::milliseconds flushInterval)
	: name_(name), rootDir_(rootDir), flushInterval_(flushInterval) {
	ensureDir(rootDir_);
	file_ = rootDir_ / (name_ + ".json");
	load();
	startFlushThread();
}

JsonFileStore::~JsonFileStore() {
	stopFlushThread();
	try {
		flush();
	} catch (const std::exception &e) {
		std::cerr << "[JsonFileStore] final flush of " << file_.string() << " failed: " << e.what() << std::endl;
	}
}

void JsonFileStore::load() {
	if (!fs::exists(file_)) return;
	try {
		std::ifstream in(file_);
		nlohmann::ordered_json j;
		in >> j;
		if (!j.is_object()) return;
		for (auto it = j.begin(); it != j.end(); ++it) {
			json value = it.value();
			if (value.is_string()) {
				try {
					data_[it.key()] = json::parse(value.get<std::string>());
				} catch (const json::exception &) {
					data_[it.key()] = value;
				}
			} else {
				data_[it.key()] = value;
			}
			order_.push_back(it.key());
		}
	} catch (const std::exception &e) {
		std::cerr << "[JsonFileStore] could not load " << file_.string() << ": " << e.what() << std::endl;
	}
}

std::optional<json> JsonFileStore::get(const std::string &key) {
	std::lock_guard<std::mutex> lock(mu_);
	auto it = data_.find(key);
	if (it == data_.end()) return std::nullopt;
	return it->second;
}

void JsonFileStore::put(const std::string &key, const json &value) {
	std::lock_guard<std::mutex> lock(mu_);
	if (!data_.count(key)) order_.push_back(key);
	data_[key] = value;
	dirty_ = true;
}

void JsonFileStore::del(const std::string &key) {
	std::lock_guard<std::mutex> lock(mu_);
	if (data_.erase(key) > 0) {
		order_.erase(std::remove(order_.begin(), order_.end(), key), order_.end());
		dirty_ = true;
	}
}

std::vector<std::pair<std::string, json>> JsonFileStore::entries(const std::string &prefix) {
	std::vector<std::pair<std::string, json>> out;
	std::lock_guard<std::mutex> lock(mu_);
	for (auto &key : order_) {
		auto it = data_.find(key);
		if (it == data_.end()) continue;
		if (prefix.empty() || key.rfind(prefix, 0) == 0) out.push_back(*it);
	}
	return out;
}

void JsonFileStore::flush() {
	std::lock_guard<std::mutex> lock(mu_);
	if (!dirty_) return;
	fs::path tmp = file_;
	tmp += ".tmp";
	{
		std::ofstream out(tmp, std::ios::trunc);
		if (!out) throw std::runtime_error("store-write-failed:" + tmp.string());
		nlohmann::ordered_json j = nlohmann::ordered_json::object();
		for (auto &key : order_) {
			auto it = data_.find(key);
			if (it != data_.end()) j[key] = it->second.dump();
		}
		out << j.dump(2);
	}
	fs::rename(tmp, file_);
	dirty_ = false;
}

void JsonFileStore::startFlushThread() {
	running_.store(true);
	flushThread_ = std::thread([this]() {
		while (running_.load()) {
			{
				std::unique_lock<std::mutex> lock(flushMu_);
				flushCv_.wait_for(lock, flushInterval_, [this]() { return !running_.load(); });
			}
			if (!running_.load()) break;
			try {
				flush();
			} catch (const std::exception &e) {
				std::cerr << "[JsonFileStore] flush failed: " << e.what() << std::endl;
			}
		}
	});
}

void JsonFileStore::stopFlushThread() {
	{
		std::lock_guard<std::mutex> lock(flushMu_);
		running_.store(false);
	}
	flushCv_.notify_all();
	if (flushThread_.joinable()) flushThread_.join();
}

// ------------------ Namespaced ------------------

NamespacedStore::NamespacedStore(KeyValueStorePtr base, const std::string &ns) : base_(std::move(base)) {
	std::string trimmed = ns;
	trimmed.erase(trimmed.begin(), std::find_if(trimmed.begin(), trimmed.end(), [](unsigned char ch) {
		return !std::isspace(ch);
	}));
	trimmed.erase(std::find_if(trimmed.rbegin(), trimmed.rend(), [](unsigned char ch) {
		return !std::isspace(ch);
	}).base(), trimmed.end());
	if (trimmed.empty()) throw std::runtime_error("NamespacedStore requires a namespace");
	if (!base_) throw std::runtime_error("NamespacedStore requires a base store");
	prefix_ = "ns:" + trimmed + ":";
}

std::vector<std::pair<std::string, json>> NamespacedStore::entries(const std::string &prefix) {
	auto all = base_->entries(prefix_ + prefix);
	std::vector<std::pair<std::string, json>> out;
	for (auto &kv : all) {
		if (kv.first.rfind(prefix_, 0) == 0) out.push_back({kv.first.substr(prefix_.size()), kv.second});
	}
	return out;
}

KeyValueStorePtr openStore(const std::string &name, const fs::path &rootDir, std::size_t mapSizeBytes) {
#ifdef HAVE_LMDB
	auto lmdb = std::make_shared<LmdbStore>(name, rootDir, mapSizeBytes);
	if (lmdb->ok()) {
		std::cout << "[Store] " << name << " on lmdb at " << (rootDir / name).string() << std::endl;
		return lmdb;
	}
	std::cerr << "[Store] lmdb unavailable for " << name << ", falling back to json file" << std::endl;
#else
	(void)mapSizeBytes;
#endif
	auto store = std::make_shared<JsonFileStore>(name, rootDir);
	std::cout << "[Store] " << name << " on json file " << store->file().string() << std::endl;
	return store;
}

} // namespace horizon
