#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "errors.hpp"

namespace horizon {

// Cancellation scope shared by a request and everything it fans out to.
// Cancelling a context cancels all contexts derived from it; a derived
// context never outlives its parent's deadline.
class Context {
public:
	using Clock = std::chrono::steady_clock;

	static std::shared_ptr<Context> background();
	static std::shared_ptr<Context> withCancel(const std::shared_ptr<Context> &parent);
	static std::shared_ptr<Context> withTimeout(const std::shared_ptr<Context> &parent, std::chrono::milliseconds timeout);
	static std::shared_ptr<Context> withDeadline(const std::shared_ptr<Context> &parent, Clock::time_point deadline);

	void cancel();

	bool cancelled() const { return cancelled_.load(); }
	bool expired() const;
	bool done() const { return cancelled() || expired(); }
	std::optional<Clock::time_point> deadline() const { return deadline_; }
	std::chrono::milliseconds remaining() const;

	// Blocks until the context is done or the time point is reached.
	// Returns true when the context finished first.
	bool waitUntil(Clock::time_point tp) const;
	bool waitFor(std::chrono::milliseconds d) const { return waitUntil(Clock::now() + d); }

	// Throws Cancelled or Timeout tagged with the given stage when done.
	void check(Stage stage) const;

private:
	Context(std::optional<Clock::time_point> deadline);

	static std::shared_ptr<Context> derive(const std::shared_ptr<Context> &parent, std::optional<Clock::time_point> deadline);
	void addChild(const std::shared_ptr<Context> &child);

	std::optional<Clock::time_point> deadline_;
	std::atomic<bool> cancelled_{false};
	mutable std::mutex mu_;
	mutable std::condition_variable cv_;
	std::vector<std::weak_ptr<Context>> children_;
};

using ContextPtr = std::shared_ptr<Context>;

} // namespace horizon
