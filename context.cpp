#include "context.hpp"

#include <algorithm>

namespace horizon {

Context::Context(std::optional<Clock::time_point> deadline) : deadline_(deadline) {}

std::shared_ptr<Context> Context::background() {
	return std::shared_ptr<Context>(new Context(std::nullopt));
}

std::shared_ptr<Context> Context::withCancel(const std::shared_ptr<Context> &parent) {
	return derive(parent, std::nullopt);
}

std::shared_ptr<Context> Context::withTimeout(const std::shared_ptr<Context> &parent, std::chrono::milliseconds timeout) {
	return derive(parent, Clock::now() + timeout);
}

std::shared_ptr<Context> Context::withDeadline(const std::shared_ptr<Context> &parent, Clock::time_point deadline) {
	return derive(parent, deadline);
}

std::shared_ptr<Context> Context::derive(const std::shared_ptr<Context> &parent, std::optional<Clock::time_point> deadline) {
	std::optional<Clock::time_point> effective = deadline;
	if (parent && parent->deadline_) {
		effective = effective ? std::min(*effective, *parent->deadline_) : parent->deadline_;
	}
	auto child = std::shared_ptr<Context>(new Context(effective));
	if (parent) parent->addChild(child);
	return child;
}

void Context::addChild(const std::shared_ptr<Context> &child) {
	{
		std::lock_guard<std::mutex> lock(mu_);
		if (!cancelled_.load()) {
			children_.erase(std::remove_if(children_.begin(), children_.end(),
										   [](const std::weak_ptr<Context> &w) { return w.expired(); }),
							children_.end());
			children_.push_back(child);
			return;
		}
	}
	child->cancel();
}

void Context::cancel() {
	std::vector<std::weak_ptr<Context>> children;
	{
		std::lock_guard<std::mutex> lock(mu_);
		if (cancelled_.exchange(true)) return;
		children.swap(children_);
	}
	cv_.notify_all();
	for (auto &w : children) {
		if (auto c = w.lock()) c->cancel();
	}
}

bool Context::expired() const {
	return deadline_ && Clock::now() >= *deadline_;
}

std::chrono::milliseconds Context::remaining() const {
	if (!deadline_) return std::chrono::milliseconds::max();
	auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
	return std::max(std::chrono::milliseconds(0), left);
}

bool Context::waitUntil(Clock::time_point tp) const {
	Clock::time_point until = tp;
	if (deadline_ && *deadline_ < until) until = *deadline_;
	std::unique_lock<std::mutex> lock(mu_);
	cv_.wait_until(lock, until, [&]() { return cancelled_.load(); });
	return done();
}

void Context::check(Stage stage) const {
	if (cancelled()) throw RiskError(ErrorCode::Cancelled, stage, "context-cancelled");
	if (expired()) throw RiskError(ErrorCode::Timeout, stage, "deadline-exceeded");
}

} // namespace horizon
