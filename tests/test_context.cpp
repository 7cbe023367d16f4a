#include <chrono>
#include <thread>

#include <gtest/gtest.h>

#include "context.hpp"
#include "errors.hpp"

using namespace horizon;
using namespace std::chrono_literals;

TEST(Context, BackgroundNeverFinishes) {
	auto ctx = Context::background();
	EXPECT_FALSE(ctx->done());
	EXPECT_FALSE(ctx->deadline().has_value());
	EXPECT_NO_THROW(ctx->check(Stage::Router));
}

TEST(Context, CancelCascadesToChildren) {
	auto root = Context::withCancel(Context::background());
	auto child = Context::withCancel(root);
	auto grandchild = Context::withTimeout(child, 10s);
	root->cancel();
	EXPECT_TRUE(child->cancelled());
	EXPECT_TRUE(grandchild->cancelled());
	try {
		grandchild->check(Stage::Model);
		FAIL() << "expected cancellation";
	} catch (const RiskError &e) {
		EXPECT_EQ(e.code(), ErrorCode::Cancelled);
		EXPECT_EQ(e.stage(), Stage::Model);
	}
}

TEST(Context, ChildOfCancelledParentStartsCancelled) {
	auto root = Context::withCancel(Context::background());
	root->cancel();
	auto late = Context::withCancel(root);
	EXPECT_TRUE(late->cancelled());
}

TEST(Context, ChildNeverOutlivesParentDeadline) {
	auto parent = Context::withTimeout(Context::background(), 50ms);
	auto child = Context::withTimeout(parent, 10s);
	ASSERT_TRUE(child->deadline().has_value());
	EXPECT_EQ(*child->deadline(), *parent->deadline());
}

TEST(Context, ExpiryRaisesTimeout) {
	auto ctx = Context::withTimeout(Context::background(), 5ms);
	EXPECT_TRUE(ctx->waitFor(1s));
	EXPECT_TRUE(ctx->expired());
	try {
		ctx->check(Stage::Router);
		FAIL() << "expected timeout";
	} catch (const RiskError &e) {
		EXPECT_EQ(e.code(), ErrorCode::Timeout);
		EXPECT_STREQ(e.what(), "timeout@router: deadline-exceeded");
		EXPECT_EQ(e.detail(), "deadline-exceeded");
	}
}

TEST(Context, WaitWakesOnCancel) {
	auto ctx = Context::withCancel(Context::background());
	std::thread canceller([ctx]() {
		std::this_thread::sleep_for(10ms);
		ctx->cancel();
	});
	auto started = std::chrono::steady_clock::now();
	EXPECT_TRUE(ctx->waitFor(5s));
	EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
	canceller.join();
}

TEST(Context, WaitReturnsFalseWhenTimeReachedFirst) {
	auto ctx = Context::withTimeout(Context::background(), 10s);
	EXPECT_FALSE(ctx->waitFor(5ms));
}

TEST(RiskError, OnlyModelPathFailuresTripBreaker) {
	EXPECT_TRUE(RiskError(ErrorCode::ModelInvocation, Stage::Model, "x").countsAsBreakerFailure());
	EXPECT_TRUE(RiskError(ErrorCode::Timeout, Stage::Model, "x").countsAsBreakerFailure());
	EXPECT_FALSE(RiskError(ErrorCode::Timeout, Stage::Router, "x").countsAsBreakerFailure());
	EXPECT_FALSE(RiskError(ErrorCode::Timeout, Stage::Cache, "x").countsAsBreakerFailure());
	EXPECT_FALSE(RiskError(ErrorCode::Cancelled, Stage::Model, "x").countsAsBreakerFailure());
	EXPECT_FALSE(RiskError(ErrorCode::CacheBackend, Stage::Cache, "x").countsAsBreakerFailure());
	EXPECT_FALSE(RiskError(ErrorCode::ValidationInput, Stage::Validation, "x").countsAsBreakerFailure());
}
