/**
 * @file test_operation_dispatcher.cpp
 * @brief Unit tests for request admission, execution and delivery
 */

#include <gtest/gtest.h>

#include <async_sftp/adapters/executor_adapter.h>
#include <async_sftp/client/operation_dispatcher.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace async_sftp::test {

class OperationDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        worker_ = std::make_shared<adapters::dedicated_thread_executor>("dispatch_worker");
        delivery_ = std::make_shared<adapters::dedicated_thread_executor>("dispatch_delivery");
        dispatcher_ = std::make_unique<operation_dispatcher>(worker_, delivery_);
    }

    void TearDown() override { dispatcher_->shutdown(); }

    template <typename T>
    static auto ready(std::future<T>& future) -> bool {
        return future.wait_for(std::chrono::seconds(5)) == std::future_status::ready;
    }

    std::shared_ptr<adapters::dedicated_thread_executor> worker_;
    std::shared_ptr<adapters::dedicated_thread_executor> delivery_;
    std::unique_ptr<operation_dispatcher> dispatcher_;
};

TEST_F(OperationDispatcherTest, WorkRunsOnWorker) {
    auto future = dispatcher_->dispatch<bool>("probe", [this]() -> result<bool> {
        return worker_->is_current();
    });

    ASSERT_TRUE(ready(future));
    auto outcome = future.get();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome.value());
    EXPECT_FALSE(dispatcher_->is_busy());
}

TEST_F(OperationDispatcherTest, CallbackRunsOnDeliveryBeforeFuture) {
    std::atomic<bool> called{false};
    std::atomic<bool> on_delivery{false};

    auto future = dispatcher_->dispatch<int>(
        "value", []() -> result<int> { return 42; },
        [&](const result<int>& outcome) {
            on_delivery = delivery_->is_current();
            called = outcome.has_value() && outcome.value() == 42;
        });

    ASSERT_TRUE(ready(future));
    auto outcome = future.get();
    EXPECT_TRUE(called.load());
    EXPECT_TRUE(on_delivery.load());
    EXPECT_EQ(outcome.value(), 42);
}

TEST_F(OperationDispatcherTest, ConcurrentRequestIsRejected) {
    std::promise<void> gate;
    auto opened = gate.get_future().share();

    auto first = dispatcher_->dispatch<void>("first", [opened]() -> result<void> {
        opened.wait();
        return {};
    });
    EXPECT_TRUE(dispatcher_->is_busy());

    std::atomic<bool> callback_saw_rejection{false};
    auto second = dispatcher_->dispatch<void>(
        "second", []() -> result<void> { return {}; },
        [&](const result<void>& outcome) {
            callback_saw_rejection =
                !outcome.has_value() &&
                outcome.error().code == sftp_error_code::operation_in_progress;
        });

    ASSERT_TRUE(ready(second));
    auto rejected = second.get();
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, sftp_error_code::operation_in_progress);
    EXPECT_TRUE(callback_saw_rejection.load());

    gate.set_value();
    ASSERT_TRUE(ready(first));
    EXPECT_TRUE(first.get().has_value());
}

TEST_F(OperationDispatcherTest, ExceptionBecomesUnknownError) {
    auto future = dispatcher_->dispatch<int>("explode", []() -> result<int> {
        throw std::runtime_error("boom");
    });

    ASSERT_TRUE(ready(future));
    auto outcome = future.get();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, sftp_error_code::unknown);
    EXPECT_NE(outcome.error().message.find("boom"), std::string::npos);
    EXPECT_FALSE(dispatcher_->is_busy());
}

TEST_F(OperationDispatcherTest, ThrowingCallbackStillFulfilsFuture) {
    auto future = dispatcher_->dispatch<int>(
        "value", []() -> result<int> { return 1; },
        [](const result<int>&) { throw std::runtime_error("callback failure"); });

    ASSERT_TRUE(ready(future));
    EXPECT_TRUE(future.get().has_value());
}

TEST_F(OperationDispatcherTest, NonStandardThrowBecomesUnknownError) {
    auto future = dispatcher_->dispatch<int>("explode", []() -> result<int> { throw 42; });

    ASSERT_TRUE(ready(future));
    auto outcome = future.get();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, sftp_error_code::unknown);
    EXPECT_FALSE(dispatcher_->is_busy());
}

TEST_F(OperationDispatcherTest, CallbackThrowingNonStandardValueStillFulfilsFuture) {
    auto future = dispatcher_->dispatch<int>(
        "value", []() -> result<int> { return 7; },
        [](const result<int>&) { throw 42; });

    ASSERT_TRUE(ready(future));
    auto outcome = future.get();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value(), 7);

    // The delivery executor survives for the next request
    auto next = dispatcher_->dispatch<int>("next", []() -> result<int> { return 8; });
    ASSERT_TRUE(ready(next));
    EXPECT_TRUE(next.get().has_value());
}

TEST_F(OperationDispatcherTest, RejectNeverAdmits) {
    auto future = dispatcher_->reject<void>(
        "rename", error_mapper::make(sftp_error_code::invalid_arguments, "path is empty"));

    EXPECT_FALSE(dispatcher_->is_busy());
    ASSERT_TRUE(ready(future));
    auto outcome = future.get();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, sftp_error_code::invalid_arguments);
}

TEST_F(OperationDispatcherTest, CallbackMayIssueNextRequest) {
    std::promise<std::future<result<int>>> chained;
    auto chained_future = chained.get_future();

    auto first = dispatcher_->dispatch<int>(
        "first", []() -> result<int> { return 1; },
        [&](const result<int>&) {
            chained.set_value(
                dispatcher_->dispatch<int>("second", []() -> result<int> { return 2; }));
        });

    ASSERT_TRUE(ready(first));
    ASSERT_TRUE(ready(chained_future));
    auto second = chained_future.get();
    ASSERT_TRUE(ready(second));
    auto outcome = second.get();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value(), 2);
}

// ============================================================================
// Cancellation and exclusive work
// ============================================================================

TEST_F(OperationDispatcherTest, CancelActiveSetsRequestToken) {
    EXPECT_FALSE(dispatcher_->cancel_active());

    cancellation_token token;
    auto future = dispatcher_->dispatch<void>(
        "transfer",
        [token]() -> result<void> {
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
            while (!token.is_cancelled() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            if (token.is_cancelled()) {
                return unexpected{error{sftp_error_code::cancelled_by_user}};
            }
            return {};
        },
        nullptr, token);

    EXPECT_TRUE(dispatcher_->cancel_active());
    EXPECT_FALSE(dispatcher_->cancel_active());

    ASSERT_TRUE(ready(future));
    auto outcome = future.get();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, sftp_error_code::cancelled_by_user);
}

TEST_F(OperationDispatcherTest, RunExclusiveWaitsForActiveRequest) {
    std::mutex mutex;
    std::vector<std::string> order;
    cancellation_token token;

    auto future = dispatcher_->dispatch<void>(
        "transfer",
        [&, token]() -> result<void> {
            while (!token.is_cancelled()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back("transfer");
            return unexpected{error{sftp_error_code::cancelled_by_user}};
        },
        nullptr, token);

    dispatcher_->run_exclusive("disconnect", [&] {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back("disconnect");
    });

    EXPECT_TRUE(token.is_cancelled());
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], "transfer");
    EXPECT_EQ(order[1], "disconnect");
    EXPECT_FALSE(dispatcher_->is_busy());

    ASSERT_TRUE(ready(future));
    EXPECT_EQ(future.get().error().code, sftp_error_code::cancelled_by_user);
}

TEST_F(OperationDispatcherTest, RunExclusiveOnWorkerRunsInline) {
    std::atomic<bool> ran{false};
    auto future = dispatcher_->dispatch<void>("outer", [&]() -> result<void> {
        dispatcher_->run_exclusive("inner", [&] { ran = true; });
        return {};
    });

    ASSERT_TRUE(ready(future));
    EXPECT_TRUE(future.get().has_value());
    EXPECT_TRUE(ran.load());
}

TEST_F(OperationDispatcherTest, DispatchAfterShutdownFails) {
    dispatcher_->shutdown();

    auto future = dispatcher_->dispatch<void>("late", []() -> result<void> { return {}; });
    ASSERT_TRUE(ready(future));
    auto outcome = future.get();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, sftp_error_code::unknown);
    EXPECT_FALSE(dispatcher_->is_busy());
}

}  // namespace async_sftp::test
