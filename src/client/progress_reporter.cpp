/**
 * @file progress_reporter.cpp
 * @brief Implementation of progress coalescing
 */

#include "async_sftp/client/progress_reporter.h"

#include <mutex>

#include "async_sftp/core/logging.h"

namespace async_sftp {

struct progress_reporter::shared_state {
    progress_callback callback;
    cancellation_token token;

    std::mutex mutex;
    uint64_t bytes_done{0};
    uint64_t bytes_total{0};
    bool pending{false};
    uint64_t scheduled{0};
};

progress_reporter::progress_reporter(
    std::shared_ptr<adapters::serial_executor_interface> delivery,
    progress_callback callback,
    cancellation_token token,
    std::chrono::milliseconds interval)
    : delivery_(std::move(delivery)),
      state_(std::make_shared<shared_state>()),
      interval_(interval) {
    state_->callback = std::move(callback);
    state_->token = std::move(token);
}

void progress_reporter::report(uint64_t bytes_done, uint64_t bytes_total) {
    if (!state_->callback) {
        return;
    }

    auto now = std::chrono::steady_clock::now();
    bool due = !scheduled_once_ || now - last_scheduled_ >= interval_;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->bytes_done = bytes_done;
        state_->bytes_total = bytes_total;
        if (!due || state_->pending) {
            return;
        }
        state_->pending = true;
    }

    scheduled_once_ = true;
    last_scheduled_ = now;
    schedule();
}

void progress_reporter::finish(uint64_t bytes_done, uint64_t bytes_total) {
    if (!state_->callback) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->bytes_done = bytes_done;
        state_->bytes_total = bytes_total;
        // A delivery that has not run yet picks up the final values
        if (state_->pending) {
            return;
        }
        state_->pending = true;
    }

    schedule();
}

auto progress_reporter::scheduled() const -> uint64_t {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->scheduled;
}

void progress_reporter::schedule() {
    auto state = state_;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        ++state->scheduled;
    }

    bool posted = delivery_ && delivery_->post([state]() {
        uint64_t done = 0;
        uint64_t total = 0;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            done = state->bytes_done;
            total = state->bytes_total;
            state->pending = false;
        }

        if (!state->callback(done, total) && state->token.cancel()) {
            SFTP_LOG_INFO(log_category::transfer,
                "Transfer cancelled by progress callback at " + std::to_string(done) +
                    "/" + std::to_string(total) + " bytes");
        }
    });

    if (!posted) {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->pending = false;
        --state->scheduled;
    }
}

}  // namespace async_sftp
