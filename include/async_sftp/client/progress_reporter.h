/**
 * @file progress_reporter.h
 * @brief Throttled, last-value-wins delivery of transfer progress
 */

#ifndef ASYNC_SFTP_CLIENT_PROGRESS_REPORTER_H
#define ASYNC_SFTP_CLIENT_PROGRESS_REPORTER_H

#include <chrono>
#include <cstdint>
#include <memory>

#include "async_sftp/adapters/executor_adapter.h"
#include "async_sftp/client/client_types.h"
#include "async_sftp/core/cancellation_token.h"

namespace async_sftp {

/**
 * @brief Coalesces per-chunk progress events into callback deliveries
 *
 * The transfer worker reports after every chunk. Deliveries run on the
 * delivery executor, at most one is pending at any time and two deliveries
 * are at least the configured interval apart. A delivery always carries the
 * newest values, so intermediate updates may be dropped.
 *
 * finish() schedules the final values regardless of the interval. Because the
 * delivery executor is FIFO, posting the completion after finish() guarantees
 * the final update is seen first.
 *
 * When the callback returns false the shared token is cancelled.
 */
class progress_reporter {
public:
    progress_reporter(std::shared_ptr<adapters::serial_executor_interface> delivery,
                      progress_callback callback,
                      cancellation_token token,
                      std::chrono::milliseconds interval = default_progress_interval);

    progress_reporter(const progress_reporter&) = delete;
    auto operator=(const progress_reporter&) -> progress_reporter& = delete;

    /**
     * @brief Record new values and deliver them if the throttle allows
     */
    void report(uint64_t bytes_done, uint64_t bytes_total);

    /**
     * @brief Record the final values and always schedule their delivery
     */
    void finish(uint64_t bytes_done, uint64_t bytes_total);

    /**
     * @brief Number of deliveries scheduled so far
     */
    [[nodiscard]] auto scheduled() const -> uint64_t;

private:
    struct shared_state;

    void schedule();

    std::shared_ptr<adapters::serial_executor_interface> delivery_;
    std::shared_ptr<shared_state> state_;
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point last_scheduled_;
    bool scheduled_once_{false};
};

}  // namespace async_sftp

#endif  // ASYNC_SFTP_CLIENT_PROGRESS_REPORTER_H
