/**
 * @file cancellation_token.h
 * @brief Shared cooperative cancellation flag for a single transfer
 */

#ifndef ASYNC_SFTP_CORE_CANCELLATION_TOKEN_H
#define ASYNC_SFTP_CORE_CANCELLATION_TOKEN_H

#include <atomic>
#include <memory>

namespace async_sftp {

/**
 * @brief Copyable handle to a flag that can be set exactly once
 *
 * Copies share the same flag. The transfer loop polls it at chunk boundaries;
 * a chunk read or write already in progress is never interrupted.
 */
class cancellation_token {
public:
    cancellation_token() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    /**
     * @brief Request cancellation
     * @return true if this call set the flag, false if it was already set
     */
    auto cancel() noexcept -> bool {
        bool expected = false;
        return state_->compare_exchange_strong(expected, true, std::memory_order_acq_rel);
    }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return state_->load(std::memory_order_acquire);
    }

    [[nodiscard]] auto shares_state_with(const cancellation_token& other) const noexcept -> bool {
        return state_ == other.state_;
    }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};

}  // namespace async_sftp

#endif  // ASYNC_SFTP_CORE_CANCELLATION_TOKEN_H
