// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file executor_adapter.h
 * @brief Serial executor adapter for async_sftp
 *
 * Every connection owns two serial executors: a worker that runs blocking
 * protocol calls and a delivery context that runs user callbacks. Both execute
 * their tasks strictly one at a time in submission order.
 *
 * Features:
 * - thread_system integration (one-worker thread_pool) when available
 * - Fallback to a dedicated std::thread when thread_system is unavailable
 * - Draining shutdown that is safe to request from the executor's own thread
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace async_sftp::adapters {

/**
 * @brief Interface for a single-threaded FIFO task executor
 */
class serial_executor_interface {
public:
    virtual ~serial_executor_interface() = default;

    /**
     * @brief Queue a task behind every previously posted task
     * @param task The task to execute
     * @return false if the executor no longer accepts work
     */
    [[nodiscard]] virtual bool post(std::function<void()> task) = 0;

    /**
     * @brief Run every queued task, then stop accepting and release the thread
     *
     * When called from the executor's own thread the remaining tasks still
     * run, but the call returns without waiting for them.
     */
    virtual void shutdown() = 0;

    /**
     * @brief Check if the executor accepts work
     */
    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Check if the calling thread is the executor's thread
     */
    [[nodiscard]] virtual bool is_current() const = 0;

    /**
     * @brief Number of tasks waiting to be executed
     */
    [[nodiscard]] virtual std::size_t pending_tasks() const = 0;

    /**
     * @brief Number of tasks executed so far
     */
    [[nodiscard]] virtual std::size_t completed_tasks() const = 0;

    /**
     * @brief Name for identification in logs
     */
    [[nodiscard]] virtual std::string name() const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Serial executor backed by a one-worker thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_serial_executor : public serial_executor_interface {
public:
    /**
     * @brief Construct with an existing, started, single-worker thread_pool
     * @param pool Shared pointer to thread_system's thread_pool
     * @param name Name for identification in logs
     */
    explicit thread_system_serial_executor(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& name);

    ~thread_system_serial_executor() override;

    thread_system_serial_executor(const thread_system_serial_executor&) = delete;
    thread_system_serial_executor& operator=(const thread_system_serial_executor&) = delete;

    /**
     * @brief Create a thread_pool with exactly one worker and start it
     * @param name Pool name
     * @return Executor, or nullptr if the pool failed to start
     */
    [[nodiscard]] static std::shared_ptr<thread_system_serial_executor> create(
        const std::string& name);

    [[nodiscard]] bool post(std::function<void()> task) override;
    void shutdown() override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] bool is_current() const override;
    [[nodiscard]] std::size_t pending_tasks() const override;
    [[nodiscard]] std::size_t completed_tasks() const override;
    [[nodiscard]] std::string name() const override;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback serial executor on a dedicated std::thread
 */
class dedicated_thread_executor : public serial_executor_interface {
public:
    explicit dedicated_thread_executor(const std::string& name);
    ~dedicated_thread_executor() override;

    dedicated_thread_executor(const dedicated_thread_executor&) = delete;
    dedicated_thread_executor& operator=(const dedicated_thread_executor&) = delete;

    [[nodiscard]] bool post(std::function<void()> task) override;
    void shutdown() override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] bool is_current() const override;
    [[nodiscard]] std::size_t pending_tasks() const override;
    [[nodiscard]] std::size_t completed_tasks() const override;
    [[nodiscard]] std::string name() const override;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

/**
 * @brief Factory for creating the appropriate serial executor
 *
 * Selection order:
 * 1. thread_system_serial_executor (when KCENON_WITH_THREAD_SYSTEM)
 * 2. dedicated_thread_executor (fallback)
 */
class executor_factory {
public:
    /**
     * @brief Create the best available serial executor
     * @param name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<serial_executor_interface> create(
        const std::string& name);

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace async_sftp::adapters
