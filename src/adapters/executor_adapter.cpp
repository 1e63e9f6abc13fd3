// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file executor_adapter.cpp
 * @brief Serial executor adapter implementation for async_sftp
 */

#include "async_sftp/adapters/executor_adapter.h"

#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <mutex>
#include <thread>

#include "async_sftp/core/logging.h"

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace async_sftp::adapters {

// ============================================================================
// Shared helpers
// ============================================================================

namespace {

/**
 * @brief Bookkeeping shared between an executor and the tasks it runs
 */
struct task_state {
    explicit task_state(std::string executor_name) : name(std::move(executor_name)) {}

    std::string name;
    std::atomic<std::size_t> completed{0};
    std::atomic<std::thread::id> thread_id{};
};

void run_task(task_state& state, std::function<void()>& task) {
    state.thread_id.store(std::this_thread::get_id());
    try {
        task();
    } catch (const std::exception& ex) {
        SFTP_LOG_ERROR(log_category::executor,
            "Task on executor '" + state.name + "' threw: " + ex.what());
    } catch (...) {
        SFTP_LOG_ERROR(log_category::executor,
            "Task on executor '" + state.name + "' threw a non-standard exception");
    }
    state.completed.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace

// ============================================================================
// thread_system_serial_executor implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Simple job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "function_job")
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> kcenon::common::VoidResult override {
        if (func_) {
            func_();
        }
        return kcenon::common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_serial_executor::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::shared_ptr<task_state> state;
    std::mutex stop_mutex;
    bool stopped{false};
};

thread_system_serial_executor::thread_system_serial_executor(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& name)
    : pimpl_(std::make_shared<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->state = std::make_shared<task_state>(name);
}

thread_system_serial_executor::~thread_system_serial_executor() {
    shutdown();
}

std::shared_ptr<thread_system_serial_executor>
thread_system_serial_executor::create(const std::string& name) {
    auto pool = std::make_shared<kcenon::thread::thread_pool>(name);

    // Exactly one worker keeps execution strictly sequential
    auto worker = std::make_unique<kcenon::thread::thread_worker>();
    worker->set_job_queue(pool->get_job_queue());
    auto added = pool->enqueue(std::move(worker));
    if (!added.is_ok()) {
        SFTP_LOG_ERROR(log_category::executor,
            "Failed to add worker to thread pool '" + name + "'");
        return nullptr;
    }

    auto started = pool->start();
    if (!started.is_ok()) {
        SFTP_LOG_ERROR(log_category::executor,
            "Failed to start thread pool '" + name + "'");
        return nullptr;
    }

    return std::make_shared<thread_system_serial_executor>(std::move(pool), name);
}

bool thread_system_serial_executor::post(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(pimpl_->stop_mutex);
    if (pimpl_->stopped) {
        return false;
    }

    auto state = pimpl_->state;
    auto job = std::make_unique<function_job>(
        [state, task = std::move(task)]() mutable { run_task(*state, task); },
        state->name + "_task");

    auto enqueued = pimpl_->pool->enqueue(std::move(job));
    return enqueued.is_ok();
}

void thread_system_serial_executor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(pimpl_->stop_mutex);
        if (pimpl_->stopped) {
            return;
        }
        pimpl_->stopped = true;
    }

    if (is_current()) {
        SFTP_LOG_DEBUG(log_category::executor,
            "Shutdown of '" + pimpl_->state->name + "' requested from its own worker");
        return;
    }

    // Everything posted before the barrier runs before it
    auto barrier = std::make_shared<std::promise<void>>();
    auto drained = barrier->get_future();
    auto job = std::make_unique<function_job>(
        [barrier]() { barrier->set_value(); }, pimpl_->state->name + "_drain");
    auto enqueued = pimpl_->pool->enqueue(std::move(job));
    if (enqueued.is_ok()) {
        drained.wait();
    }

    pimpl_->pool->stop(false);
}

bool thread_system_serial_executor::is_running() const {
    std::lock_guard<std::mutex> lock(pimpl_->stop_mutex);
    return !pimpl_->stopped;
}

bool thread_system_serial_executor::is_current() const {
    return pimpl_->state->thread_id.load() == std::this_thread::get_id();
}

std::size_t thread_system_serial_executor::pending_tasks() const {
    if (pimpl_->pool) {
        auto queue = pimpl_->pool->get_job_queue();
        return queue ? queue->size() : 0;
    }
    return 0;
}

std::size_t thread_system_serial_executor::completed_tasks() const {
    return pimpl_->state->completed.load(std::memory_order_relaxed);
}

std::string thread_system_serial_executor::name() const {
    return pimpl_->state->name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// dedicated_thread_executor implementation
// ============================================================================

struct dedicated_thread_executor::impl {
    std::shared_ptr<task_state> state;
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::function<void()>> tasks;
    bool accepting{true};
    std::mutex join_mutex;
    std::thread thread;

    void run() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, [this] { return !accepting || !tasks.empty(); });
                if (tasks.empty()) {
                    return;
                }
                task = std::move(tasks.front());
                tasks.pop_front();
            }
            run_task(*state, task);
        }
    }
};

dedicated_thread_executor::dedicated_thread_executor(const std::string& name)
    : pimpl_(std::make_shared<impl>()) {
    pimpl_->state = std::make_shared<task_state>(name);
    pimpl_->thread = std::thread([self = pimpl_]() { self->run(); });
}

dedicated_thread_executor::~dedicated_thread_executor() {
    shutdown();
}

bool dedicated_thread_executor::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (!pimpl_->accepting) {
            return false;
        }
        pimpl_->tasks.push_back(std::move(task));
    }
    pimpl_->cv.notify_one();
    return true;
}

void dedicated_thread_executor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        pimpl_->accepting = false;
    }
    pimpl_->cv.notify_all();

    std::lock_guard<std::mutex> lock(pimpl_->join_mutex);
    if (!pimpl_->thread.joinable()) {
        return;
    }
    if (pimpl_->thread.get_id() == std::this_thread::get_id()) {
        // The thread owns a reference to impl and finishes the queue on its own
        pimpl_->thread.detach();
    } else {
        pimpl_->thread.join();
    }
}

bool dedicated_thread_executor::is_running() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return pimpl_->accepting;
}

bool dedicated_thread_executor::is_current() const {
    return pimpl_->state->thread_id.load() == std::this_thread::get_id();
}

std::size_t dedicated_thread_executor::pending_tasks() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return pimpl_->tasks.size();
}

std::size_t dedicated_thread_executor::completed_tasks() const {
    return pimpl_->state->completed.load(std::memory_order_relaxed);
}

std::string dedicated_thread_executor::name() const {
    return pimpl_->state->name;
}

// ============================================================================
// executor_factory implementation
// ============================================================================

std::shared_ptr<serial_executor_interface> executor_factory::create(
    const std::string& name) {
#if KCENON_WITH_THREAD_SYSTEM
    if (auto executor = thread_system_serial_executor::create(name)) {
        return executor;
    }
    SFTP_LOG_WARN(log_category::executor,
        "Falling back to a dedicated thread for '" + name + "'");
#endif
    return std::make_shared<dedicated_thread_executor>(name);
}

}  // namespace async_sftp::adapters
