/**
 * @file operation_dispatcher.h
 * @brief Single-in-flight admission and worker/delivery hand-off
 */

#ifndef ASYNC_SFTP_CLIENT_OPERATION_DISPATCHER_H
#define ASYNC_SFTP_CLIENT_OPERATION_DISPATCHER_H

#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "async_sftp/adapters/executor_adapter.h"
#include "async_sftp/client/client_types.h"
#include "async_sftp/core/cancellation_token.h"
#include "async_sftp/core/error_mapper.h"
#include "async_sftp/core/logging.h"

namespace async_sftp {

/**
 * @brief Admits at most one request at a time and runs it on the worker
 *
 * A request issued while another one is active is rejected with
 * operation_in_progress; nothing is queued. Admitted work runs on the worker
 * executor. Its result is handed to the delivery executor, which invokes the
 * completion callback and then fulfils the future. The busy slot is released
 * before the result is handed over, so a completion callback may issue the
 * next request.
 *
 * @code
 * auto future = dispatcher.dispatch<file_metadata>("stat",
 *     [&] { return metadata.stat(path); },
 *     [](const result<file_metadata>& r) { ... });
 * @endcode
 */
class operation_dispatcher {
public:
    operation_dispatcher(std::shared_ptr<adapters::serial_executor_interface> worker,
                         std::shared_ptr<adapters::serial_executor_interface> delivery);
    ~operation_dispatcher();

    operation_dispatcher(const operation_dispatcher&) = delete;
    auto operator=(const operation_dispatcher&) -> operation_dispatcher& = delete;

    /**
     * @brief Admit and run a request
     * @param name Operation name for logs
     * @param work Runs on the worker; exceptions become unknown errors
     * @param on_complete Optional callback run on the delivery executor
     * @param token Token cancelled by cancel_active() while the request runs
     */
    template <typename T>
    auto dispatch(std::string name,
                  std::function<result<T>()> work,
                  completion_callback<T> on_complete = nullptr,
                  std::optional<cancellation_token> token = std::nullopt)
        -> std::future<result<T>>;

    /**
     * @brief Resolve a request with an error without admitting it
     *
     * Used for argument validation failures, which never reach the worker.
     */
    template <typename T>
    auto reject(const std::string& name, error failure, completion_callback<T> on_complete = nullptr)
        -> std::future<result<T>>;

    /**
     * @brief Cancel the token of the active request, if it has one
     * @return true if a token was cancelled by this call
     */
    auto cancel_active() -> bool;

    /**
     * @brief Run work on the worker once no request is active, and wait for it
     *
     * Cancels the active request first. Requests issued meanwhile are rejected
     * with operation_in_progress.
     */
    void run_exclusive(const std::string& name, const std::function<void()>& work);

    [[nodiscard]] auto is_busy() const -> bool;

    /**
     * @brief Drain and stop both executors
     */
    void shutdown();

private:
    template <typename T>
    struct pending_request {
        std::string name;
        std::promise<result<T>> promise;
        completion_callback<T> on_complete;
    };

    auto try_acquire(const std::string& name, std::optional<cancellation_token> token) -> bool;
    void acquire_when_idle(const std::string& name);
    void release();

    template <typename T>
    static auto run_guarded(const std::string& name, const std::function<result<T>()>& work)
        -> result<T>;

    template <typename T>
    void deliver(std::shared_ptr<pending_request<T>> request, result<T> outcome);

    std::shared_ptr<adapters::serial_executor_interface> worker_;
    std::shared_ptr<adapters::serial_executor_interface> delivery_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    bool busy_{false};
    std::string active_name_;
    std::optional<cancellation_token> active_token_;
};

// ============================================================================
// Template implementation
// ============================================================================

template <typename T>
auto operation_dispatcher::dispatch(std::string name,
                                    std::function<result<T>()> work,
                                    completion_callback<T> on_complete,
                                    std::optional<cancellation_token> token)
    -> std::future<result<T>> {
    auto request = std::make_shared<pending_request<T>>();
    request->name = std::move(name);
    request->on_complete = std::move(on_complete);
    auto future = request->promise.get_future();

    if (!try_acquire(request->name, std::move(token))) {
        deliver(request, result<T>{unexpected{error{sftp_error_code::operation_in_progress}}});
        return future;
    }

    bool posted = worker_->post([this, request, work = std::move(work)]() {
        auto outcome = run_guarded<T>(request->name, work);
        release();
        deliver(request, std::move(outcome));
    });

    if (!posted) {
        release();
        deliver(request, result<T>{unexpected{
            error_mapper::make(sftp_error_code::unknown, "worker is not running")}});
    }
    return future;
}

template <typename T>
auto operation_dispatcher::reject(const std::string& name, error failure,
                                  completion_callback<T> on_complete)
    -> std::future<result<T>> {
    auto request = std::make_shared<pending_request<T>>();
    request->name = name;
    request->on_complete = std::move(on_complete);
    auto future = request->promise.get_future();

    SFTP_LOG_WARN(log_category::dispatcher,
        "Rejected '" + name + "': " + failure.message);
    deliver(request, result<T>{unexpected{std::move(failure)}});
    return future;
}

template <typename T>
auto operation_dispatcher::run_guarded(const std::string& name,
                                       const std::function<result<T>()>& work) -> result<T> {
    try {
        return work();
    } catch (const std::exception& ex) {
        SFTP_LOG_ERROR(log_category::dispatcher,
            "Operation '" + name + "' threw: " + ex.what());
        return unexpected{error_mapper::from_exception(ex)};
    } catch (...) {
        SFTP_LOG_ERROR(log_category::dispatcher,
            "Operation '" + name + "' threw a non-standard exception");
        return unexpected{error_mapper::make(sftp_error_code::unknown, "non-standard exception")};
    }
}

template <typename T>
void operation_dispatcher::deliver(std::shared_ptr<pending_request<T>> request,
                                   result<T> outcome) {
    auto complete = [request](result<T> value) {
        if (request->on_complete) {
            try {
                request->on_complete(value);
            } catch (const std::exception& ex) {
                SFTP_LOG_ERROR(log_category::dispatcher,
                    "Completion callback of '" + request->name + "' threw: " + ex.what());
            } catch (...) {
                SFTP_LOG_ERROR(log_category::dispatcher,
                    "Completion callback of '" + request->name +
                        "' threw a non-standard exception");
            }
        }
        request->promise.set_value(std::move(value));
    };

    // The outcome is shared so it survives a failed post
    auto shared = std::make_shared<result<T>>(std::move(outcome));
    bool posted = delivery_->post([complete, shared]() { complete(std::move(*shared)); });
    if (!posted) {
        complete(std::move(*shared));
    }
}

}  // namespace async_sftp

#endif  // ASYNC_SFTP_CLIENT_OPERATION_DISPATCHER_H
