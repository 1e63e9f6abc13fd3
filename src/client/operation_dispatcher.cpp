/**
 * @file operation_dispatcher.cpp
 * @brief Non-template parts of operation_dispatcher
 */

#include "async_sftp/client/operation_dispatcher.h"

namespace async_sftp {

operation_dispatcher::operation_dispatcher(
    std::shared_ptr<adapters::serial_executor_interface> worker,
    std::shared_ptr<adapters::serial_executor_interface> delivery)
    : worker_(std::move(worker)), delivery_(std::move(delivery)) {}

operation_dispatcher::~operation_dispatcher() {
    shutdown();
}

auto operation_dispatcher::try_acquire(const std::string& name,
                                       std::optional<cancellation_token> token) -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    if (busy_) {
        SFTP_LOG_WARN(log_category::dispatcher,
            "Rejected '" + name + "' while '" + active_name_ + "' is in progress");
        return false;
    }
    busy_ = true;
    active_name_ = name;
    active_token_ = std::move(token);
    SFTP_LOG_DEBUG(log_category::dispatcher, "Admitted '" + name + "'");
    return true;
}

void operation_dispatcher::acquire_when_idle(const std::string& name) {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return !busy_; });
    busy_ = true;
    active_name_ = name;
    active_token_.reset();
}

void operation_dispatcher::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        busy_ = false;
        active_name_.clear();
        active_token_.reset();
    }
    idle_cv_.notify_all();
}

auto operation_dispatcher::cancel_active() -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!busy_ || !active_token_) {
        return false;
    }
    if (active_token_->cancel()) {
        SFTP_LOG_INFO(log_category::dispatcher, "Cancellation requested for '" + active_name_ + "'");
        return true;
    }
    return false;
}

void operation_dispatcher::run_exclusive(const std::string& name,
                                         const std::function<void()>& work) {
    if (worker_->is_current()) {
        // Already serialized with every other request
        work();
        return;
    }

    cancel_active();
    acquire_when_idle(name);

    auto done = std::make_shared<std::promise<void>>();
    auto finished = done->get_future();
    bool posted = worker_->post([work, done, name]() {
        try {
            work();
        } catch (const std::exception& ex) {
            SFTP_LOG_ERROR(log_category::dispatcher,
                "Exclusive operation '" + name + "' threw: " + ex.what());
        } catch (...) {
            SFTP_LOG_ERROR(log_category::dispatcher,
                "Exclusive operation '" + name + "' threw a non-standard exception");
        }
        done->set_value();
    });

    if (posted) {
        finished.wait();
    } else {
        // The worker is gone, so nothing else can touch the session
        work();
    }
    release();
}

auto operation_dispatcher::is_busy() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return busy_;
}

void operation_dispatcher::shutdown() {
    if (worker_) {
        worker_->shutdown();
    }
    if (delivery_) {
        delivery_->shutdown();
    }
}

}  // namespace async_sftp
