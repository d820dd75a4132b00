/**
 * @file thread_pool_adapter.cpp
 * @brief Implementation of thread_pool_adapter
 */

#include <migrate/integration/thread_pool_adapter.hpp>

#include <migrate/integration/logger_adapter.hpp>

#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/interfaces/thread_context.h>

#include <stdexcept>
#include <vector>

namespace migrate::integration {

thread_pool_adapter::thread_pool_adapter(thread_pool_config config)
    : config_(std::move(config)) {
    if (config_.worker_count == 0) {
        config_.worker_count = 1;
    }
}

thread_pool_adapter::~thread_pool_adapter() { shutdown(true); }

auto thread_pool_adapter::ensure_started() -> bool {
    if (pool_ && pool_->is_running()) {
        return true;
    }

    kcenon::thread::thread_context context;
    auto pool = std::make_shared<kcenon::thread::thread_pool>(config_.pool_name, context);

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    for (std::size_t i = 0; i < config_.worker_count; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>(false, context));
    }

    auto enqueued = pool->enqueue_batch(std::move(workers));
    if (enqueued.is_err()) {
        logger_adapter::error("{}: cannot add workers: {}", config_.pool_name,
                              enqueued.error().message);
        return false;
    }
    auto started = pool->start();
    if (started.is_err()) {
        logger_adapter::error("{}: cannot start: {}", config_.pool_name,
                              started.error().message);
        return false;
    }

    logger_adapter::debug("{} started with {} workers", config_.pool_name,
                          config_.worker_count);
    pool_ = std::move(pool);
    return true;
}

auto thread_pool_adapter::submit(std::function<void()> task) -> std::future<void> {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensure_started()) {
        throw std::runtime_error(config_.pool_name + " is not available");
    }

    auto queued = pool_->submit_task([task = std::move(task), promise]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });
    if (!queued) {
        throw std::runtime_error(config_.pool_name + " rejected a task");
    }
    return future;
}

auto thread_pool_adapter::worker_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_ && pool_->is_running() ? config_.worker_count : 0;
}

auto thread_pool_adapter::queued_tasks() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_ ? pool_->get_pending_task_count() : 0;
}

auto thread_pool_adapter::is_started() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_ && pool_->is_running();
}

void thread_pool_adapter::shutdown(bool drain) {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pool = std::move(pool_);
    }
    if (pool) {
        (void)pool->stop(!drain);
        logger_adapter::debug("{} stopped", config_.pool_name);
    }
}

}  // namespace migrate::integration
