/**
 * @file thread_pool_adapter.hpp
 * @brief Flush pool backed by kcenon thread_system
 */

#pragma once

#include <migrate/integration/thread_pool_interface.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace kcenon::thread {
class thread_pool;
}  // namespace kcenon::thread

namespace migrate::integration {

struct thread_pool_config {
    /// Worker threads; 0 is treated as 1
    std::size_t worker_count{4};

    /// Pool name shown in thread_system diagnostics
    std::string pool_name{"migrate_flush_pool"};
};

/**
 * @class thread_pool_adapter
 * @brief thread_pool_interface over kcenon::thread::thread_pool
 *
 * Workers are spawned on the first submission. After shutdown() a new
 * submission spawns a fresh set of workers.
 *
 * Thread Safety: all public methods are thread-safe.
 */
class thread_pool_adapter final : public thread_pool_interface {
public:
    explicit thread_pool_adapter(thread_pool_config config = {});
    ~thread_pool_adapter() override;

    [[nodiscard]] auto submit(std::function<void()> task)
        -> std::future<void> override;

    [[nodiscard]] auto worker_count() const -> std::size_t override;

    [[nodiscard]] auto queued_tasks() const -> std::size_t override;

    void shutdown(bool drain = true) override;

    [[nodiscard]] auto is_started() const -> bool;

    [[nodiscard]] auto config() const noexcept -> const thread_pool_config& {
        return config_;
    }

private:
    /// Caller holds mutex_
    [[nodiscard]] auto ensure_started() -> bool;

    thread_pool_config config_;

    mutable std::mutex mutex_;
    std::shared_ptr<kcenon::thread::thread_pool> pool_;
};

}  // namespace migrate::integration
