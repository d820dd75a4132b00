/**
 * @file thread_pool_interface.hpp
 * @brief Worker pool seam for parallel batch flushing
 *
 * The batch transfer executor hands flushed batches to a pool through this
 * interface. Production code uses thread_pool_adapter; tests inject
 * testing::mock_thread_pool to run flushes deterministically.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>

namespace migrate::integration {

/**
 * @brief Runs batch flushes off the driving thread
 *
 * Implementations must accept submissions from any thread.
 *
 * @example
 * @code
 * auto pool = std::make_shared<thread_pool_adapter>(thread_pool_config{});
 * batch_transfer_executor executor(pool, 4);
 * @endcode
 */
class thread_pool_interface {
public:
    virtual ~thread_pool_interface() = default;

    /**
     * @brief Queue a task
     *
     * An exception thrown by the task is stored in the returned future.
     *
     * @throws std::runtime_error if the pool cannot accept work
     */
    [[nodiscard]] virtual auto submit(std::function<void()> task)
        -> std::future<void> = 0;

    /// Workers available for tasks (0 when tasks run on the caller)
    [[nodiscard]] virtual auto worker_count() const -> std::size_t = 0;

    /// Tasks queued but not yet started
    [[nodiscard]] virtual auto queued_tasks() const -> std::size_t = 0;

    /**
     * @brief Stop the workers
     *
     * @param drain Run the tasks still queued before returning
     */
    virtual void shutdown(bool drain = true) = 0;

protected:
    thread_pool_interface() = default;
    thread_pool_interface(const thread_pool_interface&) = delete;
    auto operator=(const thread_pool_interface&) -> thread_pool_interface& = delete;
};

}  // namespace migrate::integration
