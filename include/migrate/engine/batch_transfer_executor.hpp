/**
 * @file batch_transfer_executor.hpp
 * @brief Streams source rows through a mapping plan into bounded batches
 */

#pragma once

#include <migrate/engine/run_context.hpp>
#include <migrate/engine/transfer_job.hpp>

#include <cstddef>
#include <memory>
#include <vector>

namespace migrate::integration {
class thread_pool_interface;
}  // namespace migrate::integration

namespace migrate::engine {

/**
 * @brief Executes transfer jobs against the run's record store
 *
 * Rows are read from a cursor over the source table, mapped, validated
 * against the target shape and written with one upsert per batch. A failed
 * flush stops the job but does not undo earlier batches; phase-level
 * rollback is the rollback manager's job.
 *
 * With a thread pool and max_parallel_batches > 1, batches are still read
 * sequentially but up to max_parallel_batches flushes run at once. The
 * store's per-call upsert atomicity makes each batch independent.
 *
 * Cancellation is checked between batches only.
 */
class batch_transfer_executor {
public:
    explicit batch_transfer_executor(
        std::shared_ptr<integration::thread_pool_interface> pool = nullptr,
        std::size_t max_parallel_batches = 1);

    /**
     * @brief Run a transfer job to completion, failure or cancellation
     */
    [[nodiscard]] auto execute(const transfer_job& job,
                               const run_context& context) const
        -> transfer_result;

    /**
     * @brief Compute the target keys the job would write
     *
     * Rows that would be skipped by a row error are not included. Keys are
     * unique and in source cursor order.
     */
    [[nodiscard]] auto plan_target_keys(const transfer_job& job,
                                        const run_context& context) const
        -> Result<std::vector<core::row_key>>;

    [[nodiscard]] auto is_parallel() const noexcept -> bool {
        return pool_ != nullptr && max_parallel_batches_ > 1;
    }

private:
    [[nodiscard]] auto check_job(const transfer_job& job,
                                 const run_context& context) const -> VoidResult;

    std::shared_ptr<integration::thread_pool_interface> pool_;
    std::size_t max_parallel_batches_;
};

}  // namespace migrate::engine
