/**
 * @file run_context.hpp
 * @brief Per-run state threaded through every engine call
 */

#pragma once

#include <migrate/engine/migration_types.hpp>
#include <migrate/engine/progress_observer.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace migrate::storage {
class record_store_interface;
}  // namespace migrate::storage

namespace migrate::engine {

/**
 * @brief Shared cancellation flag
 *
 * Copies share state: cancelling any copy cancels all of them.
 */
class cancellation_token {
public:
    cancellation_token() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true); }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return flag_->load();
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @brief Everything one migration run needs
 *
 * Lifetime is a single run. The store is shared with the caller; the
 * observer may be null.
 */
struct run_context {
    std::string run_id;
    migration_scope scope;
    cancellation_token cancellation;
    std::chrono::system_clock::time_point started_at{std::chrono::system_clock::now()};

    std::shared_ptr<storage::record_store_interface> store;
    std::shared_ptr<progress_observer> observer;
};

/**
 * @brief Generate a run identifier ("run-<utc timestamp>-<random hex>")
 */
[[nodiscard]] auto generate_run_id() -> std::string;

}  // namespace migrate::engine
