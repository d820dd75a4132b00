/**
 * @file transfer_job.hpp
 * @brief Unit of work for the batch transfer executor and its result
 */

#pragma once

#include <migrate/core/row.hpp>
#include <migrate/engine/mapping_compiler.hpp>
#include <migrate/engine/migration_types.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace migrate::engine {

/**
 * @brief A compiled copy from one table to another
 *
 * Built once when the run plan is compiled and not modified afterwards.
 */
struct transfer_job {
    /// Phase that owns the job (for errors and progress)
    std::string phase_id;

    std::string source_table;
    std::string target_table;

    /// Opaque source filter, passed to the store unmodified
    core::row_filter filter;

    std::shared_ptr<const mapping_plan> plan;

    /// Rows per upsert call
    std::size_t batch_size{500};

    row_error_policy policy{row_error_policy::continue_and_report};
};

/**
 * @brief Where a row failed
 */
enum class row_error_stage {
    transform,  ///< Mapping could not produce a target row
    write       ///< Target row rejected before the flush (shape or key)
};

[[nodiscard]] constexpr auto to_string(row_error_stage stage) noexcept
    -> std::string_view {
    switch (stage) {
        case row_error_stage::transform:
            return "transform";
        case row_error_stage::write:
            return "write";
    }
    return "unknown";
}

/**
 * @brief A single skipped row
 */
struct row_error {
    /// Source row key (empty if the source key itself was unreadable)
    core::row_key row_key;
    row_error_stage stage{row_error_stage::transform};
    std::string message;
};

/**
 * @brief Outcome of executing a transfer job
 */
struct transfer_result {
    /// Rows written to the target
    std::size_t copied{0};

    /// Rows skipped because of a row error
    std::size_t skipped{0};

    std::size_t batches_flushed{0};

    std::vector<row_error> errors;

    /// Set when the job stopped early on a flush failure or abort policy
    std::optional<error_info> failure;

    /// Set when the run was cancelled between batches
    bool cancelled{false};

    [[nodiscard]] auto succeeded() const noexcept -> bool {
        return !failure.has_value() && !cancelled;
    }
};

}  // namespace migrate::engine
