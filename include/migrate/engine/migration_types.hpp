/**
 * @file migration_types.hpp
 * @brief Common types shared by the migration engine components
 *
 * This file defines migration scopes, idempotency tags, the per-phase
 * row error policy and the phase state enumeration.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace migrate::engine {

// ============================================================================
// Migration Scope
// ============================================================================

/**
 * @brief Where a migration applies: the whole system or one tenant
 *
 * The textual form is "global" or "tenant:<id>" and is what the ledger and
 * snapshot store persist.
 */
class migration_scope {
public:
    /// Default scope is global
    migration_scope() = default;

    [[nodiscard]] static auto global() -> migration_scope { return {}; }

    [[nodiscard]] static auto per_tenant(std::string tenant_id) -> migration_scope {
        migration_scope scope;
        scope.tenant_id_ = std::move(tenant_id);
        return scope;
    }

    /**
     * @brief Parse the textual form produced by to_string()
     * @return Parsed scope or std::nullopt if malformed
     */
    [[nodiscard]] static auto from_string(std::string_view text)
        -> std::optional<migration_scope>;

    [[nodiscard]] auto is_global() const noexcept -> bool {
        return !tenant_id_.has_value();
    }

    /// Tenant identifier; empty for the global scope
    [[nodiscard]] auto tenant_id() const -> std::string {
        return tenant_id_.value_or("");
    }

    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(const migration_scope& other) const
        -> bool = default;

private:
    std::optional<std::string> tenant_id_;
};

// ============================================================================
// Idempotency Tag
// ============================================================================

/**
 * @brief A committed idempotency marker
 */
struct migration_tag {
    /// Tag identifier, e.g. "billing-split_invoices-2024-05-01"
    std::string id;

    /// Scope the tag was committed for
    migration_scope scope;

    /// Commit time (UTC, second precision)
    std::chrono::system_clock::time_point applied_at;
};

/**
 * @brief Build a tag id in the conventional {component}-{feature}-{date} form
 *
 * @param component Owning component identifier
 * @param feature Feature or change name
 * @param iso_date Date of the change (YYYY-MM-DD)
 */
[[nodiscard]] auto make_tag_id(std::string_view component,
                               std::string_view feature,
                               std::string_view iso_date) -> std::string;

// ============================================================================
// Row Error Policy
// ============================================================================

/**
 * @brief What a phase does when a single row fails to map or write
 */
enum class row_error_policy {
    continue_and_report,  ///< Skip the row, record it, keep going
    abort_phase           ///< Stop the phase; it fails and rolls back
};

[[nodiscard]] constexpr auto to_string(row_error_policy policy) noexcept
    -> std::string_view {
    switch (policy) {
        case row_error_policy::continue_and_report:
            return "continue_and_report";
        case row_error_policy::abort_phase:
            return "abort_phase";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto row_error_policy_from_string(std::string_view str)
    -> std::optional<row_error_policy> {
    if (str == "continue_and_report") {
        return row_error_policy::continue_and_report;
    }
    if (str == "abort_phase") {
        return row_error_policy::abort_phase;
    }
    return std::nullopt;
}

// ============================================================================
// Phase Status
// ============================================================================

/**
 * @brief States of the per-phase state machine
 *
 * committed, failed and skipped are terminal. A cancelled run leaves the
 * phase it interrupted in transferring.
 */
enum class phase_status {
    pending,
    validating,
    snapshotting,
    transferring,
    post_validating,
    committed,
    rolling_back,
    failed,
    skipped
};

[[nodiscard]] constexpr auto to_string(phase_status status) noexcept
    -> std::string_view {
    switch (status) {
        case phase_status::pending:
            return "pending";
        case phase_status::validating:
            return "validating";
        case phase_status::snapshotting:
            return "snapshotting";
        case phase_status::transferring:
            return "transferring";
        case phase_status::post_validating:
            return "post_validating";
        case phase_status::committed:
            return "committed";
        case phase_status::rolling_back:
            return "rolling_back";
        case phase_status::failed:
            return "failed";
        case phase_status::skipped:
            return "skipped";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto is_terminal(phase_status status) noexcept -> bool {
    return status == phase_status::committed || status == phase_status::failed ||
           status == phase_status::skipped;
}

}  // namespace migrate::engine
