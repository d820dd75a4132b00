/**
 * @file validation_gate.hpp
 * @brief Pre- and post-condition checks around a phase
 *
 * Rules are registered per phase. A blocking failure stops the phase (and
 * triggers rollback when the phase requires it); warnings are reported in
 * the phase result and the run continues.
 */

#pragma once

#include <migrate/engine/run_context.hpp>
#include <migrate/engine/transfer_job.hpp>

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace migrate::engine {

enum class validation_stage { pre, post };

enum class validation_severity { blocking, warning };

[[nodiscard]] constexpr auto to_string(validation_stage stage) noexcept
    -> std::string_view {
    return stage == validation_stage::pre ? "pre" : "post";
}

[[nodiscard]] constexpr auto to_string(validation_severity severity) noexcept
    -> std::string_view {
    return severity == validation_severity::blocking ? "blocking" : "warning";
}

/**
 * @brief What a rule predicate can inspect
 */
struct validation_input {
    const run_context& context;

    std::string phase_id;

    /// Transfer job of the phase; null for phases that do not copy rows
    const transfer_job* job{nullptr};

    /// Transfer outcome; only set for post-validation of a transfer phase
    const transfer_result* result{nullptr};

    /// Table the phase mutates
    std::string target_table;
};

/**
 * @brief Rule body: ok() passes, an error fails the rule with its message
 *
 * An exception thrown by the predicate also fails the rule.
 */
using validation_predicate = std::function<VoidResult(const validation_input&)>;

struct validation_rule {
    std::string phase_id;
    std::string name;
    validation_stage stage{validation_stage::pre};
    validation_severity severity{validation_severity::blocking};
    validation_predicate predicate;
};

struct validation_failure {
    std::string phase_id;
    std::string rule_name;
    validation_stage stage{validation_stage::pre};
    validation_severity severity{validation_severity::blocking};
    std::string message;
};

/**
 * @brief Failures from one stage of one phase
 */
struct validation_report {
    std::vector<validation_failure> failures;

    /// Number of rules evaluated
    std::size_t rules_run{0};

    [[nodiscard]] auto blocked() const -> bool;

    [[nodiscard]] auto blocking_failures() const -> std::vector<validation_failure>;

    [[nodiscard]] auto warnings() const -> std::vector<validation_failure>;

    /**
     * @brief One line per failure, "rule: message"
     */
    [[nodiscard]] auto summary() const -> std::string;
};

/**
 * @brief Holds rules and evaluates them in registration order
 *
 * Thread Safety: add_rule() and the run methods may be called concurrently.
 */
class validation_gate {
public:
    /**
     * @brief Register a rule
     * @return plan_invalid if the rule has no phase, name or predicate
     */
    [[nodiscard]] auto add_rule(validation_rule rule) -> VoidResult;

    [[nodiscard]] auto rule_count(std::string_view phase_id) const -> std::size_t;

    /**
     * @brief Evaluate the pre rules of a phase
     */
    [[nodiscard]] auto run_pre(const validation_input& input) const
        -> validation_report;

    /**
     * @brief Evaluate the post rules of a phase
     */
    [[nodiscard]] auto run_post(const validation_input& input) const
        -> validation_report;

private:
    [[nodiscard]] auto run_stage(validation_stage stage,
                                 const validation_input& input) const
        -> validation_report;

    mutable std::mutex mutex_;
    std::vector<validation_rule> rules_;
};

// ============================================================================
// Stock Rules
// ============================================================================

namespace rules {

/**
 * @brief Fails when @p table is not known to the store
 */
[[nodiscard]] auto table_exists(std::string phase_id, std::string table,
                                validation_stage stage = validation_stage::pre,
                                validation_severity severity = validation_severity::blocking)
    -> validation_rule;

/**
 * @brief Fails when more than @p max_rows rows of @p table match @p filter
 */
[[nodiscard]] auto max_row_count(std::string phase_id, std::string table,
                                 core::row_filter filter, std::size_t max_rows,
                                 validation_severity severity = validation_severity::blocking)
    -> validation_rule;

/**
 * @brief Post rule: filtered source count minus skipped rows must equal the
 *        number of target rows matching @p target_filter
 *
 * Uses the phase's transfer job for the source table and filter.
 */
[[nodiscard]] auto row_count_parity(std::string phase_id,
                                    core::row_filter target_filter = {},
                                    validation_severity severity = validation_severity::blocking)
    -> validation_rule;

/**
 * @brief Post rule: no two rows of @p table share a value of @p field
 *
 * NULL values are ignored.
 */
[[nodiscard]] auto no_duplicate_keys(std::string phase_id, std::string table,
                                     std::string field,
                                     validation_severity severity = validation_severity::blocking)
    -> validation_rule;

}  // namespace rules

}  // namespace migrate::engine
