/**
 * @file phase_orchestrator.hpp
 * @brief Ordered, idempotent execution of migration phases
 *
 * The orchestrator drives every phase of a plan through the state machine
 *
 *   pending -> validating -> snapshotting -> transferring -> post_validating
 *           -> committed
 *
 * with the side exits `skipped` (tag already in the ledger) and
 * `rolling_back -> failed` (blocking failure after a snapshot exists).
 */

#pragma once

#include <migrate/engine/batch_transfer_executor.hpp>
#include <migrate/engine/engine_config.hpp>
#include <migrate/engine/mapping_compiler.hpp>
#include <migrate/engine/migration_ledger.hpp>
#include <migrate/engine/migration_phase.hpp>
#include <migrate/engine/rollback_manager.hpp>
#include <migrate/engine/run_context.hpp>
#include <migrate/engine/validation_gate.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace migrate::integration {
class thread_pool_interface;
}  // namespace migrate::integration

namespace migrate::storage {
class record_store_interface;
}  // namespace migrate::storage

namespace migrate::engine {

// ============================================================================
// Run Results
// ============================================================================

/**
 * @brief Outcome of one phase in a run
 */
struct phase_result {
    std::string phase_id;

    /// State reached; a cancelled phase stays in transferring
    phase_status status{phase_status::pending};

    /// Rows written (transfer) or deleted (purge)
    std::size_t rows_transferred{0};

    std::vector<row_error> row_errors;
    std::vector<validation_failure> validation_failures;

    /// Cause of a failed or cancelled phase
    std::optional<error_info> error;

    /// Snapshot captured for the phase, if any
    std::optional<std::string> snapshot_id;
};

/**
 * @brief Outcome of a whole run
 */
struct run_report {
    std::string run_id;
    migration_scope scope;
    std::vector<phase_result> phases;
    bool overall_success{false};
    bool cancelled{false};
    std::chrono::milliseconds duration{0};

    /// Plan, compile and restore errors
    std::vector<error_info> errors;

    [[nodiscard]] auto find(std::string_view phase_id) const -> const phase_result*;
};

// ============================================================================
// Phase Orchestrator
// ============================================================================

/**
 * @brief Runs a plan of phases for one scope at a time
 *
 * Phases run strictly sequentially in increasing order. Before the first
 * phase starts, the plan is checked and every phase is prepared (mapping
 * compiled), so a bad plan fails the run without touching a row.
 *
 * Thread Safety:
 * - One run at a time per orchestrator; concurrent run calls serialize
 * - cancel() may be called from any thread
 *
 * @example
 * @code
 * phase_orchestrator orchestrator(config, store, ledger, rollback, registry);
 *
 * phase_definition copy;
 * copy.id = "copy-customers";
 * copy.order = 1;
 * copy.tag_id = make_tag_id("crm", "customer-v2", "2024-05-01");
 * copy.action = std::make_shared<transfer_action>(
 *     "customer_v1", "customer_v2", rules);
 * (void)orchestrator.add_phase(std::move(copy));
 *
 * auto report = orchestrator.run_per_scope("acme");
 * @endcode
 */
class phase_orchestrator {
public:
    using phase_callback =
        std::function<void(const run_context& context, const phase_definition& phase)>;
    using phase_result_callback =
        std::function<void(const run_context& context, const phase_result& result)>;
    using state_change_callback =
        std::function<void(const run_context& context, const std::string& phase_id,
                           phase_status from, phase_status to)>;

    /**
     * @throws std::invalid_argument if store, ledger or rollback is null
     */
    phase_orchestrator(engine_config config,
                       std::shared_ptr<storage::record_store_interface> store,
                       std::shared_ptr<migration_ledger_interface> ledger,
                       std::shared_ptr<rollback_manager> rollback,
                       std::shared_ptr<const transform_registry> transforms = nullptr,
                       std::shared_ptr<integration::thread_pool_interface> pool = nullptr);

    ~phase_orchestrator() = default;

    phase_orchestrator(const phase_orchestrator&) = delete;
    auto operator=(const phase_orchestrator&) -> phase_orchestrator& = delete;

    // =========================================================================
    // Plan
    // =========================================================================

    /**
     * @brief Add a phase to the plan
     * @return plan_invalid for an empty id, a missing action or a duplicate id
     */
    [[nodiscard]] auto add_phase(phase_definition phase) -> VoidResult;

    [[nodiscard]] auto phase_count() const -> std::size_t;

    /**
     * @brief Validation rules applied around the phases
     */
    [[nodiscard]] auto gate() noexcept -> validation_gate& { return gate_; }

    // =========================================================================
    // Callbacks
    // =========================================================================

    /// Invoked before a phase leaves pending, in registration order
    void on_before_phase(phase_callback callback);

    /// Invoked once a phase reached its final state for the run
    void on_after_phase(phase_result_callback callback);

    void on_state_change(state_change_callback callback);

    void set_observer(std::shared_ptr<progress_observer> observer);

    // =========================================================================
    // Execution
    // =========================================================================

    /**
     * @brief Run the plan for one tenant
     *
     * An empty tenant id fails the run with plan_invalid.
     */
    [[nodiscard]] auto run_per_scope(const std::string& tenant_id) -> run_report;

    [[nodiscard]] auto run_per_global() -> run_report;

    [[nodiscard]] auto run(const migration_scope& scope) -> run_report;

    /**
     * @brief Request cancellation of the active run
     *
     * The executor stops between batches. The phase keeps the state it
     * reached and its snapshot stays persisted for rollback_pending().
     */
    void cancel();

    [[nodiscard]] auto is_running() const -> bool;

    /**
     * @brief Restore the snapshots a cancelled run left for a phase
     *
     * Newest snapshot first.
     *
     * @return ok(), snapshot_not_found when nothing is pending, or restore_failed
     */
    [[nodiscard]] auto rollback_pending(const std::string& phase_id,
                                        const migration_scope& scope) -> VoidResult;

private:
    struct run_state;

    [[nodiscard]] auto validate_plan(const std::vector<phase_definition>& phases) const
        -> VoidResult;

    [[nodiscard]] auto run_phase(const phase_definition& phase, run_state& state)
        -> phase_result;

    [[nodiscard]] auto dependencies_met(const phase_definition& phase,
                                        const run_state& state) const -> VoidResult;

    void transition(const run_state& state, phase_result& result,
                    phase_status to) const;

    void fail_phase(const phase_definition& phase, run_state& state,
                    phase_result& result, std::optional<rollback_snapshot>& snapshot,
                    error_info cause);

    void notify_after(const run_state& state, const phase_result& result) const;

    engine_config config_;
    std::shared_ptr<storage::record_store_interface> store_;
    std::shared_ptr<migration_ledger_interface> ledger_;
    std::shared_ptr<rollback_manager> rollback_;
    mapping_compiler compiler_;
    batch_transfer_executor executor_;
    validation_gate gate_;

    mutable std::mutex plan_mutex_;
    std::vector<phase_definition> phases_;
    std::vector<phase_callback> before_callbacks_;
    std::vector<phase_result_callback> after_callbacks_;
    std::vector<state_change_callback> state_callbacks_;
    std::shared_ptr<progress_observer> observer_;

    std::mutex run_mutex_;

    mutable std::mutex state_mutex_;
    std::optional<cancellation_token> active_token_;
};

}  // namespace migrate::engine
