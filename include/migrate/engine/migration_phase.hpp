/**
 * @file migration_phase.hpp
 * @brief Phase definitions and the actions a phase can perform
 *
 * A phase_action is the small interface the orchestrator needs from a kind
 * of phase: which table it mutates, which keys it will touch, and how to
 * apply it. transfer_action and purge_action ship with the engine; other
 * kinds plug in without orchestrator changes.
 */

#pragma once

#include <migrate/engine/batch_transfer_executor.hpp>
#include <migrate/engine/mapping_compiler.hpp>
#include <migrate/engine/run_context.hpp>
#include <migrate/engine/transfer_job.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace migrate::engine {

/**
 * @brief Settings resolved by the orchestrator before a run
 */
struct action_setup {
    std::string phase_id;
    std::size_t batch_size{500};
    row_error_policy policy{row_error_policy::continue_and_report};
    const mapping_compiler& compiler;
};

/**
 * @brief What a phase does to the store
 */
class phase_action {
public:
    virtual ~phase_action() = default;

    /// Short kind name for logs ("transfer", "purge", ...)
    [[nodiscard]] virtual auto kind() const -> std::string_view = 0;

    [[nodiscard]] virtual auto target_table() const -> std::string = 0;

    /**
     * @brief Resolve shapes and compile everything the action needs
     *
     * Called for every phase before any phase runs; an error here fails
     * the run before a row is touched.
     */
    [[nodiscard]] virtual auto prepare(const run_context& context,
                                       const action_setup& setup) -> VoidResult = 0;

    /**
     * @brief Keys of target_table() rows the action will insert, replace or delete
     */
    [[nodiscard]] virtual auto affected_keys(const run_context& context,
                                             const batch_transfer_executor& executor) const
        -> Result<std::vector<core::row_key>> = 0;

    /**
     * @brief Mutate the store
     *
     * transfer_result::copied counts the rows written or deleted.
     */
    [[nodiscard]] virtual auto apply(const run_context& context,
                                     const batch_transfer_executor& executor) const
        -> transfer_result = 0;

    /**
     * @brief The compiled transfer job, if the action copies rows
     */
    [[nodiscard]] virtual auto job() const -> const transfer_job* { return nullptr; }
};

/**
 * @brief Copy rows from one table to another through a field mapping
 */
class transfer_action final : public phase_action {
public:
    transfer_action(std::string source_table, std::string target_table,
                    std::vector<field_mapping> rules, core::row_filter filter = {});

    [[nodiscard]] auto kind() const -> std::string_view override { return "transfer"; }

    [[nodiscard]] auto target_table() const -> std::string override {
        return target_table_;
    }

    [[nodiscard]] auto prepare(const run_context& context, const action_setup& setup)
        -> VoidResult override;

    [[nodiscard]] auto affected_keys(const run_context& context,
                                     const batch_transfer_executor& executor) const
        -> Result<std::vector<core::row_key>> override;

    [[nodiscard]] auto apply(const run_context& context,
                             const batch_transfer_executor& executor) const
        -> transfer_result override;

    [[nodiscard]] auto job() const -> const transfer_job* override;

private:
    std::string source_table_;
    std::string target_table_;
    std::vector<field_mapping> rules_;
    core::row_filter filter_;

    std::optional<transfer_job> job_;
};

/**
 * @brief Delete the rows of a table that match a filter
 */
class purge_action final : public phase_action {
public:
    purge_action(std::string table, core::row_filter filter);

    [[nodiscard]] auto kind() const -> std::string_view override { return "purge"; }

    [[nodiscard]] auto target_table() const -> std::string override { return table_; }

    [[nodiscard]] auto prepare(const run_context& context, const action_setup& setup)
        -> VoidResult override;

    [[nodiscard]] auto affected_keys(const run_context& context,
                                     const batch_transfer_executor& executor) const
        -> Result<std::vector<core::row_key>> override;

    [[nodiscard]] auto apply(const run_context& context,
                             const batch_transfer_executor& executor) const
        -> transfer_result override;

private:
    std::string table_;
    core::row_filter filter_;
    std::string phase_id_;
    std::size_t batch_size_{500};
};

/**
 * @brief Declaration of one phase of a migration
 */
struct phase_definition {
    /// Unique phase identifier
    std::string id;

    /// Human-readable name
    std::string name;

    /// Execution position; unique within a plan, lower runs first
    int order{0};

    /// Ids of earlier phases that must be committed or skipped first
    std::vector<std::string> depends_on;

    /// Capture a snapshot before mutating and restore it on failure
    bool rollback_required{true};

    /// A failure of this phase does not halt the run
    bool independent{false};

    /// Ledger tag; defaults to the phase id when empty
    std::string tag_id;

    /// Overrides engine_config::default_row_error_policy
    std::optional<row_error_policy> error_policy;

    /// Overrides engine_config::default_batch_size
    std::optional<std::size_t> batch_size;

    std::shared_ptr<phase_action> action;

    [[nodiscard]] auto effective_tag() const -> const std::string& {
        return tag_id.empty() ? id : tag_id;
    }
};

}  // namespace migrate::engine
