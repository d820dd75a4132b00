/**
 * @file phase_orchestrator.cpp
 * @brief Implementation of the phase state machine
 */

#include <migrate/engine/phase_orchestrator.hpp>

#include <migrate/compat/format.hpp>
#include <migrate/integration/logger_adapter.hpp>
#include <migrate/storage/record_store.hpp>

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

namespace migrate::engine {

using integration::logger_adapter;

namespace {

[[nodiscard]] auto plan_error(const std::string& message) -> error_info {
    return error_info{error_codes::plan_invalid, message, "orchestrator"};
}

}  // namespace

// ============================================================================
// run_report
// ============================================================================

auto run_report::find(std::string_view phase_id) const -> const phase_result* {
    auto it = std::find_if(phases.begin(), phases.end(),
                           [&](const phase_result& r) { return r.phase_id == phase_id; });
    return it == phases.end() ? nullptr : &*it;
}

// ============================================================================
// Run State
// ============================================================================

struct phase_orchestrator::run_state {
    run_context context;
    run_report report;

    std::vector<phase_definition> phases;
    std::vector<phase_callback> before_callbacks;
    std::vector<phase_result_callback> after_callbacks;
    std::vector<state_change_callback> state_callbacks;

    /// Final state of every phase that ran in this run
    std::map<std::string, phase_status, std::less<>> statuses;

    bool halted{false};
};

// ============================================================================
// Construction
// ============================================================================

phase_orchestrator::phase_orchestrator(
    engine_config config, std::shared_ptr<storage::record_store_interface> store,
    std::shared_ptr<migration_ledger_interface> ledger,
    std::shared_ptr<rollback_manager> rollback,
    std::shared_ptr<const transform_registry> transforms,
    std::shared_ptr<integration::thread_pool_interface> pool)
    : config_(std::move(config)),
      store_(std::move(store)),
      ledger_(std::move(ledger)),
      rollback_(std::move(rollback)),
      compiler_(std::move(transforms)),
      executor_(std::move(pool), config_.max_parallel_batches) {
    if (!store_) {
        throw std::invalid_argument("record store cannot be null");
    }
    if (!ledger_) {
        throw std::invalid_argument("migration ledger cannot be null");
    }
    if (!rollback_) {
        throw std::invalid_argument("rollback manager cannot be null");
    }
}

// ============================================================================
// Plan
// ============================================================================

auto phase_orchestrator::add_phase(phase_definition phase) -> VoidResult {
    if (phase.id.empty()) {
        return migrate_void_error(error_codes::plan_invalid, "Phase id cannot be empty",
                                  "orchestrator");
    }
    if (!phase.action) {
        return migrate_void_error(error_codes::plan_invalid,
                                  compat::format("Phase {} has no action", phase.id),
                                  "orchestrator");
    }

    std::lock_guard<std::mutex> lock(plan_mutex_);
    auto duplicate = std::any_of(phases_.begin(), phases_.end(),
                                 [&](const phase_definition& p) { return p.id == phase.id; });
    if (duplicate) {
        return migrate_void_error(error_codes::plan_invalid,
                                  compat::format("Duplicate phase id: {}", phase.id),
                                  "orchestrator");
    }
    phases_.push_back(std::move(phase));
    return ok();
}

auto phase_orchestrator::phase_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(plan_mutex_);
    return phases_.size();
}

void phase_orchestrator::on_before_phase(phase_callback callback) {
    std::lock_guard<std::mutex> lock(plan_mutex_);
    before_callbacks_.push_back(std::move(callback));
}

void phase_orchestrator::on_after_phase(phase_result_callback callback) {
    std::lock_guard<std::mutex> lock(plan_mutex_);
    after_callbacks_.push_back(std::move(callback));
}

void phase_orchestrator::on_state_change(state_change_callback callback) {
    std::lock_guard<std::mutex> lock(plan_mutex_);
    state_callbacks_.push_back(std::move(callback));
}

void phase_orchestrator::set_observer(std::shared_ptr<progress_observer> observer) {
    std::lock_guard<std::mutex> lock(plan_mutex_);
    observer_ = std::move(observer);
}

auto phase_orchestrator::validate_plan(const std::vector<phase_definition>& phases) const
    -> VoidResult {
    std::map<std::string, int, std::less<>> order_of;
    std::set<int> orders;
    std::set<std::string, std::less<>> tags;

    for (const auto& phase : phases) {
        if (phase.id.empty() || !phase.action) {
            return VoidResult(plan_error("Phase without id or action"));
        }
        if (!order_of.emplace(phase.id, phase.order).second) {
            return VoidResult(plan_error(compat::format("Duplicate phase id: {}", phase.id)));
        }
        if (!orders.insert(phase.order).second) {
            return VoidResult(plan_error(
                compat::format("Phase {} reuses order {}", phase.id, phase.order)));
        }
        if (!tags.insert(phase.effective_tag()).second) {
            return VoidResult(plan_error(compat::format("Phase {} reuses tag {}", phase.id,
                                                        phase.effective_tag())));
        }
    }

    for (const auto& phase : phases) {
        for (const auto& dep : phase.depends_on) {
            auto it = order_of.find(dep);
            if (it == order_of.end()) {
                return VoidResult(plan_error(
                    compat::format("Phase {} depends on unknown phase {}", phase.id, dep)));
            }
            if (it->second >= phase.order) {
                return VoidResult(plan_error(compat::format(
                    "Phase {} depends on phase {} which does not run earlier", phase.id,
                    dep)));
            }
        }
    }
    return ok();
}

// ============================================================================
// Execution
// ============================================================================

auto phase_orchestrator::run_per_scope(const std::string& tenant_id) -> run_report {
    if (tenant_id.empty()) {
        run_report report;
        report.run_id = generate_run_id();
        report.scope = migration_scope::per_tenant(tenant_id);
        report.errors.push_back(plan_error("Tenant id cannot be empty"));
        logger_adapter::error("Run {} rejected: empty tenant id", report.run_id);
        return report;
    }
    return run(migration_scope::per_tenant(tenant_id));
}

auto phase_orchestrator::run_per_global() -> run_report {
    return run(migration_scope::global());
}

auto phase_orchestrator::run(const migration_scope& scope) -> run_report {
    std::lock_guard<std::mutex> run_lock(run_mutex_);

    run_state state;
    state.context.run_id = generate_run_id();
    state.context.scope = scope;
    state.context.store = store_;
    {
        std::lock_guard<std::mutex> lock(plan_mutex_);
        state.phases = phases_;
        state.before_callbacks = before_callbacks_;
        state.after_callbacks = after_callbacks_;
        state.state_callbacks = state_callbacks_;
        state.context.observer = observer_;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        active_token_ = state.context.cancellation;
    }

    std::sort(state.phases.begin(), state.phases.end(),
              [](const phase_definition& a, const phase_definition& b) {
                  return a.order < b.order;
              });

    auto& report = state.report;
    report.run_id = state.context.run_id;
    report.scope = scope;
    for (const auto& phase : state.phases) {
        phase_result pending;
        pending.phase_id = phase.id;
        report.phases.push_back(std::move(pending));
    }

    logger_adapter::info("Run {} started for {} with {} phases", report.run_id,
                         scope.to_string(), state.phases.size());
    if (state.context.observer) {
        state.context.observer->on_run_started(state.context);
    }

    // Every phase is checked and compiled before any row is touched
    auto plan_check = validate_plan(state.phases);
    if (plan_check.is_err()) {
        logger_adapter::error("Run {}: {}", report.run_id, plan_check.error().message);
        report.errors.push_back(plan_check.error());
    } else {
        for (std::size_t i = 0; i < state.phases.size(); ++i) {
            const auto& phase = state.phases[i];
            action_setup setup{phase.id,
                               phase.batch_size.value_or(config_.default_batch_size),
                               phase.error_policy.value_or(config_.default_row_error_policy),
                               compiler_};
            auto prepared = phase.action->prepare(state.context, setup);
            if (prepared.is_err()) {
                logger_adapter::error("Run {}: phase {} cannot be prepared: {}",
                                      report.run_id, phase.id, prepared.error().message);
                report.errors.push_back(prepared.error());
                report.phases[i].error = prepared.error();
                transition(state, report.phases[i], phase_status::failed);
            }
        }
    }

    if (report.errors.empty()) {
        for (std::size_t i = 0; i < state.phases.size(); ++i) {
            const auto& phase = state.phases[i];

            if (state.context.cancellation.is_cancelled()) {
                report.cancelled = true;
                break;
            }
            if (state.halted) {
                break;
            }

            report.phases[i] = run_phase(phase, state);
            const auto& result = report.phases[i];
            state.statuses[phase.id] = result.status;

            if (result.status == phase_status::transferring) {
                report.cancelled = true;
                break;
            }
            if (result.status == phase_status::failed) {
                if (phase.independent) {
                    logger_adapter::warn("Run {}: independent phase {} failed, continuing",
                                         report.run_id, phase.id);
                } else if (config_.halt_on_failure) {
                    state.halted = true;
                }
            }
        }
    }

    report.overall_success =
        report.errors.empty() && !report.cancelled &&
        std::all_of(report.phases.begin(), report.phases.end(), [](const phase_result& r) {
            return r.status == phase_status::committed || r.status == phase_status::skipped;
        });
    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now() - state.context.started_at);

    logger_adapter::log_run_completed(report.run_id, scope.to_string(),
                                      report.overall_success, report.cancelled,
                                      report.phases.size());
    if (state.context.observer) {
        state.context.observer->on_run_finished(state.context, report);
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        active_token_.reset();
    }
    return std::move(state.report);
}

auto phase_orchestrator::run_phase(const phase_definition& phase, run_state& state)
    -> phase_result {
    const auto& context = state.context;

    phase_result result;
    result.phase_id = phase.id;

    for (const auto& callback : state.before_callbacks) {
        callback(context, phase);
    }

    // pending -> skipped
    auto tagged = ledger_->has_tag(phase.effective_tag(), context.scope);
    if (tagged.is_err()) {
        result.error = tagged.error();
        transition(state, result, phase_status::failed);
        notify_after(state, result);
        return result;
    }
    if (tagged.value()) {
        logger_adapter::info("Phase {} already applied for {}, skipping", phase.id,
                             context.scope.to_string());
        transition(state, result, phase_status::skipped);
        notify_after(state, result);
        return result;
    }

    auto deps = dependencies_met(phase, state);
    if (deps.is_err()) {
        logger_adapter::error("Phase {}: {}", phase.id, deps.error().message);
        result.error = deps.error();
        transition(state, result, phase_status::failed);
        notify_after(state, result);
        return result;
    }

    std::optional<rollback_snapshot> snapshot;
    const auto& action = *phase.action;
    const auto target = action.target_table();

    // pending -> validating
    transition(state, result, phase_status::validating);
    auto pre = gate_.run_pre(validation_input{context, phase.id, action.job(), nullptr, target});
    result.validation_failures = pre.failures;
    if (pre.blocked()) {
        fail_phase(phase, state, result, snapshot,
                   error_info{error_codes::validation_failed, pre.summary(), "orchestrator"});
        notify_after(state, result);
        return result;
    }

    // validating -> snapshotting
    if (phase.rollback_required) {
        transition(state, result, phase_status::snapshotting);

        auto keys = action.affected_keys(context, executor_);
        if (keys.is_err()) {
            fail_phase(phase, state, result, snapshot,
                       error_info{error_codes::snapshot_failed,
                                  compat::format("Cannot compute affected keys: {}",
                                                 keys.error().message),
                                  "orchestrator"});
            notify_after(state, result);
            return result;
        }

        auto snapshot_id =
            rollback_manager::make_snapshot_id(context.run_id, phase.id, context.scope);
        auto captured = rollback_->snapshot(snapshot_id, phase.id, context.scope, target,
                                            keys.value(), *store_);
        if (captured.is_err()) {
            fail_phase(phase, state, result, snapshot, captured.error());
            notify_after(state, result);
            return result;
        }
        snapshot = std::move(captured.value());
        result.snapshot_id = snapshot_id;
    }

    // -> transferring
    transition(state, result, phase_status::transferring);
    auto transfer = action.apply(context, executor_);
    result.rows_transferred = transfer.copied;
    result.row_errors = transfer.errors;

    if (transfer.cancelled) {
        logger_adapter::warn("Phase {} cancelled after {} rows; snapshot kept", phase.id,
                             transfer.copied);
        result.error = error_info{error_codes::run_cancelled,
                                  compat::format("Run {} cancelled", context.run_id),
                                  "orchestrator"};
        notify_after(state, result);
        return result;
    }
    if (transfer.failure) {
        fail_phase(phase, state, result, snapshot, *transfer.failure);
        notify_after(state, result);
        return result;
    }

    // transferring -> post_validating
    transition(state, result, phase_status::post_validating);
    auto post =
        gate_.run_post(validation_input{context, phase.id, action.job(), &transfer, target});
    result.validation_failures.insert(result.validation_failures.end(),
                                      post.failures.begin(), post.failures.end());
    if (post.blocked()) {
        fail_phase(phase, state, result, snapshot,
                   error_info{error_codes::validation_failed, post.summary(), "orchestrator"});
        notify_after(state, result);
        return result;
    }

    // post_validating -> committed; the tag is the last write of the phase
    auto commit = ledger_->commit_tag(phase.effective_tag(), context.scope);
    bool already_committed =
        commit.is_err() && commit.error().code == error_codes::already_committed;
    if (commit.is_err() && !already_committed) {
        fail_phase(phase, state, result, snapshot, commit.error());
        notify_after(state, result);
        return result;
    }
    logger_adapter::log_tag_committed(phase.effective_tag(), context.scope.to_string(),
                                      already_committed);
    transition(state, result, phase_status::committed);

    if (snapshot) {
        auto discarded = rollback_->discard(*snapshot);
        if (discarded.is_err()) {
            logger_adapter::warn("Phase {}: snapshot {} not discarded: {}", phase.id,
                                 snapshot->snapshot_id, discarded.error().message);
        }
    }

    logger_adapter::info("Phase {} committed: {} rows, {} row errors", phase.id,
                         result.rows_transferred, result.row_errors.size());
    notify_after(state, result);
    return result;
}

auto phase_orchestrator::dependencies_met(const phase_definition& phase,
                                          const run_state& state) const -> VoidResult {
    for (const auto& dep : phase.depends_on) {
        auto status = state.statuses.find(dep);
        if (status != state.statuses.end() &&
            (status->second == phase_status::committed ||
             status->second == phase_status::skipped)) {
            continue;
        }

        auto definition =
            std::find_if(state.phases.begin(), state.phases.end(),
                         [&](const phase_definition& p) { return p.id == dep; });
        if (definition != state.phases.end()) {
            auto tagged = ledger_->has_tag(definition->effective_tag(), state.context.scope);
            if (tagged.is_ok() && tagged.value()) {
                continue;
            }
        }
        return migrate_void_error(
            error_codes::dependency_unmet,
            compat::format("Dependency {} of phase {} is not applied", dep, phase.id),
            "orchestrator");
    }
    return ok();
}

void phase_orchestrator::transition(const run_state& state, phase_result& result,
                                    phase_status to) const {
    auto from = result.status;
    result.status = to;

    const auto& context = state.context;
    logger_adapter::log_phase_transition(context.run_id, result.phase_id,
                                         context.scope.to_string(), to_string(from),
                                         to_string(to));

    for (const auto& callback : state.state_callbacks) {
        callback(context, result.phase_id, from, to);
    }
    if (context.observer) {
        context.observer->on_phase_state(context, result.phase_id, from, to);
    }
}

void phase_orchestrator::fail_phase(const phase_definition& phase, run_state& state,
                                    phase_result& result,
                                    std::optional<rollback_snapshot>& snapshot,
                                    error_info cause) {
    logger_adapter::error("Phase {} failed: {}", phase.id, cause.message);
    result.error = std::move(cause);

    if (snapshot) {
        transition(state, result, phase_status::rolling_back);
        auto restored = rollback_->restore(*snapshot, *store_);
        if (restored.is_err()) {
            // The store is in an unknown state; nothing else may run
            state.report.errors.push_back(restored.error());
            state.halted = true;
        }
    }
    transition(state, result, phase_status::failed);
}

void phase_orchestrator::notify_after(const run_state& state,
                                      const phase_result& result) const {
    for (const auto& callback : state.after_callbacks) {
        callback(state.context, result);
    }
}

// ============================================================================
// Cancellation and Recovery
// ============================================================================

void phase_orchestrator::cancel() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (active_token_) {
        logger_adapter::warn("Cancellation requested");
        active_token_->cancel();
    }
}

auto phase_orchestrator::is_running() const -> bool {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return active_token_.has_value();
}

auto phase_orchestrator::rollback_pending(const std::string& phase_id,
                                          const migration_scope& scope) -> VoidResult {
    std::lock_guard<std::mutex> run_lock(run_mutex_);

    auto pending = rollback_->pending_snapshots();
    if (pending.is_err()) {
        return migrate_void_error(pending.error().code, pending.error().message,
                                  "orchestrator");
    }

    std::vector<snapshot_summary> matching;
    for (const auto& summary : pending.value()) {
        if (summary.phase_id == phase_id && summary.scope == scope) {
            matching.push_back(summary);
        }
    }
    if (matching.empty()) {
        return migrate_void_error(
            error_codes::snapshot_not_found,
            compat::format("No pending snapshot for phase {} in {}", phase_id,
                           scope.to_string()),
            "orchestrator");
    }

    std::sort(matching.begin(), matching.end(),
              [](const snapshot_summary& a, const snapshot_summary& b) {
                  return a.created_at > b.created_at;
              });

    for (const auto& summary : matching) {
        auto loaded = rollback_->load(summary.snapshot_id);
        if (loaded.is_err()) {
            return migrate_void_error(loaded.error().code, loaded.error().message,
                                      "orchestrator");
        }
        auto snapshot = loaded.value();
        auto restored = rollback_->restore(snapshot, *store_);
        if (restored.is_err()) {
            return restored;
        }
        logger_adapter::info("Pending snapshot {} restored", summary.snapshot_id);
    }
    return ok();
}

}  // namespace migrate::engine
