/**
 * @file migration_phase.cpp
 * @brief Implementation of the shipped phase actions
 */

#include <migrate/engine/migration_phase.hpp>

#include <migrate/compat/format.hpp>
#include <migrate/integration/logger_adapter.hpp>
#include <migrate/storage/record_store.hpp>

namespace migrate::engine {

using integration::logger_adapter;

namespace {

[[nodiscard]] auto not_prepared(std::string_view kind) -> error_info {
    return error_info{error_codes::plan_invalid,
                      compat::format("{} action used before prepare()", kind),
                      "phase"};
}

}  // namespace

// ============================================================================
// transfer_action
// ============================================================================

transfer_action::transfer_action(std::string source_table, std::string target_table,
                                 std::vector<field_mapping> rules,
                                 core::row_filter filter)
    : source_table_(std::move(source_table)),
      target_table_(std::move(target_table)),
      rules_(std::move(rules)),
      filter_(std::move(filter)) {}

auto transfer_action::prepare(const run_context& context, const action_setup& setup)
    -> VoidResult {
    job_.reset();

    auto source = context.store->describe(source_table_);
    if (source.is_err()) {
        return migrate_void_error(
            error_codes::mapping_compile_error,
            compat::format("Phase {}: source {}", setup.phase_id, source.error().message),
            "phase");
    }
    auto target = context.store->describe(target_table_);
    if (target.is_err()) {
        return migrate_void_error(
            error_codes::mapping_compile_error,
            compat::format("Phase {}: target {}", setup.phase_id, target.error().message),
            "phase");
    }

    auto plan = setup.compiler.compile(source.value(), target.value(), rules_);
    if (plan.is_err()) {
        return migrate_void_error(
            plan.error().code,
            compat::format("Phase {}: {}", setup.phase_id, plan.error().message),
            "phase");
    }

    transfer_job job;
    job.phase_id = setup.phase_id;
    job.source_table = source_table_;
    job.target_table = target_table_;
    job.filter = filter_;
    job.plan = std::make_shared<const mapping_plan>(std::move(plan.value()));
    job.batch_size = setup.batch_size;
    job.policy = setup.policy;
    job_ = std::move(job);
    return ok();
}

auto transfer_action::affected_keys(const run_context& context,
                                    const batch_transfer_executor& executor) const
    -> Result<std::vector<core::row_key>> {
    if (!job_) {
        return Result<std::vector<core::row_key>>(not_prepared(kind()));
    }
    return executor.plan_target_keys(*job_, context);
}

auto transfer_action::apply(const run_context& context,
                            const batch_transfer_executor& executor) const
    -> transfer_result {
    if (!job_) {
        transfer_result result;
        result.failure = not_prepared(kind());
        return result;
    }
    return executor.execute(*job_, context);
}

auto transfer_action::job() const -> const transfer_job* {
    return job_ ? &*job_ : nullptr;
}

// ============================================================================
// purge_action
// ============================================================================

purge_action::purge_action(std::string table, core::row_filter filter)
    : table_(std::move(table)), filter_(std::move(filter)) {}

auto purge_action::prepare(const run_context& context, const action_setup& setup)
    -> VoidResult {
    auto shape = context.store->describe(table_);
    if (shape.is_err()) {
        return migrate_void_error(
            error_codes::plan_invalid,
            compat::format("Phase {}: {}", setup.phase_id, shape.error().message),
            "phase");
    }
    phase_id_ = setup.phase_id;
    batch_size_ = setup.batch_size == 0 ? 1 : setup.batch_size;
    return ok();
}

auto purge_action::affected_keys(const run_context& context,
                                 const batch_transfer_executor& /*executor*/) const
    -> Result<std::vector<core::row_key>> {
    using result_type = Result<std::vector<core::row_key>>;

    auto shape = context.store->describe(table_);
    if (shape.is_err()) {
        return result_type(shape.error());
    }
    auto cursor = context.store->find(table_, filter_);
    if (cursor.is_err()) {
        return result_type(cursor.error());
    }

    std::vector<core::row_key> keys;
    while (auto r = cursor.value()->next()) {
        auto key = r->key(shape.value());
        if (key.is_err()) {
            return result_type(key.error());
        }
        keys.push_back(std::move(key.value()));
    }
    if (auto read_failure = cursor.value()->failure()) {
        return result_type(*read_failure);
    }
    return keys;
}

auto purge_action::apply(const run_context& context,
                         const batch_transfer_executor& executor) const
    -> transfer_result {
    transfer_result result;

    auto keys = affected_keys(context, executor);
    if (keys.is_err()) {
        result.failure = keys.error();
        return result;
    }

    std::size_t in_batch = 0;
    for (const auto& key : keys.value()) {
        if (in_batch == 0 && context.cancellation.is_cancelled()) {
            result.cancelled = true;
            break;
        }

        auto removed = context.store->remove(table_, key);
        if (removed.is_err()) {
            result.failure = error_info{
                error_codes::row_write_failed,
                compat::format("Cannot delete row '{}' of '{}': {}", key, table_,
                               removed.error().message),
                "phase"};
            break;
        }
        ++result.copied;

        if (++in_batch == batch_size_) {
            in_batch = 0;
            ++result.batches_flushed;
            if (context.observer) {
                context.observer->on_batch_flushed(
                    context, batch_progress{phase_id_, table_, result.batches_flushed,
                                            result.copied, 0});
            }
        }
    }
    if (in_batch > 0 && !result.failure) {
        ++result.batches_flushed;
    }

    logger_adapter::info("Phase {}: {} rows purged from '{}'", phase_id_, result.copied,
                         table_);
    return result;
}

}  // namespace migrate::engine
