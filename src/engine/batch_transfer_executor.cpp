/**
 * @file batch_transfer_executor.cpp
 * @brief Implementation of the batch transfer executor
 */

#include <migrate/engine/batch_transfer_executor.hpp>

#include <migrate/compat/format.hpp>
#include <migrate/integration/logger_adapter.hpp>
#include <migrate/integration/thread_pool_interface.hpp>
#include <migrate/storage/record_store.hpp>

#include <deque>
#include <exception>
#include <future>
#include <set>

namespace migrate::engine {

using integration::logger_adapter;

namespace {

/// A mapped row ready for the target, or the reason it is skipped
struct prepared_row {
    std::optional<core::row> target;
    core::row_key target_key;
    std::optional<row_error> error;
};

[[nodiscard]] auto prepare_row(const transfer_job& job, const core::row& source)
    -> prepared_row {
    prepared_row prepared;

    const auto& plan = *job.plan;
    auto source_key = source.key(plan.source_shape());
    auto key_text = source_key.is_ok() ? source_key.value() : core::row_key{};

    auto mapped = plan.apply(source);
    if (mapped.is_err()) {
        prepared.error = row_error{key_text, row_error_stage::transform,
                                   mapped.error().message};
        return prepared;
    }

    auto conforms = core::conforms_to(mapped.value(), plan.target_shape());
    if (conforms.is_err()) {
        prepared.error = row_error{key_text, row_error_stage::write,
                                   conforms.error().message};
        return prepared;
    }

    auto target_key = mapped.value().key(plan.target_shape());
    if (target_key.is_err()) {
        prepared.error = row_error{key_text, row_error_stage::write,
                                   target_key.error().message};
        return prepared;
    }

    prepared.target_key = target_key.value();
    prepared.target = std::move(mapped.value());
    return prepared;
}

[[nodiscard]] auto abort_error(const transfer_job& job, const row_error& err)
    -> error_info {
    auto code = err.stage == row_error_stage::transform
                    ? error_codes::row_transform_failed
                    : error_codes::row_write_failed;
    return error_info{code,
                      compat::format("Phase {} aborted on row '{}' ({}): {}",
                                     job.phase_id, err.row_key,
                                     to_string(err.stage), err.message),
                      "executor"};
}

[[nodiscard]] auto batch_error(const transfer_job& job, std::size_t batch_number,
                               const std::string& message) -> error_info {
    return error_info{error_codes::batch_write_failed,
                      compat::format("Batch {} to '{}' failed: {}", batch_number,
                                     job.target_table, message),
                      "executor"};
}

void report_batch(const transfer_job& job, const run_context& context,
                  const transfer_result& result) {
    logger_adapter::trace("Phase {}: batch {} flushed to '{}' ({} rows copied)",
                          job.phase_id, result.batches_flushed, job.target_table,
                          result.copied);

    if (context.observer) {
        context.observer->on_batch_flushed(
            context, batch_progress{job.phase_id, job.target_table,
                                    result.batches_flushed, result.copied,
                                    result.skipped});
    }
}

/// A batch handed to the pool and not yet collected
struct in_flight_batch {
    std::size_t number{0};
    std::size_t rows{0};
    std::shared_ptr<std::optional<error_info>> outcome;
    std::future<void> done;
};

}  // namespace

batch_transfer_executor::batch_transfer_executor(
    std::shared_ptr<integration::thread_pool_interface> pool,
    std::size_t max_parallel_batches)
    : pool_(std::move(pool)),
      max_parallel_batches_(max_parallel_batches == 0 ? 1 : max_parallel_batches) {}

auto batch_transfer_executor::check_job(const transfer_job& job,
                                        const run_context& context) const
    -> VoidResult {
    if (!context.store) {
        return migrate_void_error(error_codes::plan_invalid,
                                  "Run context has no record store", "executor");
    }
    if (!job.plan) {
        return migrate_void_error(
            error_codes::plan_invalid,
            compat::format("Transfer job of phase {} has no mapping plan", job.phase_id),
            "executor");
    }
    if (job.batch_size == 0) {
        return migrate_void_error(
            error_codes::plan_invalid,
            compat::format("Transfer job of phase {} has batch size 0", job.phase_id),
            "executor");
    }
    return ok();
}

auto batch_transfer_executor::execute(const transfer_job& job,
                                      const run_context& context) const
    -> transfer_result {
    transfer_result result;

    auto valid = check_job(job, context);
    if (valid.is_err()) {
        result.failure = valid.error();
        return result;
    }

    auto cursor_result = context.store->find(job.source_table, job.filter);
    if (cursor_result.is_err()) {
        result.failure = cursor_result.error();
        return result;
    }
    auto cursor = std::move(cursor_result.value());

    const bool parallel = is_parallel();
    std::deque<in_flight_batch> in_flight;
    std::size_t batches_started = 0;

    // Waits for the oldest parallel flush and folds its outcome into result
    auto collect_oldest = [&]() {
        auto batch = std::move(in_flight.front());
        in_flight.pop_front();

        try {
            batch.done.get();
        } catch (const std::exception& e) {
            *batch.outcome = batch_error(job, batch.number, e.what());
        }

        if (batch.outcome->has_value()) {
            if (!result.failure) {
                result.failure = **batch.outcome;
            }
            return;
        }

        result.copied += batch.rows;
        ++result.batches_flushed;
        report_batch(job, context, result);
    };

    auto flush = [&](std::vector<core::row>&& rows) {
        auto number = ++batches_started;

        if (!parallel) {
            auto written = context.store->upsert(job.target_table, rows);
            if (written.is_err()) {
                result.failure = batch_error(job, number, written.error().message);
                return;
            }
            result.copied += rows.size();
            ++result.batches_flushed;
            report_batch(job, context, result);
            return;
        }

        while (in_flight.size() >= max_parallel_batches_) {
            collect_oldest();
        }
        if (result.failure) {
            return;
        }

        auto payload = std::make_shared<std::vector<core::row>>(std::move(rows));
        auto outcome = std::make_shared<std::optional<error_info>>();
        auto store = context.store;
        auto table = job.target_table;

        in_flight_batch batch;
        batch.number = number;
        batch.rows = payload->size();
        batch.outcome = outcome;

        try {
            batch.done = pool_->submit([store, table, payload, outcome, number, &job]() {
                auto written = store->upsert(table, *payload);
                if (written.is_err()) {
                    *outcome = batch_error(job, number, written.error().message);
                }
            });
        } catch (const std::exception& e) {
            result.failure = batch_error(job, number, e.what());
            return;
        }
        in_flight.push_back(std::move(batch));
    };

    std::vector<core::row> batch;
    batch.reserve(job.batch_size);
    bool exhausted = false;

    while (!exhausted && !result.failure) {
        if (context.cancellation.is_cancelled()) {
            result.cancelled = true;
            break;
        }

        batch.clear();
        while (batch.size() < job.batch_size) {
            auto source = cursor->next();
            if (!source) {
                exhausted = true;
                break;
            }

            auto prepared = prepare_row(job, *source);
            if (prepared.error) {
                ++result.skipped;
                result.errors.push_back(*prepared.error);
                logger_adapter::debug("Phase {}: row '{}' skipped at {}: {}",
                                      job.phase_id, prepared.error->row_key,
                                      to_string(prepared.error->stage),
                                      prepared.error->message);

                if (job.policy == row_error_policy::abort_phase) {
                    result.failure = abort_error(job, *prepared.error);
                    break;
                }
                continue;
            }

            batch.push_back(std::move(*prepared.target));
        }

        if (result.failure) {
            break;
        }

        if (exhausted) {
            if (auto read_failure = cursor->failure()) {
                result.failure = *read_failure;
                break;
            }
        }

        if (!batch.empty()) {
            flush(std::move(batch));
            batch = std::vector<core::row>{};
            batch.reserve(job.batch_size);
        }
    }

    while (!in_flight.empty()) {
        collect_oldest();
    }

    if (result.failure) {
        logger_adapter::error("Phase {}: transfer {} -> {} stopped after {} batches: {}",
                              job.phase_id, job.source_table, job.target_table,
                              result.batches_flushed, result.failure->message);
    } else if (result.cancelled) {
        logger_adapter::warn("Phase {}: transfer cancelled after {} batches",
                             job.phase_id, result.batches_flushed);
    } else {
        logger_adapter::info("Phase {}: {} rows copied, {} skipped in {} batches",
                             job.phase_id, result.copied, result.skipped,
                             result.batches_flushed);
    }

    return result;
}

auto batch_transfer_executor::plan_target_keys(const transfer_job& job,
                                               const run_context& context) const
    -> Result<std::vector<core::row_key>> {
    using result_type = Result<std::vector<core::row_key>>;

    auto valid = check_job(job, context);
    if (valid.is_err()) {
        return result_type(valid.error());
    }

    auto cursor_result = context.store->find(job.source_table, job.filter);
    if (cursor_result.is_err()) {
        return result_type(cursor_result.error());
    }
    auto cursor = std::move(cursor_result.value());

    std::vector<core::row_key> keys;
    std::set<core::row_key, std::less<>> seen;

    while (auto source = cursor->next()) {
        auto prepared = prepare_row(job, *source);
        if (prepared.target && seen.insert(prepared.target_key).second) {
            keys.push_back(std::move(prepared.target_key));
        }
    }

    if (auto read_failure = cursor->failure()) {
        return result_type(*read_failure);
    }
    return keys;
}

}  // namespace migrate::engine
