/**
 * @file progress_reporter.cpp
 * @brief Implementation of the logging progress observer
 */

#include <migrate/integration/progress_reporter.hpp>

#include <migrate/engine/phase_orchestrator.hpp>
#include <migrate/integration/logger_adapter.hpp>

namespace migrate::integration {

progress_reporter::progress_reporter(progress_reporter_config config)
    : config_(config) {}

void progress_reporter::on_run_started(const engine::run_context& context) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = progress_snapshot{};
        current_.run_id = context.run_id;
        current_.running = true;
        phase_progress_.clear();
        started_ = std::chrono::steady_clock::now();
    }
    logger_adapter::info("[{}] run started for {}", context.run_id,
                         context.scope.to_string());
}

void progress_reporter::on_phase_state(const engine::run_context& context,
                                       const std::string& phase_id,
                                       engine::phase_status from,
                                       engine::phase_status to) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (to) {
            case engine::phase_status::committed:
                ++current_.phases_committed;
                break;
            case engine::phase_status::skipped:
                ++current_.phases_skipped;
                break;
            case engine::phase_status::failed:
                ++current_.phases_failed;
                break;
            default:
                break;
        }
    }

    if (engine::is_terminal(to)) {
        logger_adapter::info("[{}] phase {} {}", context.run_id, phase_id,
                             engine::to_string(to));
    } else if (config_.log_transitions) {
        logger_adapter::debug("[{}] phase {}: {} -> {}", context.run_id, phase_id,
                              engine::to_string(from), engine::to_string(to));
    }
}

void progress_reporter::on_batch_flushed(const engine::run_context& context,
                                         const engine::batch_progress& progress) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& last = phase_progress_[progress.phase_id];

        // Totals are cumulative per phase
        current_.batches_flushed += progress.batches_flushed - last.batches_flushed;
        current_.rows_copied += progress.rows_copied - last.rows_copied;
        current_.rows_skipped += progress.rows_skipped - last.rows_skipped;
        last = progress;
    }

    if (config_.batch_log_interval > 0 &&
        progress.batches_flushed % config_.batch_log_interval == 0) {
        logger_adapter::info("[{}] phase {}: {} batches, {} rows into '{}' ({} skipped)",
                             context.run_id, progress.phase_id, progress.batches_flushed,
                             progress.rows_copied, progress.target_table,
                             progress.rows_skipped);
    }
}

void progress_reporter::on_run_finished(const engine::run_context& context,
                                        const engine::run_report& report) {
    progress_snapshot totals;
    std::chrono::steady_clock::duration elapsed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_.running = false;
        totals = current_;
        elapsed = std::chrono::steady_clock::now() - started_;
    }

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    if (report.overall_success) {
        logger_adapter::info(
            "[{}] run succeeded in {} ms: {} committed, {} skipped, {} rows",
            context.run_id, ms, totals.phases_committed, totals.phases_skipped,
            totals.rows_copied);
    } else {
        logger_adapter::warn(
            "[{}] run {} after {} ms: {} committed, {} failed, {} errors",
            context.run_id, report.cancelled ? "cancelled" : "failed", ms,
            totals.phases_committed, totals.phases_failed, report.errors.size());
    }
}

auto progress_reporter::snapshot() const -> progress_snapshot {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

}  // namespace migrate::integration
