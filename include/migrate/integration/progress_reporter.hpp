/**
 * @file progress_reporter.hpp
 * @brief Progress observer that reports runs through the logger
 *
 * progress_reporter turns orchestrator events into log lines and keeps
 * per-run counters that a caller can poll. Sinks beyond the log (metrics
 * exporters, dashboards) implement engine::progress_observer themselves.
 */

#pragma once

#include <migrate/engine/progress_observer.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>

namespace migrate::integration {

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct progress_reporter_config
 * @brief Configuration options for the progress reporter
 */
struct progress_reporter_config {
    /// Log batch progress every N flushed batches (0 = never)
    std::size_t batch_log_interval{10};

    /// Log every phase state change, not only terminal states
    bool log_transitions{false};
};

/**
 * @struct progress_snapshot
 * @brief Counters accumulated for the current run
 */
struct progress_snapshot {
    std::string run_id;
    std::size_t phases_committed{0};
    std::size_t phases_skipped{0};
    std::size_t phases_failed{0};
    std::size_t batches_flushed{0};
    std::size_t rows_copied{0};
    std::size_t rows_skipped{0};
    bool running{false};
};

// ─────────────────────────────────────────────────────
// Progress Reporter Class
// ─────────────────────────────────────────────────────

/**
 * @class progress_reporter
 * @brief Logs run, phase and batch progress
 *
 * Thread Safety: all methods are thread-safe.
 */
class progress_reporter final : public engine::progress_observer {
public:
    explicit progress_reporter(progress_reporter_config config = {});

    void on_run_started(const engine::run_context& context) override;

    void on_phase_state(const engine::run_context& context,
                        const std::string& phase_id,
                        engine::phase_status from,
                        engine::phase_status to) override;

    void on_batch_flushed(const engine::run_context& context,
                          const engine::batch_progress& progress) override;

    void on_run_finished(const engine::run_context& context,
                         const engine::run_report& report) override;

    /**
     * @brief Counters of the current (or last) run
     */
    [[nodiscard]] auto snapshot() const -> progress_snapshot;

private:
    progress_reporter_config config_;

    mutable std::mutex mutex_;
    progress_snapshot current_;

    /// Last flushed totals per phase, folded into current_ on phase end
    std::map<std::string, engine::batch_progress> phase_progress_;
    std::chrono::steady_clock::time_point started_;
};

}  // namespace migrate::integration
