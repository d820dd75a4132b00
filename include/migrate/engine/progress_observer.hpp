/**
 * @file progress_observer.hpp
 * @brief Observer interface for run, phase and batch progress
 *
 * The engine reports progress through this interface and never talks to a
 * telemetry sink directly. See integration::progress_reporter for the
 * logging implementation.
 */

#pragma once

#include <migrate/engine/migration_types.hpp>

#include <cstddef>
#include <string>

namespace migrate::engine {

struct run_context;
struct run_report;

/**
 * @brief Counters reported after every flushed batch
 */
struct batch_progress {
    std::string phase_id;
    std::string target_table;
    std::size_t batches_flushed{0};
    std::size_t rows_copied{0};
    std::size_t rows_skipped{0};
};

/**
 * @brief Receives engine progress events
 *
 * All callbacks default to no-ops. Calls arrive synchronously on the
 * thread driving the run, also in parallel flush mode. Batch counters are
 * cumulative for the phase.
 */
class progress_observer {
public:
    virtual ~progress_observer() = default;

    virtual void on_run_started(const run_context& /*context*/) {}

    virtual void on_phase_state(const run_context& /*context*/,
                                const std::string& /*phase_id*/,
                                phase_status /*from*/,
                                phase_status /*to*/) {}

    virtual void on_batch_flushed(const run_context& /*context*/,
                                  const batch_progress& /*progress*/) {}

    virtual void on_run_finished(const run_context& /*context*/,
                                 const run_report& /*report*/) {}
};

}  // namespace migrate::engine
