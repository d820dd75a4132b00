/**
 * @file logger_adapter.hpp
 * @brief Engine logging and migration audit trail using logger_system
 *
 * This file provides the logger_adapter class for integrating logger_system
 * with the migration engine. It supports standard leveled logging and an
 * append-only JSON audit trail of phase transitions, ledger commits and
 * rollbacks.
 */

#pragma once

#include <migrate/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace migrate::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @brief Parse a log level name ("trace" .. "off")
 * @return Parsed level or std::nullopt if unknown
 */
[[nodiscard]] constexpr auto log_level_from_string(std::string_view str)
    -> std::optional<log_level> {
    if (str == "trace") return log_level::trace;
    if (str == "debug") return log_level::debug;
    if (str == "info") return log_level::info;
    if (str == "warn") return log_level::warn;
    if (str == "error") return log_level::error;
    if (str == "fatal") return log_level::fatal;
    if (str == "off") return log_level::off;
    return std::nullopt;
}

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Enable the migration audit trail (audit.json)
    bool enable_audit_log{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{100};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{10};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Static logging facade for the engine
 *
 * Messages logged before initialize() (or after shutdown()) are dropped,
 * which keeps unit tests quiet without any setup.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/migrate";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Run {} started for scope {}", run_id, scope);
 * logger_adapter::log_tag_committed("billing-split-2024-05-01", "global", false);
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Initialize the logger with configuration
     *
     * Sets up console and file writers and the audit trail path. A second
     * call without shutdown() in between is ignored.
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release the logger
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(migrate::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::trace)) {
            log(log_level::trace, migrate::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void debug(migrate::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::debug)) {
            log(log_level::debug, migrate::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void info(migrate::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, migrate::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(migrate::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, migrate::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(migrate::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, migrate::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(migrate::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, migrate::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     */
    static void log(log_level level, const std::string& message);

    /**
     * @brief Check if a log level is enabled
     *
     * Always false before initialize().
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Migration Audit Logging
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record a phase state transition
     *
     * @param run_id Identifier of the run
     * @param phase_id Phase identifier
     * @param scope Scope in textual form ("global" or "tenant:<id>")
     * @param from Previous state name
     * @param to New state name
     */
    static void log_phase_transition(const std::string& run_id,
                                     const std::string& phase_id,
                                     const std::string& scope,
                                     std::string_view from,
                                     std::string_view to);

    /**
     * @brief Record a ledger commit
     *
     * @param already_committed true when another committer won the race
     */
    static void log_tag_committed(const std::string& tag_id,
                                  const std::string& scope,
                                  bool already_committed);

    /**
     * @brief Record a snapshot restore attempt
     *
     * Failed restores are logged at fatal level.
     */
    static void log_rollback(const std::string& phase_id,
                             const std::string& scope,
                             const std::string& snapshot_id,
                             std::size_t rows_restored,
                             bool success,
                             const std::string& message = "");

    /**
     * @brief Record the outcome of a whole run
     */
    static void log_run_completed(const std::string& run_id,
                                  const std::string& scope,
                                  bool success,
                                  bool cancelled,
                                  std::size_t phase_count);

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

private:
    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace migrate::integration
