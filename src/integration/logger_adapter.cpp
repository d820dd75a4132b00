/**
 * @file logger_adapter.cpp
 * @brief Implementation of the engine logging and audit adapter
 */

#include <migrate/integration/logger_adapter.hpp>

#include <migrate/compat/time.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>

namespace migrate::integration {

namespace {

[[nodiscard]] auto to_kcenon_level(log_level level) -> kcenon::logger::log_level {
    namespace kl = kcenon::logger;
    switch (level) {
        case log_level::trace:
            return kl::log_level::trace;
        case log_level::debug:
            return kl::log_level::debug;
        case log_level::info:
            return kl::log_level::info;
        case log_level::warn:
            return kl::log_level::warn;
        case log_level::error:
            return kl::log_level::error;
        case log_level::fatal:
            return kl::log_level::fatal;
        case log_level::off:
            break;
    }
    return kl::log_level::off;
}

/// Append @p text to @p out as the body of a JSON string
void append_json_escaped(std::string& out, std::string_view text) {
    static constexpr char hex[] = "0123456789abcdef";
    for (char c : text) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += hex[(c >> 4) & 0x0f];
                    out += hex[c & 0x0f];
                } else {
                    out += c;
                }
        }
    }
}

/// UTC time with millisecond precision, "2024-05-01T12:00:00.123Z"
[[nodiscard]] auto audit_timestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch())
                  .count() %
              1000;

    auto text = compat::to_timestamp_string(now);
    if (text.size() > 10) {
        text[10] = 'T';
    }
    return compat::format("{}.{:03}Z", text, ms);
}

/**
 * @brief One audit line: fixed header fields followed by event fields
 */
class audit_record {
public:
    audit_record(std::string_view event_type, std::string_view outcome) {
        line_ = "{";
        add("timestamp", audit_timestamp());
        add("event_type", event_type);
        add("outcome", outcome);
    }

    auto add(std::string_view key, std::string_view value) -> audit_record& {
        if (line_.size() > 1) {
            line_ += ',';
        }
        line_ += '"';
        append_json_escaped(line_, key);
        line_ += "\":\"";
        append_json_escaped(line_, value);
        line_ += '"';
        return *this;
    }

    [[nodiscard]] auto finish() -> std::string {
        line_ += "}\n";
        return std::move(line_);
    }

private:
    std::string line_;
};

}  // namespace

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    ~impl() { stop(); }

    void start(const logger_config& config) {
        std::lock_guard lock(mutex_);
        if (logger_) {
            return;
        }

        config_ = config;
        min_level_.store(config.min_level);

        if (config.enable_file || config.enable_audit_log) {
            std::error_code ec;
            std::filesystem::create_directories(config.log_directory, ec);
        }

        auto logger = std::make_unique<kcenon::logger::logger>(config.async_mode,
                                                               config.buffer_size);
        logger->set_min_level(to_kcenon_level(config.min_level));
        if (config.enable_console) {
            logger->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }
        if (config.enable_file) {
            logger->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                (config.log_directory / "migrate.log").string(),
                config.max_file_size_mb * 1024 * 1024, config.max_files));
        }
        logger->start();

        audit_path_.reset();
        if (config.enable_audit_log) {
            audit_path_ = config.log_directory / "audit.json";
        }

        logger_ = std::move(logger);
        running_.store(true);
    }

    void stop() {
        std::lock_guard lock(mutex_);
        running_.store(false);
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
        audit_path_.reset();
    }

    [[nodiscard]] auto running() const noexcept -> bool { return running_.load(); }

    [[nodiscard]] auto enabled(log_level level) const noexcept -> bool {
        return running_.load() && level != log_level::off &&
               static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void write(log_level level, const std::string& message) {
        if (!enabled(level)) {
            return;
        }
        std::lock_guard lock(mutex_);
        if (logger_) {
            logger_->log(to_kcenon_level(level), message);
        }
    }

    void flush() {
        std::lock_guard lock(mutex_);
        if (logger_) {
            logger_->flush();
        }
    }

    void set_level(log_level level) {
        std::lock_guard lock(mutex_);
        min_level_.store(level);
        if (logger_) {
            logger_->set_min_level(to_kcenon_level(level));
        }
    }

    [[nodiscard]] auto level() const noexcept -> log_level { return min_level_.load(); }

    [[nodiscard]] auto config() const -> const logger_config& { return config_; }

    void append_audit(const std::string& line) {
        std::lock_guard lock(mutex_);
        if (!audit_path_) {
            return;
        }
        std::ofstream file(*audit_path_, std::ios::app);
        if (file) {
            file << line;
        }
    }

private:
    mutable std::mutex mutex_;
    std::atomic<bool> running_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> logger_;
    std::optional<std::filesystem::path> audit_path_;
};

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Lifecycle and Standard Logging
// =============================================================================

void logger_adapter::initialize(const logger_config& config) { pimpl_->start(config); }

void logger_adapter::shutdown() { pimpl_->stop(); }

auto logger_adapter::is_initialized() noexcept -> bool { return pimpl_->running(); }

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->write(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

void logger_adapter::set_min_level(log_level level) { pimpl_->set_level(level); }

auto logger_adapter::get_min_level() noexcept -> log_level { return pimpl_->level(); }

auto logger_adapter::get_config() -> const logger_config& { return pimpl_->config(); }

// =============================================================================
// Migration Audit Logging
// =============================================================================

void logger_adapter::log_phase_transition(const std::string& run_id,
                                          const std::string& phase_id,
                                          const std::string& scope,
                                          std::string_view from,
                                          std::string_view to) {
    debug("Phase {} [{}]: {} -> {}", phase_id, scope, from, to);

    audit_record record("PHASE_TRANSITION", to == "failed" ? "failure" : "success");
    record.add("run_id", run_id)
        .add("phase_id", phase_id)
        .add("scope", scope)
        .add("from", from)
        .add("to", to);
    pimpl_->append_audit(record.finish());
}

void logger_adapter::log_tag_committed(const std::string& tag_id,
                                       const std::string& scope,
                                       bool already_committed) {
    if (already_committed) {
        warn("Tag {} [{}] was already committed by another run", tag_id, scope);
    } else {
        info("Tag {} [{}] committed", tag_id, scope);
    }

    audit_record record("TAG_COMMITTED", already_committed ? "already_committed" : "success");
    record.add("tag_id", tag_id).add("scope", scope);
    pimpl_->append_audit(record.finish());
}

void logger_adapter::log_rollback(const std::string& phase_id,
                                  const std::string& scope,
                                  const std::string& snapshot_id,
                                  std::size_t rows_restored,
                                  bool success,
                                  const std::string& message) {
    if (success) {
        warn("Phase {} [{}] rolled back: {} rows restored from snapshot {}", phase_id,
             scope, rows_restored, snapshot_id);
    } else {
        fatal("Rollback of phase {} [{}] from snapshot {} failed: {}", phase_id, scope,
              snapshot_id, message);
    }

    audit_record record("ROLLBACK", success ? "success" : "failure");
    record.add("phase_id", phase_id)
        .add("scope", scope)
        .add("snapshot_id", snapshot_id)
        .add("rows_restored", std::to_string(rows_restored));
    if (!message.empty()) {
        record.add("message", message);
    }
    pimpl_->append_audit(record.finish());
}

void logger_adapter::log_run_completed(const std::string& run_id,
                                       const std::string& scope,
                                       bool success,
                                       bool cancelled,
                                       std::size_t phase_count) {
    std::string_view outcome = cancelled ? "cancelled" : (success ? "success" : "failure");

    if (success) {
        info("Run {} [{}] completed: {} phases", run_id, scope, phase_count);
    } else {
        error("Run {} [{}] ended with outcome {}", run_id, scope, outcome);
    }

    audit_record record("RUN_COMPLETED", outcome);
    record.add("run_id", run_id)
        .add("scope", scope)
        .add("phase_count", std::to_string(phase_count));
    pimpl_->append_audit(record.finish());
}

}  // namespace migrate::integration
