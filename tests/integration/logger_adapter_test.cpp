/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter
 */

#include <migrate/integration/logger_adapter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace migrate::integration;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

auto create_temp_log_directory() -> std::filesystem::path {
    auto temp_dir = std::filesystem::temp_directory_path() / "migrate_logger_test";
    std::filesystem::create_directories(temp_dir);
    return temp_dir;
}

void cleanup_temp_directory(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

auto read_file_contents(const std::filesystem::path& path) -> std::string {
    std::ifstream file(path);
    if (!file) {
        return "";
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

/**
 * @brief RAII wrapper for logger initialization/shutdown
 */
class logger_test_fixture {
public:
    explicit logger_test_fixture(const logger_config& config) : log_dir_(config.log_directory) {
        logger_adapter::initialize(config);
    }

    ~logger_test_fixture() {
        logger_adapter::shutdown();
        cleanup_temp_directory(log_dir_);
    }

    logger_test_fixture(const logger_test_fixture&) = delete;
    logger_test_fixture& operator=(const logger_test_fixture&) = delete;

private:
    std::filesystem::path log_dir_;
};

auto audit_config(const std::filesystem::path& dir) -> logger_config {
    logger_config config;
    config.log_directory = dir;
    config.enable_console = false;
    config.enable_file = false;
    config.enable_audit_log = true;
    return config;
}

}  // namespace

// =============================================================================
// Initialization Tests
// =============================================================================

TEST_CASE("logger_adapter initialization and shutdown", "[logger_adapter][init]") {
    auto temp_dir = create_temp_log_directory();

    SECTION("Basic initialization") {
        logger_config config;
        config.log_directory = temp_dir;
        config.enable_console = false;

        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("Multiple initialization calls are safe") {
        logger_config config;
        config.log_directory = temp_dir;
        config.enable_console = false;

        logger_adapter::initialize(config);
        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
    }

    SECTION("Logging before initialization is dropped") {
        REQUIRE_FALSE(logger_adapter::is_initialized());
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::fatal));

        logger_adapter::info("dropped {}", 1);
        logger_adapter::log_tag_committed("tag", "global", false);
        logger_adapter::flush();
    }

    cleanup_temp_directory(temp_dir);
}

TEST_CASE("logger_adapter log levels", "[logger_adapter][logging]") {
    CHECK(log_level_from_string("trace") == log_level::trace);
    CHECK(log_level_from_string("warn") == log_level::warn);
    CHECK(log_level_from_string("off") == log_level::off);
    CHECK_FALSE(log_level_from_string("verbose").has_value());

    auto temp_dir = create_temp_log_directory();
    logger_config config;
    config.log_directory = temp_dir;
    config.enable_console = false;
    config.enable_audit_log = false;
    config.min_level = log_level::trace;

    logger_test_fixture fixture(config);

    SECTION("Log at different levels") {
        logger_adapter::trace("Trace message: {}", 1);
        logger_adapter::debug("Debug message: {}", 2);
        logger_adapter::info("Info message: {}", 3);
        logger_adapter::warn("Warn message: {}", 4);
        logger_adapter::error("Error message: {}", 5);
        logger_adapter::flush();
    }

    SECTION("Log level filtering") {
        logger_adapter::set_min_level(log_level::warn);
        REQUIRE(logger_adapter::get_min_level() == log_level::warn);

        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::debug));
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::info));
        REQUIRE(logger_adapter::is_level_enabled(log_level::warn));
        REQUIRE(logger_adapter::is_level_enabled(log_level::fatal));
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::off));
    }
}

// =============================================================================
// Migration Audit Logging Tests
// =============================================================================

TEST_CASE("logger_adapter migration audit trail", "[logger_adapter][audit]") {
    auto temp_dir = create_temp_log_directory();
    logger_test_fixture fixture(audit_config(temp_dir));
    auto audit_path = temp_dir / "audit.json";

    SECTION("Phase transition") {
        logger_adapter::log_phase_transition("run-1", "copy-customers", "tenant:acme",
                                             "validating", "snapshotting");
        auto content = read_file_contents(audit_path);

        REQUIRE(content.find("PHASE_TRANSITION") != std::string::npos);
        REQUIRE(content.find("copy-customers") != std::string::npos);
        REQUIRE(content.find("tenant:acme") != std::string::npos);
        REQUIRE(content.find("\"to\":\"snapshotting\"") != std::string::npos);
    }

    SECTION("Tag commit") {
        logger_adapter::log_tag_committed("crm-customer_v2-2024-05-01", "global", false);
        logger_adapter::log_tag_committed("crm-customer_v2-2024-05-01", "global", true);
        auto content = read_file_contents(audit_path);

        REQUIRE(content.find("TAG_COMMITTED") != std::string::npos);
        REQUIRE(content.find("already_committed") != std::string::npos);
    }

    SECTION("Failed rollback") {
        logger_adapter::log_rollback("copy", "global", "run-1/copy/global", 3, false,
                                     "disk \"full\"");
        auto content = read_file_contents(audit_path);

        REQUIRE(content.find("ROLLBACK") != std::string::npos);
        REQUIRE(content.find("failure") != std::string::npos);
        REQUIRE(content.find("disk \\\"full\\\"") != std::string::npos);
    }

    SECTION("Run outcome") {
        logger_adapter::log_run_completed("run-2", "global", false, true, 4);
        auto content = read_file_contents(audit_path);

        REQUIRE(content.find("RUN_COMPLETED") != std::string::npos);
        REQUIRE(content.find("cancelled") != std::string::npos);
    }
}

TEST_CASE("logger_adapter configuration", "[logger_adapter][config]") {
    auto temp_dir = create_temp_log_directory();

    logger_config config;
    config.log_directory = temp_dir;
    config.min_level = log_level::debug;
    config.enable_console = false;
    config.max_file_size_mb = 50;
    config.max_files = 5;

    logger_test_fixture fixture(config);

    const auto& retrieved = logger_adapter::get_config();
    CHECK(retrieved.log_directory == temp_dir);
    CHECK(retrieved.min_level == log_level::debug);
    CHECK(retrieved.max_file_size_mb == 50);
    CHECK(retrieved.max_files == 5);
}

TEST_CASE("logger_adapter concurrent logging", "[logger_adapter][threading]") {
    auto temp_dir = create_temp_log_directory();
    logger_test_fixture fixture(audit_config(temp_dir));

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < 25; ++i) {
                logger_adapter::log_phase_transition("run", "phase-" + std::to_string(t),
                                                     "global", "pending", "validating");
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto content = read_file_contents(temp_dir / "audit.json");
    std::size_t lines = 0;
    for (char c : content) {
        if (c == '\n') {
            ++lines;
        }
    }
    CHECK(lines == 100);
}
