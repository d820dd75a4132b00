/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the migration engine
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for the migration engine, integrating with common_system's
 * Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace migrate {

/**
 * @brief Result type alias for engine operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief Migration engine error codes
 *
 * Error code range: -900 to -949
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int migrate_base = -900;

    // Definition errors (-900 to -909), always fatal before any row is touched
    constexpr int mapping_compile_error = migrate_base - 0;
    constexpr int plan_invalid = migrate_base - 1;

    // Phase execution errors (-910 to -919)
    constexpr int validation_failed = migrate_base - 10;
    constexpr int dependency_unmet = migrate_base - 11;
    constexpr int run_cancelled = migrate_base - 12;
    constexpr int row_transform_failed = migrate_base - 13;
    constexpr int row_write_failed = migrate_base - 14;
    constexpr int batch_write_failed = migrate_base - 15;

    // Rollback errors (-920 to -929)
    constexpr int snapshot_failed = migrate_base - 20;
    constexpr int restore_failed = migrate_base - 21;
    constexpr int snapshot_not_found = migrate_base - 22;

    // Ledger errors (-930 to -939)
    constexpr int already_committed = migrate_base - 30;
    constexpr int ledger_error = migrate_base - 31;
    constexpr int tag_not_found = migrate_base - 32;

    // Storage errors (-940 to -949)
    constexpr int store_error = migrate_base - 40;
    constexpr int record_not_found = migrate_base - 41;
    constexpr int table_not_found = migrate_base - 42;
    constexpr int codec_error = migrate_base - 43;
    constexpr int type_mismatch = migrate_base - 44;
} // namespace error_codes

using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create an engine error result with module context
 * @tparam T The result value type
 * @param code Error code from migrate::error_codes
 * @param message Error message
 * @param module Originating component (defaults to "migrate")
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> migrate_error(int code, const std::string& message,
                               const std::string& module = "migrate") {
    return Result<T>(error_info{code, message, module});
}

/**
 * @brief Create an engine void error result
 * @param code Error code from migrate::error_codes
 * @param message Error message
 * @param module Originating component (defaults to "migrate")
 * @return VoidResult containing the error
 */
inline VoidResult migrate_void_error(int code, const std::string& message,
                                     const std::string& module = "migrate") {
    return VoidResult(error_info{code, message, module});
}

} // namespace migrate

