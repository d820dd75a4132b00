/**
 * @file validation_gate.cpp
 * @brief Implementation of the validation gate and stock rules
 */

#include <migrate/engine/validation_gate.hpp>

#include <migrate/compat/format.hpp>
#include <migrate/integration/logger_adapter.hpp>
#include <migrate/storage/record_store.hpp>

#include <exception>
#include <set>
#include <sstream>

namespace migrate::engine {

using integration::logger_adapter;

// ============================================================================
// validation_report
// ============================================================================

auto validation_report::blocked() const -> bool {
    for (const auto& failure : failures) {
        if (failure.severity == validation_severity::blocking) {
            return true;
        }
    }
    return false;
}

auto validation_report::blocking_failures() const -> std::vector<validation_failure> {
    std::vector<validation_failure> result;
    for (const auto& failure : failures) {
        if (failure.severity == validation_severity::blocking) {
            result.push_back(failure);
        }
    }
    return result;
}

auto validation_report::warnings() const -> std::vector<validation_failure> {
    std::vector<validation_failure> result;
    for (const auto& failure : failures) {
        if (failure.severity == validation_severity::warning) {
            result.push_back(failure);
        }
    }
    return result;
}

auto validation_report::summary() const -> std::string {
    std::ostringstream out;
    for (std::size_t i = 0; i < failures.size(); ++i) {
        if (i > 0) {
            out << '\n';
        }
        out << failures[i].rule_name << ": " << failures[i].message;
    }
    return out.str();
}

// ============================================================================
// validation_gate
// ============================================================================

auto validation_gate::add_rule(validation_rule rule) -> VoidResult {
    if (rule.phase_id.empty() || rule.name.empty()) {
        return migrate_void_error(error_codes::plan_invalid,
                                  "Validation rule needs a phase id and a name",
                                  "validation");
    }
    if (!rule.predicate) {
        return migrate_void_error(
            error_codes::plan_invalid,
            compat::format("Validation rule '{}' has no predicate", rule.name),
            "validation");
    }

    std::lock_guard lock(mutex_);
    rules_.push_back(std::move(rule));
    return ok();
}

auto validation_gate::rule_count(std::string_view phase_id) const -> std::size_t {
    std::lock_guard lock(mutex_);
    std::size_t count = 0;
    for (const auto& rule : rules_) {
        if (rule.phase_id == phase_id) {
            ++count;
        }
    }
    return count;
}

auto validation_gate::run_pre(const validation_input& input) const
    -> validation_report {
    return run_stage(validation_stage::pre, input);
}

auto validation_gate::run_post(const validation_input& input) const
    -> validation_report {
    return run_stage(validation_stage::post, input);
}

auto validation_gate::run_stage(validation_stage stage,
                                const validation_input& input) const
    -> validation_report {
    std::vector<validation_rule> selected;
    {
        std::lock_guard lock(mutex_);
        for (const auto& rule : rules_) {
            if (rule.phase_id == input.phase_id && rule.stage == stage) {
                selected.push_back(rule);
            }
        }
    }

    validation_report report;
    for (const auto& rule : selected) {
        ++report.rules_run;

        std::optional<std::string> message;
        try {
            auto outcome = rule.predicate(input);
            if (outcome.is_err()) {
                message = outcome.error().message;
            }
        } catch (const std::exception& e) {
            message = compat::format("rule threw: {}", e.what());
        }

        if (!message) {
            continue;
        }

        if (rule.severity == validation_severity::blocking) {
            logger_adapter::error("Phase {}: {} rule '{}' failed: {}", input.phase_id,
                                  to_string(stage), rule.name, *message);
        } else {
            logger_adapter::warn("Phase {}: {} rule '{}' warning: {}", input.phase_id,
                                 to_string(stage), rule.name, *message);
        }

        report.failures.push_back(
            {input.phase_id, rule.name, stage, rule.severity, std::move(*message)});
    }

    return report;
}

// ============================================================================
// Stock Rules
// ============================================================================

namespace rules {

namespace {

[[nodiscard]] auto rule_failed(const std::string& message) -> VoidResult {
    return migrate_void_error(error_codes::validation_failed, message, "validation");
}

}  // namespace

auto table_exists(std::string phase_id, std::string table, validation_stage stage,
                  validation_severity severity) -> validation_rule {
    auto name = compat::format("table_exists({})", table);
    return {std::move(phase_id), std::move(name), stage, severity,
            [table = std::move(table)](const validation_input& input) -> VoidResult {
                if (!input.context.store || !input.context.store->has_table(table)) {
                    return rule_failed(compat::format("table '{}' does not exist", table));
                }
                return ok();
            }};
}

auto max_row_count(std::string phase_id, std::string table, core::row_filter filter,
                   std::size_t max_rows, validation_severity severity)
    -> validation_rule {
    auto name = compat::format("max_row_count({}, {})", table, max_rows);
    return {std::move(phase_id), std::move(name), validation_stage::pre, severity,
            [table = std::move(table), filter = std::move(filter),
             max_rows](const validation_input& input) -> VoidResult {
                auto count = input.context.store->count(table, filter);
                if (count.is_err()) {
                    return VoidResult(count.error());
                }
                if (count.value() > max_rows) {
                    return rule_failed(compat::format(
                        "table '{}' has {} matching rows, limit is {}", table,
                        count.value(), max_rows));
                }
                return ok();
            }};
}

auto row_count_parity(std::string phase_id, core::row_filter target_filter,
                      validation_severity severity) -> validation_rule {
    return {std::move(phase_id), "row_count_parity", validation_stage::post, severity,
            [target_filter = std::move(target_filter)](
                const validation_input& input) -> VoidResult {
                if (input.job == nullptr || input.result == nullptr) {
                    return rule_failed("row count parity needs a transfer phase");
                }

                const auto& store = *input.context.store;
                auto source_count = store.count(input.job->source_table, input.job->filter);
                if (source_count.is_err()) {
                    return VoidResult(source_count.error());
                }
                auto target_count = store.count(input.job->target_table, target_filter);
                if (target_count.is_err()) {
                    return VoidResult(target_count.error());
                }

                auto skipped = input.result->skipped;
                auto expected = source_count.value() >= skipped
                                    ? source_count.value() - skipped
                                    : std::size_t{0};
                if (target_count.value() != expected) {
                    return rule_failed(compat::format(
                        "source '{}' has {} matching rows ({} skipped) but target '{}' "
                        "has {}",
                        input.job->source_table, source_count.value(), skipped,
                        input.job->target_table, target_count.value()));
                }
                return ok();
            }};
}

auto no_duplicate_keys(std::string phase_id, std::string table, std::string field,
                       validation_severity severity) -> validation_rule {
    auto name = compat::format("no_duplicate_keys({}.{})", table, field);
    return {std::move(phase_id), std::move(name), validation_stage::post, severity,
            [table = std::move(table),
             field = std::move(field)](const validation_input& input) -> VoidResult {
                auto cursor = input.context.store->find(table, {});
                if (cursor.is_err()) {
                    return VoidResult(cursor.error());
                }

                std::set<std::string, std::less<>> seen;
                std::size_t duplicates = 0;
                std::string first_duplicate;
                while (auto r = cursor.value()->next()) {
                    auto value = r->get(field);
                    if (!value || core::is_null(*value)) {
                        continue;
                    }
                    auto text = core::to_display_string(*value);
                    if (!seen.insert(text).second) {
                        if (duplicates == 0) {
                            first_duplicate = text;
                        }
                        ++duplicates;
                    }
                }
                if (auto read_failure = cursor.value()->failure()) {
                    return VoidResult(*read_failure);
                }

                if (duplicates > 0) {
                    return rule_failed(compat::format(
                        "{} duplicate value(s) of '{}' in '{}', first '{}'", duplicates,
                        field, table, first_duplicate));
                }
                return ok();
            }};
}

}  // namespace rules

}  // namespace migrate::engine
