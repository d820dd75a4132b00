/**
 * @file mapping_compiler.cpp
 * @brief Implementation of mapping validation, compilation and application
 */

#include <migrate/engine/mapping_compiler.hpp>

#include <migrate/compat/format.hpp>

#include <exception>
#include <set>
#include <sstream>

namespace migrate::engine {

namespace {

[[nodiscard]] auto rule_failure(const std::string& target_field,
                             const std::string& reason) -> Result<core::row> {
    return migrate_error<core::row>(
        error_codes::row_transform_failed,
        compat::format("{}: {}", target_field, reason), "mapping");
}

[[nodiscard]] auto type_reason(std::string_view what, core::field_type from,
                               core::field_type to) -> std::string {
    return compat::format("{} type {} cannot be stored losslessly as {}", what,
                          core::to_string(from), core::to_string(to));
}

}  // namespace

// ============================================================================
// mapping_violation
// ============================================================================

auto mapping_violation::to_string() const -> std::string {
    return compat::format("{} -> {}: {}",
                          source_field.empty() ? "(none)" : source_field,
                          target_field.empty() ? "(none)" : target_field, reason);
}

// ============================================================================
// mapping_plan
// ============================================================================

auto mapping_plan::rules() const -> std::vector<field_mapping> {
    std::vector<field_mapping> result;
    result.reserve(rules_.size());
    for (const auto& rule : rules_) {
        result.push_back(rule.mapping);
    }
    return result;
}

auto mapping_plan::apply(const core::row& source) const -> Result<core::row> {
    core::row target;

    for (const auto& rule : rules_) {
        const auto& name = rule.target.name;
        core::field_value value;

        switch (rule.mapping.kind) {
            case mapping_kind::constant:
                value = rule.constant;
                break;

            case mapping_kind::direct: {
                auto source_value =
                    source.get(rule.mapping.source_field).value_or(core::field_value{});
                auto converted = core::convert_value(source_value, rule.target.type);
                if (converted.is_err()) {
                    return rule_failure(name, converted.error().message);
                }
                value = std::move(converted.value());
                break;
            }

            case mapping_kind::transform: {
                auto input =
                    source.get(rule.mapping.source_field).value_or(core::field_value{});
                if (core::is_null(input)) {
                    break;
                }

                auto converted_input = core::convert_value(input, rule.transform->input_type);
                if (converted_input.is_err()) {
                    return rule_failure(name, converted_input.error().message);
                }

                auto invoke = [&]() -> Result<core::field_value> {
                    try {
                        return rule.transform->fn(converted_input.value());
                    } catch (const std::exception& e) {
                        return migrate_error<core::field_value>(
                            error_codes::row_transform_failed,
                            compat::format("threw: {}", e.what()), "mapping");
                    }
                };

                auto output = invoke();
                if (output.is_err()) {
                    return rule_failure(name, compat::format("transform '{}' failed: {}",
                                                          rule.transform->name,
                                                          output.error().message));
                }

                auto converted = core::convert_value(output.value(), rule.target.type);
                if (converted.is_err()) {
                    return rule_failure(name, converted.error().message);
                }
                value = std::move(converted.value());
                break;
            }
        }

        if (core::is_null(value)) {
            if (!rule.target.nullable) {
                return rule_failure(name, "NULL value for non-nullable field");
            }
            continue;
        }
        target.set(name, std::move(value));
    }

    return target;
}

// ============================================================================
// mapping_compiler
// ============================================================================

mapping_compiler::mapping_compiler(std::shared_ptr<const transform_registry> registry)
    : registry_(std::move(registry)) {}

auto mapping_compiler::validate(const core::table_shape& source,
                                const core::table_shape& target,
                                const std::vector<field_mapping>& rules) const
    -> std::vector<mapping_violation> {
    std::vector<mapping_violation> violations;

    auto source_valid = source.validate();
    if (source_valid.is_err()) {
        violations.push_back({source.name, {}, source_valid.error().message});
    }
    auto target_valid = target.validate();
    if (target_valid.is_err()) {
        violations.push_back({{}, target.name, target_valid.error().message});
    }

    std::set<std::string, std::less<>> mapped_targets;

    for (const auto& rule : rules) {
        const auto* target_field = target.find_field(rule.target_field);
        if (target_field == nullptr) {
            violations.push_back({rule.source_field, rule.target_field,
                                  "target field does not exist"});
        } else if (!mapped_targets.insert(rule.target_field).second) {
            violations.push_back({rule.source_field, rule.target_field,
                                  "target field is mapped more than once"});
        }

        const core::field_definition* source_field = nullptr;
        if (rule.kind != mapping_kind::constant) {
            source_field = source.find_field(rule.source_field);
            if (source_field == nullptr) {
                violations.push_back({rule.source_field, rule.target_field,
                                      "source field does not exist"});
            }
        }

        switch (rule.kind) {
            case mapping_kind::direct:
                if (source_field != nullptr && target_field != nullptr &&
                    !core::is_lossless_conversion(source_field->type,
                                                  target_field->type)) {
                    violations.push_back(
                        {rule.source_field, rule.target_field,
                         type_reason("source", source_field->type, target_field->type)});
                }
                break;

            case mapping_kind::constant:
                if (target_field == nullptr) {
                    break;
                }
                if (core::is_null(rule.constant_value)) {
                    if (!target_field->nullable) {
                        violations.push_back(
                            {{}, rule.target_field,
                             "NULL constant for non-nullable target field"});
                    }
                } else if (!core::is_lossless_conversion(
                               core::type_of(rule.constant_value), target_field->type)) {
                    violations.push_back(
                        {{}, rule.target_field,
                         type_reason("constant", core::type_of(rule.constant_value),
                                     target_field->type)});
                }
                break;

            case mapping_kind::transform: {
                auto descriptor = registry_ ? registry_->find(rule.transform_name)
                                            : std::nullopt;
                if (!descriptor) {
                    violations.push_back(
                        {rule.source_field, rule.target_field,
                         compat::format("transform '{}' is not registered",
                                        rule.transform_name)});
                    break;
                }
                if (source_field != nullptr &&
                    !core::is_lossless_conversion(source_field->type,
                                                  descriptor->input_type)) {
                    violations.push_back(
                        {rule.source_field, rule.target_field,
                         compat::format("transform '{}' expects {} input, source is {}",
                                        descriptor->name,
                                        core::to_string(descriptor->input_type),
                                        core::to_string(source_field->type))});
                }
                if (target_field != nullptr &&
                    !core::is_lossless_conversion(descriptor->output_type,
                                                  target_field->type)) {
                    violations.push_back(
                        {rule.source_field, rule.target_field,
                         compat::format("transform '{}' produces {}, target is {}",
                                        descriptor->name,
                                        core::to_string(descriptor->output_type),
                                        core::to_string(target_field->type))});
                }
                break;
            }
        }
    }

    if (!target.key_field.empty() && target.has_field(target.key_field) &&
        mapped_targets.find(target.key_field) == mapped_targets.end()) {
        violations.push_back(
            {{}, target.key_field, "target key field is not mapped"});
    }

    for (const auto& field : target.fields) {
        if (!field.nullable && field.name != target.key_field &&
            mapped_targets.find(field.name) == mapped_targets.end()) {
            violations.push_back(
                {{}, field.name, "non-nullable target field is not mapped"});
        }
    }

    return violations;
}

auto mapping_compiler::compile(const core::table_shape& source,
                               const core::table_shape& target,
                               const std::vector<field_mapping>& rules) const
    -> Result<mapping_plan> {
    auto violations = validate(source, target, rules);
    if (!violations.empty()) {
        std::ostringstream message;
        message << "Mapping " << source.name << " -> " << target.name << " has "
                << violations.size() << " violation(s)";
        for (const auto& violation : violations) {
            message << "\n  " << violation.to_string();
        }
        return migrate_error<mapping_plan>(error_codes::mapping_compile_error,
                                           message.str(), "mapping");
    }

    std::vector<mapping_plan::compiled_rule> compiled;
    compiled.reserve(rules.size());

    for (const auto& rule : rules) {
        mapping_plan::compiled_rule entry;
        entry.mapping = rule;
        entry.target = *target.find_field(rule.target_field);

        if (rule.kind == mapping_kind::constant) {
            auto converted = core::convert_value(rule.constant_value, entry.target.type);
            if (converted.is_err()) {
                return migrate_error<mapping_plan>(
                    error_codes::mapping_compile_error,
                    mapping_violation{{}, rule.target_field, converted.error().message}
                        .to_string(),
                    "mapping");
            }
            entry.constant = std::move(converted.value());
        } else if (rule.kind == mapping_kind::transform) {
            entry.transform = registry_->find(rule.transform_name);
        }

        compiled.push_back(std::move(entry));
    }

    return mapping_plan(source, target, std::move(compiled));
}

}  // namespace migrate::engine
