/**
 * @file mapping_compiler.hpp
 * @brief Compiles field mapping rules into a validated mapping plan
 *
 * Mappings are checked against the source and target table shapes before
 * any row is read. All violations are collected, not just the first, so a
 * broken mapping is fixed in one round trip.
 */

#pragma once

#include <migrate/core/row.hpp>
#include <migrate/engine/field_mapping.hpp>

#include <memory>
#include <string>
#include <vector>

namespace migrate::engine {

/**
 * @brief One problem found in a mapping definition
 */
struct mapping_violation {
    /// Source field, empty for constant rules and unmapped targets
    std::string source_field;
    std::string target_field;
    std::string reason;

    /**
     * @brief Render as "source -> target: reason"
     */
    [[nodiscard]] auto to_string() const -> std::string;
};

/**
 * @brief Validated, immutable mapping from a source shape to a target shape
 *
 * Only mapping_compiler creates plans.
 */
class mapping_plan {
public:
    /**
     * @brief Build the target row for one source row
     *
     * @return The target row, or row_transform_failed when a value cannot
     *         be converted, a transform fails, or a NULL would land in a
     *         non-nullable field
     */
    [[nodiscard]] auto apply(const core::row& source) const -> Result<core::row>;

    [[nodiscard]] auto source_shape() const noexcept -> const core::table_shape& {
        return source_shape_;
    }

    [[nodiscard]] auto target_shape() const noexcept -> const core::table_shape& {
        return target_shape_;
    }

    [[nodiscard]] auto rules() const -> std::vector<field_mapping>;

private:
    friend class mapping_compiler;

    struct compiled_rule {
        field_mapping mapping;
        core::field_definition target;

        /// Constant already converted to the target type
        core::field_value constant;

        /// Set for transform rules
        std::optional<transform_descriptor> transform;
    };

    mapping_plan(core::table_shape source, core::table_shape target,
                 std::vector<compiled_rule> rules)
        : source_shape_(std::move(source)),
          target_shape_(std::move(target)),
          rules_(std::move(rules)) {}

    core::table_shape source_shape_;
    core::table_shape target_shape_;
    std::vector<compiled_rule> rules_;
};

/**
 * @brief Validates mapping rules and produces mapping plans
 *
 * @example
 * @code
 * auto registry = std::make_shared<transform_registry>();
 * mapping_compiler compiler(registry);
 *
 * auto plan = compiler.compile(customer_v1, customer_v2, {
 *     field_mapping::direct("id", "id"),
 *     field_mapping::direct("name", "display_name"),
 *     field_mapping::constant("tier", core::field_value{std::string{"standard"}}),
 * });
 * if (plan.is_err()) {
 *     // plan.error().message lists every violation
 * }
 * @endcode
 */
class mapping_compiler {
public:
    explicit mapping_compiler(std::shared_ptr<const transform_registry> registry = nullptr);

    /**
     * @brief Check rules against the shapes
     * @return Every violation found; empty when the mapping is valid
     */
    [[nodiscard]] auto validate(const core::table_shape& source,
                                const core::table_shape& target,
                                const std::vector<field_mapping>& rules) const
        -> std::vector<mapping_violation>;

    /**
     * @brief Validate and build a plan
     * @return The plan, or mapping_compile_error listing every violation
     */
    [[nodiscard]] auto compile(const core::table_shape& source,
                               const core::table_shape& target,
                               const std::vector<field_mapping>& rules) const
        -> Result<mapping_plan>;

private:
    std::shared_ptr<const transform_registry> registry_;
};

}  // namespace migrate::engine
