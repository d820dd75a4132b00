/**
 * @file field_mapping.hpp
 * @brief Declarative field mapping rules and the transform registry
 */

#pragma once

#include <migrate/core/field_value.hpp>

#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace migrate::engine {

/**
 * @brief How a target field gets its value
 */
enum class mapping_kind {
    direct,     ///< Copy the source field (lossless widening allowed)
    constant,   ///< Write a fixed value
    transform   ///< Run a registered transform over the source field
};

[[nodiscard]] constexpr auto to_string(mapping_kind kind) noexcept
    -> std::string_view {
    switch (kind) {
        case mapping_kind::direct:
            return "direct";
        case mapping_kind::constant:
            return "constant";
        case mapping_kind::transform:
            return "transform";
    }
    return "unknown";
}

/**
 * @brief One mapping rule
 *
 * Use the factory functions; constant rules have no source field.
 */
struct field_mapping {
    std::string source_field;
    std::string target_field;
    mapping_kind kind{mapping_kind::direct};

    /// Value written by constant rules
    core::field_value constant_value;

    /// Registered transform name for transform rules
    std::string transform_name;

    [[nodiscard]] static auto direct(std::string source, std::string target)
        -> field_mapping {
        return {std::move(source), std::move(target), mapping_kind::direct, {}, {}};
    }

    [[nodiscard]] static auto constant(std::string target, core::field_value value)
        -> field_mapping {
        return {{}, std::move(target), mapping_kind::constant, std::move(value), {}};
    }

    [[nodiscard]] static auto transform(std::string source, std::string target,
                                        std::string name) -> field_mapping {
        return {std::move(source), std::move(target), mapping_kind::transform, {},
                std::move(name)};
    }
};

/// Transform body; receives a non-NULL value of the declared input type
using transform_fn =
    std::function<Result<core::field_value>(const core::field_value&)>;

/**
 * @brief A named transform with its declared signature
 */
struct transform_descriptor {
    std::string name;
    core::field_type input_type{core::field_type::text};
    core::field_type output_type{core::field_type::text};
    transform_fn fn;
};

/**
 * @brief Registry of named transforms available to mapping rules
 *
 * Thread Safety: safe for concurrent registration and lookup.
 */
class transform_registry {
public:
    /**
     * @brief Register a transform
     * @return plan_invalid if the name is empty, taken, or fn is empty
     */
    [[nodiscard]] auto register_transform(transform_descriptor descriptor)
        -> VoidResult;

    /**
     * @brief Look up a transform by name
     * @return Copy of the descriptor, or std::nullopt
     */
    [[nodiscard]] auto find(std::string_view name) const
        -> std::optional<transform_descriptor>;

    [[nodiscard]] auto contains(std::string_view name) const -> bool;

    [[nodiscard]] auto names() const -> std::vector<std::string>;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, transform_descriptor, std::less<>> transforms_;
};

}  // namespace migrate::engine
