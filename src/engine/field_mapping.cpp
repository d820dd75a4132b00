/**
 * @file field_mapping.cpp
 * @brief Implementation of the transform registry
 */

#include <migrate/engine/field_mapping.hpp>

#include <migrate/compat/format.hpp>

#include <mutex>

namespace migrate::engine {

auto transform_registry::register_transform(transform_descriptor descriptor)
    -> VoidResult {
    if (descriptor.name.empty()) {
        return migrate_void_error(error_codes::plan_invalid,
                                  "Transform name must not be empty", "mapping");
    }
    if (!descriptor.fn) {
        return migrate_void_error(
            error_codes::plan_invalid,
            compat::format("Transform '{}' has no function", descriptor.name),
            "mapping");
    }

    std::unique_lock lock(mutex_);
    if (transforms_.find(descriptor.name) != transforms_.end()) {
        return migrate_void_error(
            error_codes::plan_invalid,
            compat::format("Transform '{}' is already registered", descriptor.name),
            "mapping");
    }

    auto name = descriptor.name;
    transforms_.emplace(std::move(name), std::move(descriptor));
    return ok();
}

auto transform_registry::find(std::string_view name) const
    -> std::optional<transform_descriptor> {
    std::shared_lock lock(mutex_);
    auto it = transforms_.find(name);
    if (it == transforms_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto transform_registry::contains(std::string_view name) const -> bool {
    std::shared_lock lock(mutex_);
    return transforms_.find(name) != transforms_.end();
}

auto transform_registry::names() const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(transforms_.size());
    for (const auto& [name, descriptor] : transforms_) {
        result.push_back(name);
    }
    return result;
}

}  // namespace migrate::engine
