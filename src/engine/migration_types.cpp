/**
 * @file migration_types.cpp
 * @brief Implementation of migration scope and tag helpers
 */

#include <migrate/engine/migration_types.hpp>

namespace migrate::engine {

namespace {
constexpr std::string_view kGlobal = "global";
constexpr std::string_view kTenantPrefix = "tenant:";
}  // namespace

auto migration_scope::from_string(std::string_view text)
    -> std::optional<migration_scope> {
    if (text == kGlobal) {
        return global();
    }
    if (text.size() > kTenantPrefix.size() &&
        text.substr(0, kTenantPrefix.size()) == kTenantPrefix) {
        return per_tenant(std::string(text.substr(kTenantPrefix.size())));
    }
    return std::nullopt;
}

auto migration_scope::to_string() const -> std::string {
    if (!tenant_id_) {
        return std::string(kGlobal);
    }
    return std::string(kTenantPrefix) + *tenant_id_;
}

auto make_tag_id(std::string_view component, std::string_view feature,
                 std::string_view iso_date) -> std::string {
    std::string id;
    id.reserve(component.size() + feature.size() + iso_date.size() + 2);
    id.append(component).append("-").append(feature).append("-").append(iso_date);
    return id;
}

}  // namespace migrate::engine
