/**
 * @file record_store.cpp
 * @brief Default implementations for record_store_interface
 */

#include <migrate/storage/record_store.hpp>

namespace migrate::storage {

auto record_store_interface::count(std::string_view table,
                                   const core::row_filter& filter) const
    -> Result<std::size_t> {
    auto cursor_result = find(table, filter);
    if (cursor_result.is_err()) {
        return Result<std::size_t>(cursor_result.error());
    }

    auto& cursor = cursor_result.value();
    std::size_t total = 0;
    while (cursor->next().has_value()) {
        ++total;
    }
    if (auto failure = cursor->failure()) {
        return Result<std::size_t>(*failure);
    }
    return total;
}

}  // namespace migrate::storage
