/**
 * @file memory_record_store.cpp
 * @brief Implementation of the in-memory record store
 */

#include <migrate/storage/memory_record_store.hpp>

#include <migrate/compat/format.hpp>

#include <mutex>

namespace migrate::storage {

namespace {

[[nodiscard]] auto missing_table(std::string_view table) -> error_info {
    return error_info{error_codes::table_not_found,
                      compat::format("Table '{}' does not exist", table),
                      "memory_record_store"};
}

}  // namespace

auto memory_record_store::create_table(const core::table_shape& shape)
    -> VoidResult {
    auto valid = shape.validate();
    if (valid.is_err()) {
        return valid;
    }

    std::unique_lock lock(mutex_);
    auto it = tables_.find(shape.name);
    if (it != tables_.end()) {
        if (it->second.shape == shape) {
            return ok();
        }
        return migrate_void_error(
            error_codes::store_error,
            compat::format("Table '{}' already exists with a different shape",
                           shape.name),
            "memory_record_store");
    }

    tables_.emplace(shape.name, table_data{shape, {}});
    return ok();
}

void memory_record_store::drop_table(std::string_view table) {
    std::unique_lock lock(mutex_);
    auto it = tables_.find(table);
    if (it != tables_.end()) {
        tables_.erase(it);
    }
}

auto memory_record_store::describe(std::string_view table) const
    -> Result<core::table_shape> {
    std::shared_lock lock(mutex_);
    auto it = tables_.find(table);
    if (it == tables_.end()) {
        return Result<core::table_shape>(missing_table(table));
    }
    return it->second.shape;
}

auto memory_record_store::get(std::string_view table,
                              const core::row_key& key) const
    -> Result<core::row> {
    std::shared_lock lock(mutex_);
    auto it = tables_.find(table);
    if (it == tables_.end()) {
        return Result<core::row>(missing_table(table));
    }

    auto row_it = it->second.rows.find(key);
    if (row_it == it->second.rows.end()) {
        return migrate_error<core::row>(
            error_codes::record_not_found,
            compat::format("Row '{}' not found in table '{}'", key, table),
            "memory_record_store");
    }
    return row_it->second;
}

auto memory_record_store::contains(std::string_view table,
                                   const core::row_key& key) const -> bool {
    std::shared_lock lock(mutex_);
    auto it = tables_.find(table);
    return it != tables_.end() && it->second.rows.count(key) > 0;
}

auto memory_record_store::find(std::string_view table,
                               const core::row_filter& filter) const
    -> Result<std::unique_ptr<row_cursor>> {
    std::vector<core::row> matched;
    {
        std::shared_lock lock(mutex_);
        auto it = tables_.find(table);
        if (it == tables_.end()) {
            return Result<std::unique_ptr<row_cursor>>(missing_table(table));
        }

        for (const auto& [key, r] : it->second.rows) {
            if (core::matches(filter, r)) {
                matched.push_back(r);
            }
        }
    }

    std::unique_ptr<row_cursor> cursor =
        std::make_unique<vector_row_cursor>(std::move(matched));
    return Result<std::unique_ptr<row_cursor>>(std::move(cursor));
}

auto memory_record_store::upsert(std::string_view table,
                                 const std::vector<core::row>& rows)
    -> VoidResult {
    std::unique_lock lock(mutex_);
    auto it = tables_.find(table);
    if (it == tables_.end()) {
        return VoidResult(missing_table(table));
    }

    auto& data = it->second;

    // Validate the whole batch before touching any row
    std::vector<core::row_key> keys;
    keys.reserve(rows.size());
    for (const auto& r : rows) {
        auto conforms = core::conforms_to(r, data.shape);
        if (conforms.is_err()) {
            return conforms;
        }
        auto key = r.key(data.shape);
        if (key.is_err()) {
            return VoidResult(key.error());
        }
        keys.push_back(key.value());
    }

    for (std::size_t i = 0; i < rows.size(); ++i) {
        data.rows.insert_or_assign(keys[i], rows[i]);
    }
    return ok();
}

auto memory_record_store::remove(std::string_view table,
                                 const core::row_key& key) -> VoidResult {
    std::unique_lock lock(mutex_);
    auto it = tables_.find(table);
    if (it == tables_.end()) {
        return VoidResult(missing_table(table));
    }
    it->second.rows.erase(key);
    return ok();
}

auto memory_record_store::dump(std::string_view table) const
    -> Result<std::map<core::row_key, core::row>> {
    std::shared_lock lock(mutex_);
    auto it = tables_.find(table);
    if (it == tables_.end()) {
        return Result<std::map<core::row_key, core::row>>(missing_table(table));
    }
    return it->second.rows;
}

}  // namespace migrate::storage
