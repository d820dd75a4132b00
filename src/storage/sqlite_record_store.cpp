/**
 * @file sqlite_record_store.cpp
 * @brief Implementation of the SQLite-backed record store
 */

#include <migrate/storage/sqlite_record_store.hpp>

#include <sqlite3.h>

#include <migrate/compat/format.hpp>

#include <sstream>
#include <stdexcept>

namespace migrate::storage {

namespace {

constexpr const char* kRowKeyColumn = "_row_key";

[[nodiscard]] auto quote_identifier(std::string_view name) -> std::string {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

[[nodiscard]] auto column_type(core::field_type type) -> const char* {
    switch (type) {
        case core::field_type::integer:
        case core::field_type::boolean:
            return "INTEGER";
        case core::field_type::real:
            return "REAL";
        case core::field_type::text:
        case core::field_type::null:
            break;
    }
    return "TEXT";
}

[[nodiscard]] auto column_list(const core::table_shape& shape) -> std::string {
    std::ostringstream cols;
    for (std::size_t i = 0; i < shape.fields.size(); ++i) {
        if (i > 0) {
            cols << ", ";
        }
        cols << quote_identifier(shape.fields[i].name);
    }
    return cols.str();
}

void bind_value(sqlite3_stmt* stmt, int index, const core::field_value& value) {
    switch (core::type_of(value)) {
        case core::field_type::integer:
            sqlite3_bind_int64(stmt, index, std::get<std::int64_t>(value));
            break;
        case core::field_type::real:
            sqlite3_bind_double(stmt, index, std::get<double>(value));
            break;
        case core::field_type::boolean:
            sqlite3_bind_int(stmt, index, std::get<bool>(value) ? 1 : 0);
            break;
        case core::field_type::text: {
            const auto& text = std::get<std::string>(value);
            sqlite3_bind_text(stmt, index, text.c_str(),
                              static_cast<int>(text.size()), SQLITE_TRANSIENT);
            break;
        }
        case core::field_type::null:
            sqlite3_bind_null(stmt, index);
            break;
    }
}

[[nodiscard]] auto read_value(sqlite3_stmt* stmt, int column,
                              core::field_type type) -> core::field_value {
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return core::field_value{};
    }

    switch (type) {
        case core::field_type::integer:
            return core::field_value{
                static_cast<std::int64_t>(sqlite3_column_int64(stmt, column))};
        case core::field_type::real:
            return core::field_value{sqlite3_column_double(stmt, column)};
        case core::field_type::boolean:
            return core::field_value{sqlite3_column_int(stmt, column) != 0};
        case core::field_type::text:
        case core::field_type::null:
            break;
    }

    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return core::field_value{std::string(text ? text : "")};
}

/// Reads the declared fields starting at @p first_column; NULL columns are left absent
[[nodiscard]] auto read_row(sqlite3_stmt* stmt, const core::table_shape& shape,
                            int first_column) -> core::row {
    core::row r;
    for (std::size_t i = 0; i < shape.fields.size(); ++i) {
        const auto& field = shape.fields[i];
        auto value = read_value(stmt, first_column + static_cast<int>(i), field.type);
        if (!core::is_null(value)) {
            r.set(field.name, std::move(value));
        }
    }
    return r;
}

/**
 * @brief Keyset-paginated cursor over a SQLite table
 */
class sqlite_row_cursor final : public row_cursor {
public:
    sqlite_row_cursor(const sqlite_record_store& store, core::table_shape shape,
                      core::row_filter filter, std::size_t page_size)
        : store_(store),
          shape_(std::move(shape)),
          filter_(std::move(filter)),
          page_size_(page_size) {}

    [[nodiscard]] auto next() -> std::optional<core::row> override {
        while (true) {
            if (position_ >= page_.size()) {
                if (exhausted_ || !load_page()) {
                    return std::nullopt;
                }
                continue;
            }

            auto& entry = page_[position_++];
            if (core::matches(filter_, entry.second)) {
                return std::move(entry.second);
            }
        }
    }

    [[nodiscard]] auto failure() const -> std::optional<error_info> override {
        return failure_;
    }

private:
    auto load_page() -> bool {
        auto result = store_.fetch_page(shape_, last_key_, page_size_);
        if (result.is_err()) {
            failure_ = result.error();
            exhausted_ = true;
            return false;
        }

        page_ = std::move(result.value());
        position_ = 0;
        if (page_.size() < page_size_) {
            exhausted_ = true;
        }
        if (page_.empty()) {
            return false;
        }
        last_key_ = page_.back().first;
        return true;
    }

    const sqlite_record_store& store_;
    core::table_shape shape_;
    core::row_filter filter_;
    std::size_t page_size_;

    std::vector<std::pair<core::row_key, core::row>> page_;
    std::size_t position_{0};
    std::optional<core::row_key> last_key_;
    bool exhausted_{false};
    std::optional<error_info> failure_;
};

}  // namespace

// ============================================================================
// Construction
// ============================================================================

sqlite_record_store::sqlite_record_store(std::shared_ptr<sqlite_database> db,
                                         std::size_t page_size)
    : db_(std::move(db)), page_size_(page_size == 0 ? default_page_size : page_size) {
    if (!db_) {
        throw std::invalid_argument("sqlite_record_store requires a database");
    }
}

// ============================================================================
// Schema
// ============================================================================

auto sqlite_record_store::create_table(const core::table_shape& shape)
    -> VoidResult {
    auto valid = shape.validate();
    if (valid.is_err()) {
        return valid;
    }
    if (shape.has_field(kRowKeyColumn)) {
        return migrate_void_error(
            error_codes::plan_invalid,
            compat::format("Field name '{}' is reserved", kRowKeyColumn),
            "sqlite_record_store");
    }

    std::lock_guard db_lock(db_->mutex());

    auto existing = load_shape(shape.name);
    if (existing.is_ok()) {
        if (existing.value() == shape) {
            return ok();
        }
        return migrate_void_error(
            error_codes::store_error,
            compat::format("Table '{}' already exists with a different shape",
                           shape.name),
            "sqlite_record_store");
    }

    std::ostringstream ddl;
    ddl << "CREATE TABLE " << quote_identifier(shape.name) << " ("
        << kRowKeyColumn << " TEXT PRIMARY KEY";
    for (const auto& field : shape.fields) {
        ddl << ", " << quote_identifier(field.name) << ' ' << column_type(field.type);
        if (!field.nullable) {
            ddl << " NOT NULL";
        }
    }
    ddl << ");";

    auto begin = db_->begin_transaction();
    if (begin.is_err()) {
        return begin;
    }

    auto fail = [this](const error_info& err) -> VoidResult {
        (void)db_->rollback();
        return VoidResult(err);
    };

    auto created = db_->execute(ddl.str());
    if (created.is_err()) {
        return fail(created.error());
    }

    auto* db = db_->handle();
    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(
        db, "INSERT INTO store_tables (table_name, key_field) VALUES (?, ?);",
        -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return fail(error_info{error_codes::store_error, db_->last_error(),
                               "sqlite_record_store"});
    }
    sqlite3_bind_text(stmt, 1, shape.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, shape.key_field.c_str(), -1, SQLITE_TRANSIENT);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return fail(error_info{error_codes::store_error, db_->last_error(),
                               "sqlite_record_store"});
    }

    rc = sqlite3_prepare_v2(db,
                            "INSERT INTO store_columns (table_name, position, "
                            "field_name, field_type, nullable) "
                            "VALUES (?, ?, ?, ?, ?);",
                            -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return fail(error_info{error_codes::store_error, db_->last_error(),
                               "sqlite_record_store"});
    }
    for (std::size_t i = 0; i < shape.fields.size(); ++i) {
        const auto& field = shape.fields[i];
        auto type_name = std::string(core::to_string(field.type));
        sqlite3_bind_text(stmt, 1, shape.name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 2, static_cast<int>(i));
        sqlite3_bind_text(stmt, 3, field.name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, type_name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 5, field.nullable ? 1 : 0);
        rc = sqlite3_step(stmt);
        sqlite3_reset(stmt);
        if (rc != SQLITE_DONE) {
            sqlite3_finalize(stmt);
            return fail(error_info{error_codes::store_error, db_->last_error(),
                                   "sqlite_record_store"});
        }
    }
    sqlite3_finalize(stmt);

    auto committed = db_->commit();
    if (committed.is_err()) {
        return fail(committed.error());
    }

    std::lock_guard lock(shape_mutex_);
    shape_cache_.insert_or_assign(shape.name, shape);
    return ok();
}

auto sqlite_record_store::describe(std::string_view table) const
    -> Result<core::table_shape> {
    {
        std::lock_guard lock(shape_mutex_);
        auto it = shape_cache_.find(table);
        if (it != shape_cache_.end()) {
            return it->second;
        }
    }

    std::lock_guard db_lock(db_->mutex());
    auto loaded = load_shape(table);
    if (loaded.is_ok()) {
        std::lock_guard lock(shape_mutex_);
        shape_cache_.insert_or_assign(std::string(table), loaded.value());
    }
    return loaded;
}

auto sqlite_record_store::load_shape(std::string_view table) const
    -> Result<core::table_shape> {
    auto* db = db_->handle();
    auto missing = [&]() {
        return migrate_error<core::table_shape>(
            error_codes::table_not_found,
            compat::format("Table '{}' does not exist", table),
            "sqlite_record_store");
    };

    core::table_shape shape;
    shape.name = std::string(table);

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(
        db, "SELECT key_field FROM store_tables WHERE table_name = ?;", -1,
        &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return migrate_error<core::table_shape>(
            error_codes::store_error, db_->last_error(), "sqlite_record_store");
    }
    sqlite3_bind_text(stmt, 1, shape.name.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return missing();
    }
    const auto* key = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    shape.key_field = key ? key : "";
    sqlite3_finalize(stmt);

    rc = sqlite3_prepare_v2(db,
                            "SELECT field_name, field_type, nullable "
                            "FROM store_columns WHERE table_name = ? "
                            "ORDER BY position;",
                            -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return migrate_error<core::table_shape>(
            error_codes::store_error, db_->last_error(), "sqlite_record_store");
    }
    sqlite3_bind_text(stmt, 1, shape.name.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        core::field_definition field;
        const auto* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        const auto* type = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        field.name = name ? name : "";
        field.type = core::field_type_from_string(type ? type : "")
                         .value_or(core::field_type::text);
        field.nullable = sqlite3_column_int(stmt, 2) != 0;
        shape.fields.push_back(std::move(field));
    }
    sqlite3_finalize(stmt);

    return shape;
}

// ============================================================================
// Record Operations
// ============================================================================

auto sqlite_record_store::get(std::string_view table,
                              const core::row_key& key) const
    -> Result<core::row> {
    auto shape_result = describe(table);
    if (shape_result.is_err()) {
        return Result<core::row>(shape_result.error());
    }
    const auto& shape = shape_result.value();

    auto sql = compat::format("SELECT {} FROM {} WHERE {} = ?;",
                              column_list(shape), quote_identifier(shape.name),
                              kRowKeyColumn);

    std::lock_guard db_lock(db_->mutex());
    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_->handle(), sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return migrate_error<core::row>(error_codes::store_error,
                                        db_->last_error(), "sqlite_record_store");
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        if (rc == SQLITE_DONE) {
            return migrate_error<core::row>(
                error_codes::record_not_found,
                compat::format("Row '{}' not found in table '{}'", key, table),
                "sqlite_record_store");
        }
        return migrate_error<core::row>(error_codes::store_error,
                                        db_->last_error(), "sqlite_record_store");
    }

    auto r = read_row(stmt, shape, 0);
    sqlite3_finalize(stmt);
    return r;
}

auto sqlite_record_store::contains(std::string_view table,
                                   const core::row_key& key) const -> bool {
    return get(table, key).is_ok();
}

auto sqlite_record_store::find(std::string_view table,
                               const core::row_filter& filter) const
    -> Result<std::unique_ptr<row_cursor>> {
    auto shape_result = describe(table);
    if (shape_result.is_err()) {
        return Result<std::unique_ptr<row_cursor>>(shape_result.error());
    }

    std::unique_ptr<row_cursor> cursor = std::make_unique<sqlite_row_cursor>(
        *this, shape_result.value(), filter, page_size_);
    return Result<std::unique_ptr<row_cursor>>(std::move(cursor));
}

auto sqlite_record_store::fetch_page(const core::table_shape& shape,
                                     const std::optional<core::row_key>& after_key,
                                     std::size_t limit) const
    -> Result<std::vector<std::pair<core::row_key, core::row>>> {
    using page_type = std::vector<std::pair<core::row_key, core::row>>;

    auto sql = compat::format(
        "SELECT {0}, {1} FROM {2} {3} ORDER BY {0} LIMIT ?;", kRowKeyColumn,
        column_list(shape), quote_identifier(shape.name),
        after_key ? compat::format("WHERE {} > ?", kRowKeyColumn) : std::string{});

    std::lock_guard db_lock(db_->mutex());
    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_->handle(), sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return migrate_error<page_type>(error_codes::store_error,
                                        db_->last_error(), "sqlite_record_store");
    }

    int index = 1;
    if (after_key) {
        sqlite3_bind_text(stmt, index++, after_key->c_str(), -1, SQLITE_TRANSIENT);
    }
    sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(limit));

    page_type page;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const auto* key = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        page.emplace_back(key ? key : "", read_row(stmt, shape, 1));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return migrate_error<page_type>(error_codes::store_error,
                                        db_->last_error(), "sqlite_record_store");
    }
    return page;
}

auto sqlite_record_store::upsert(std::string_view table,
                                 const std::vector<core::row>& rows)
    -> VoidResult {
    auto shape_result = describe(table);
    if (shape_result.is_err()) {
        return VoidResult(shape_result.error());
    }
    const auto& shape = shape_result.value();

    std::vector<core::row_key> keys;
    keys.reserve(rows.size());
    for (const auto& r : rows) {
        auto conforms = core::conforms_to(r, shape);
        if (conforms.is_err()) {
            return conforms;
        }
        auto key = r.key(shape);
        if (key.is_err()) {
            return VoidResult(key.error());
        }
        keys.push_back(key.value());
    }

    std::string placeholders = "?";
    for (std::size_t i = 0; i < shape.fields.size(); ++i) {
        placeholders += ", ?";
    }
    auto sql = compat::format("INSERT OR REPLACE INTO {} ({}, {}) VALUES ({});",
                              quote_identifier(shape.name), kRowKeyColumn,
                              column_list(shape), placeholders);

    std::lock_guard db_lock(db_->mutex());
    auto begin = db_->begin_transaction();
    if (begin.is_err()) {
        return begin;
    }

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_->handle(), sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        auto message = db_->last_error();
        (void)db_->rollback();
        return migrate_void_error(error_codes::store_error, message,
                                  "sqlite_record_store");
    }

    for (std::size_t i = 0; i < rows.size(); ++i) {
        sqlite3_bind_text(stmt, 1, keys[i].c_str(), -1, SQLITE_TRANSIENT);
        for (std::size_t f = 0; f < shape.fields.size(); ++f) {
            auto value = rows[i].get(shape.fields[f].name).value_or(core::field_value{});
            bind_value(stmt, static_cast<int>(f) + 2, value);
        }
        rc = sqlite3_step(stmt);
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        if (rc != SQLITE_DONE) {
            auto message = db_->last_error();
            sqlite3_finalize(stmt);
            (void)db_->rollback();
            return migrate_void_error(
                error_codes::store_error,
                compat::format("Failed to write row '{}': {}", keys[i], message),
                "sqlite_record_store");
        }
    }
    sqlite3_finalize(stmt);

    auto committed = db_->commit();
    if (committed.is_err()) {
        (void)db_->rollback();
        return committed;
    }
    return ok();
}

auto sqlite_record_store::remove(std::string_view table, const core::row_key& key)
    -> VoidResult {
    auto shape_result = describe(table);
    if (shape_result.is_err()) {
        return VoidResult(shape_result.error());
    }

    auto sql = compat::format("DELETE FROM {} WHERE {} = ?;",
                              quote_identifier(shape_result.value().name),
                              kRowKeyColumn);

    std::lock_guard db_lock(db_->mutex());
    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_->handle(), sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return migrate_void_error(error_codes::store_error, db_->last_error(),
                                  "sqlite_record_store");
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return migrate_void_error(error_codes::store_error, db_->last_error(),
                                  "sqlite_record_store");
    }
    return ok();
}

}  // namespace migrate::storage
