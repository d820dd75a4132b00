/**
 * @file migration_ledger.hpp
 * @brief Durable, append-only record of committed migration tags
 *
 * The ledger is what makes a migration idempotent: a phase whose tag is
 * already committed for the scope is skipped without touching rows.
 */

#pragma once

#include <migrate/core/result.hpp>
#include <migrate/engine/migration_types.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace migrate::storage {
class sqlite_database;
}  // namespace migrate::storage

namespace migrate::engine {

/**
 * @brief Abstract migration ledger
 *
 * Thread Safety: implementations must be safe for concurrent use; of
 * several concurrent commit_tag() calls for the same (id, scope) exactly
 * one succeeds.
 */
class migration_ledger_interface {
public:
    virtual ~migration_ledger_interface() = default;

    /**
     * @brief Check whether a tag is committed for a scope
     * @return true/false, or ledger_error if the ledger cannot be read
     */
    [[nodiscard]] virtual auto has_tag(std::string_view tag_id,
                                       const migration_scope& scope) const
        -> Result<bool> = 0;

    /**
     * @brief Atomically record a tag
     *
     * @return ok() for the winning committer; already_committed when the
     *         tag is present, which callers treat as success
     */
    [[nodiscard]] virtual auto commit_tag(std::string_view tag_id,
                                          const migration_scope& scope)
        -> VoidResult = 0;

    /**
     * @brief Look up a committed tag
     * @return The tag or tag_not_found
     */
    [[nodiscard]] virtual auto find_tag(std::string_view tag_id,
                                        const migration_scope& scope) const
        -> Result<migration_tag> = 0;

    /**
     * @brief List every committed tag ordered by commit time
     */
    [[nodiscard]] virtual auto list_tags() const
        -> Result<std::vector<migration_tag>> = 0;
};

/**
 * @brief Ledger stored in the migration_tags table
 *
 * The (tag_id, scope) primary key is the check-and-set; an update trigger
 * keeps rows immutable.
 */
class sqlite_migration_ledger final : public migration_ledger_interface {
public:
    explicit sqlite_migration_ledger(std::shared_ptr<storage::sqlite_database> db);
    ~sqlite_migration_ledger() override = default;

    sqlite_migration_ledger(const sqlite_migration_ledger&) = delete;
    auto operator=(const sqlite_migration_ledger&) -> sqlite_migration_ledger& = delete;

    [[nodiscard]] auto has_tag(std::string_view tag_id,
                               const migration_scope& scope) const
        -> Result<bool> override;

    [[nodiscard]] auto commit_tag(std::string_view tag_id,
                                  const migration_scope& scope)
        -> VoidResult override;

    [[nodiscard]] auto find_tag(std::string_view tag_id,
                                const migration_scope& scope) const
        -> Result<migration_tag> override;

    [[nodiscard]] auto list_tags() const
        -> Result<std::vector<migration_tag>> override;

private:
    std::shared_ptr<storage::sqlite_database> db_;
};

}  // namespace migrate::engine
