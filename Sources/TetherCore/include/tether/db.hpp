#pragma once

#include "types.hpp"
#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tether {

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg) : std::runtime_error(msg) {}
};

class database {
public:
    // Opens read/write, creating the file when missing
    explicit database(const std::string& path = ":memory:");
    ~database();

    // Shared by owner (std::shared_ptr), never copied or moved
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    const std::string& path() const { return path_; }

    // Connection settings. Foreign keys are on by default; cascading deletes need them.
    void set_foreign_keys(bool enabled);
    bool foreign_keys_enabled() const;
    void set_busy_timeout(int milliseconds);

    // Schema management
    void create_table(const entity_schema& schema);
    void ensure_table(const entity_schema& schema);
    bool table_exists(const std::string& name) const;

    // CRUD operations
    // conflict_columns: if non-empty, generates ON CONFLICT (...) DO UPDATE SET for upsert
    primary_key_t insert(const std::string& table,
                         const std::vector<std::pair<std::string, column_value_t>>& values,
                         const std::vector<std::string>& conflict_columns = {});

    // Returns false when no row had that key
    bool remove(const std::string& table, const std::string& key_column, primary_key_t id);

    // Query - returns rows as column maps
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    // Transaction support. begin_transaction throws db_error once the write
    // lock stays busy through a few busy-timeout waits.
    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    // Execute SQL with optional params (for INSERT/UPDATE/DELETE without return)
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    // Raw access (use sparingly)
    sqlite3* handle() const { return db_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;

    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);
    column_value_t extract_column(sqlite3_stmt* stmt, int index);
};

// RAII transaction guard - rolls back on scope exit unless committed
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();

private:
    database& db_;
    bool completed_ = false;
};

} // namespace tether
