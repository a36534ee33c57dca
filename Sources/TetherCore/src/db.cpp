#include "tether/db.hpp"
#include "tether/log.hpp"
#include <sstream>
#include <type_traits>

namespace tether {

namespace {

const char* sql_type_name(const column_def& col) {
    switch (col.type) {
        case column_type::integer: return "INTEGER";
        case column_type::small_integer: return "SMALLINT";
        case column_type::big_integer: return "BIGINT";
        case column_type::real: return "REAL";
        case column_type::text: return "TEXT";
        case column_type::boolean: return "BOOLEAN";
        case column_type::blob: return "BLOB";
        case column_type::timestamp: return "TIMESTAMP";
    }
    return "TEXT";
}

const char* on_delete_clause(on_delete_policy policy) {
    switch (policy) {
        case on_delete_policy::cascade: return " ON DELETE CASCADE";
        case on_delete_policy::restrict: return " ON DELETE RESTRICT";
        case on_delete_policy::set_null: return " ON DELETE SET NULL";
        case on_delete_policy::no_action: break;
    }
    return "";
}

} // namespace

database::database(const std::string& path) : path_(path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw db_error("Failed to open database: " + error);
    }

    // Enable foreign keys
    execute("PRAGMA foreign_keys = ON");

    // WAL only applies to file databases
    if (path != ":memory:" && !path.empty()) {
        execute("PRAGMA journal_mode = WAL");
    }

    // Set busy timeout to handle lock contention (5 seconds)
    sqlite3_busy_timeout(db_, 5000);

    LOG_DEBUG("db", "Opened %s", path.c_str());
}

database::~database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void database::set_foreign_keys(bool enabled) {
    execute(enabled ? "PRAGMA foreign_keys = ON" : "PRAGMA foreign_keys = OFF");
}

bool database::foreign_keys_enabled() const {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "PRAGMA foreign_keys", -1, &stmt, nullptr) != SQLITE_OK) {
        throw db_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }
    bool enabled = sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_int(stmt, 0) != 0;
    sqlite3_finalize(stmt);
    return enabled;
}

void database::set_busy_timeout(int milliseconds) {
    sqlite3_busy_timeout(db_, milliseconds);
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    if (params.empty()) {
        // Fast path for parameterless queries
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "Unknown error";
            sqlite3_free(errmsg);
            LOG_ERROR("db", "%s in %s", error.c_str(), sql.c_str());
            throw db_error("SQL execution failed: " + error + " (SQL: " + sql + ")");
        }
    } else {
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            throw db_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
        }

        int index = 1;
        for (const auto& param : params) {
            bind_value(stmt, index++, param);
        }

        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            throw db_error("Execution failed: " + std::string(sqlite3_errmsg(db_)));
        }
    }
}

bool database::table_exists(const std::string& name) const {
    const char* sql = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";
    sqlite3_stmt* stmt = nullptr;

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw db_error("Failed to prepare statement");
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
    sqlite3_finalize(stmt);

    return exists;
}

void database::create_table(const entity_schema& schema) {
    std::ostringstream sql;
    sql << "CREATE TABLE " << schema.table_name << " (";

    bool first = true;
    for (const auto& col : schema.columns) {
        if (!first) sql << ", ";
        first = false;

        if (col.is_primary_key) {
            // AUTOINCREMENT keys start at 1 and are never reused
            sql << col.name << " INTEGER PRIMARY KEY AUTOINCREMENT";
            continue;
        }

        sql << col.name << " ";
        if (col.max_length) {
            sql << "VARCHAR(" << *col.max_length << ")";
        } else {
            sql << sql_type_name(col);
        }

        if (!col.nullable) {
            sql << " NOT NULL";
        }
        if (col.max_length) {
            sql << " CHECK(length(" << col.name << ") <= " << *col.max_length << ")";
        }
        if (col.foreign_key_table) {
            sql << " REFERENCES " << *col.foreign_key_table
                << "(" << col.foreign_key_column.value_or("id") << ")"
                << on_delete_clause(col.on_delete);
        }
    }

    sql << ")";
    LOG_DEBUG("db", "%s", sql.str().c_str());
    execute(sql.str());
}

void database::ensure_table(const entity_schema& schema) {
    if (!table_exists(schema.table_name)) {
        create_table(schema);
    }
}

void database::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), -1, SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            if (v.empty()) {
                sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }
    }, value);
}

column_value_t database::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            return std::string(text ? text : "");
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int size = sqlite3_column_bytes(stmt, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return std::vector<uint8_t>(bytes, bytes + size);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

primary_key_t database::insert(const std::string& table,
                               const std::vector<std::pair<std::string, column_value_t>>& values,
                               const std::vector<std::string>& conflict_columns) {
    std::ostringstream sql;
    if (values.empty()) {
        sql << "INSERT INTO " << table << " DEFAULT VALUES";
    } else {
        sql << "INSERT INTO " << table << " (";

        bool first = true;
        for (const auto& [col, _] : values) {
            if (!first) sql << ", ";
            sql << col;
            first = false;
        }

        sql << ") VALUES (";
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) sql << ", ";
            sql << "?";
        }
        sql << ")";
    }

    // Add ON CONFLICT clause for upsert if conflict_columns provided
    if (!conflict_columns.empty() && !values.empty()) {
        sql << " ON CONFLICT (";
        bool first = true;
        for (const auto& col : conflict_columns) {
            if (!first) sql << ", ";
            sql << col;
            first = false;
        }
        sql << ") DO ";

        std::ostringstream assignments;
        first = true;
        for (const auto& [col, _] : values) {
            bool is_conflict = false;
            for (const auto& cc : conflict_columns) {
                if (cc == col) { is_conflict = true; break; }
            }
            if (is_conflict) continue;
            if (!first) assignments << ", ";
            assignments << col << " = excluded." << col;
            first = false;
        }

        // Nothing but the key itself: the row already says everything
        if (first) {
            sql << "NOTHING";
        } else {
            sql << "UPDATE SET " << assignments.str();
        }
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.str().c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "Failed to prepare insert: %s", sqlite3_errmsg(db_));
        throw db_error("Failed to prepare insert: " + std::string(sqlite3_errmsg(db_)));
    }

    int index = 1;
    for (const auto& [_, val] : values) {
        bind_value(stmt, index++, val);
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        auto err = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Insert into %s failed: %s", table.c_str(), err.c_str());
        throw db_error("Insert failed: " + err);
    }

    return sqlite3_last_insert_rowid(db_);
}

bool database::remove(const std::string& table, const std::string& key_column, primary_key_t id) {
    std::string sql = "DELETE FROM " + table + " WHERE " + key_column + " = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw db_error("Failed to prepare delete: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_int64(stmt, 1, id);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        auto err = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Delete from %s failed: %s", table.c_str(), err.c_str());
        throw db_error("Delete failed: " + err);
    }

    return sqlite3_changes(db_) > 0;
}

std::vector<row_t> database::query(const std::string& sql,
                                   const std::vector<column_value_t>& params) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "%s in %s", sqlite3_errmsg(db_), sql.c_str());
        throw db_error("Failed to prepare query: " + std::string(sqlite3_errmsg(db_)));
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    std::vector<row_t> results;
    int col_count = sqlite3_column_count(stmt);

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        row_t row;
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt, i);
            row[name] = extract_column(stmt, i);
        }
        results.push_back(std::move(row));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        auto error = std::string(sqlite3_errmsg(db_));
        throw db_error("Query failed: " + error);
    }

    return results;
}

void database::begin_transaction() {
    // Each attempt already waits out the busy timeout
    constexpr int max_attempts = 3;

    // Use BEGIN IMMEDIATE to acquire write lock immediately
    int rc = SQLITE_OK;
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        rc = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
        if (rc == SQLITE_OK) return;
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) break;
        LOG_WARN("db", "Write lock busy on %s (attempt %d of %d)", path_.c_str(), attempt, max_attempts);
    }
    throw db_error("Failed to begin transaction: " + std::string(sqlite3_errmsg(db_)));
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 if a transaction is active, non-zero otherwise
    return sqlite3_get_autocommit(db_) == 0;
}

// Transaction RAII guard
transaction::transaction(database& db) : db_(db) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (!completed_ && db_.is_in_transaction()) {
        try {
            db_.rollback();
        } catch (const db_error& e) {
            LOG_ERROR("db", "Rollback failed: %s", e.what());
        }
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
}

} // namespace tether
