#include "tether/schema.hpp"
#include "tether/db.hpp"
#include "tether/log.hpp"

#include <algorithm>
#include <cstring>

namespace tether {

const char* to_string(column_type type) {
    switch (type) {
        case column_type::integer: return "integer";
        case column_type::small_integer: return "small_integer";
        case column_type::big_integer: return "big_integer";
        case column_type::real: return "real";
        case column_type::text: return "text";
        case column_type::boolean: return "boolean";
        case column_type::blob: return "blob";
        case column_type::timestamp: return "timestamp";
    }
    return "unknown";
}

bool is_a(column_type type, column_type family) {
    if (type == family) return true;
    if (family == column_type::integer) {
        return type == column_type::small_integer || type == column_type::big_integer;
    }
    return false;
}

namespace detail {

std::string unqualified_name(const char* name) {
    const char* last = std::strrchr(name, ':');
    return last ? std::string(last + 1) : std::string(name);
}

} // namespace detail

// ============================================================================
// entity_registry
// ============================================================================

void entity_registry::add(const entity_schema& schema) {
    if (contains(schema)) return;
    schemas_.push_back(&schema);
    LOG_DEBUG("registry", "Registered %s (table %s)", schema.entity_name.c_str(), schema.table_name.c_str());
}

bool entity_registry::contains(const entity_schema& schema) const {
    return std::find(schemas_.begin(), schemas_.end(), &schema) != schemas_.end();
}

const entity_schema* entity_registry::find(const std::string& entity_name) const {
    for (const auto* schema : schemas_) {
        if (schema->entity_name == entity_name) return schema;
    }
    return nullptr;
}

const entity_schema* entity_registry::find_by_table(const std::string& table_name) const {
    for (const auto* schema : schemas_) {
        if (schema->table_name == table_name) return schema;
    }
    return nullptr;
}

std::vector<dependent_ref> entity_registry::dependents(const entity_schema& parent) const {
    std::vector<dependent_ref> result;
    for (const auto* schema : schemas_) {
        for (const auto& col : schema->columns) {
            if (col.foreign_key_table && *col.foreign_key_table == parent.table_name) {
                result.push_back({schema, &col});
            }
        }
    }
    return result;
}

void entity_registry::create_all(database& db) const {
    std::vector<const entity_schema*> remaining(schemas_);
    std::vector<const entity_schema*> created;

    auto ready = [&](const entity_schema* schema) {
        for (const auto& col : schema->columns) {
            if (!col.foreign_key_table || *col.foreign_key_table == schema->table_name) continue;
            const auto* target = find_by_table(*col.foreign_key_table);
            if (target && std::find(created.begin(), created.end(), target) == created.end()) {
                return false;
            }
        }
        return true;
    };

    while (!remaining.empty()) {
        auto it = std::find_if(remaining.begin(), remaining.end(), ready);
        // A reference cycle: SQLite accepts forward references, so just take the next one
        if (it == remaining.end()) {
            it = remaining.begin();
        }
        db.ensure_table(**it);
        created.push_back(*it);
        remaining.erase(it);
    }
}

} // namespace tether
