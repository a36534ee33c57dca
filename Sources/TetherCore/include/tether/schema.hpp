#pragma once

#include "types.hpp"
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace tether {

class database;

// Specialized by TETHER_ENTITY for every entity struct
template<typename E>
struct entity_traits;

// ============================================================================
// Field wrapper types
// ============================================================================

/// Text column with a maximum length (VARCHAR(N), enforced by a CHECK constraint)
template<std::size_t N>
struct varchar : std::string {
    using std::string::string;

    varchar() = default;
    varchar(std::string s) : std::string(std::move(s)) {}

    static constexpr std::size_t max_length = N;
};

/// Integer column holding the primary key of a `Target` row
template<typename Target, on_delete_policy Policy = on_delete_policy::no_action>
struct references {
    primary_key_t key = 0;

    references() = default;
    references(primary_key_t k) : key(k) {}

    operator primary_key_t() const { return key; }

    bool operator==(const references& other) const { return key == other.key; }
    bool operator!=(const references& other) const { return key != other.key; }
};

template<std::size_t N>
struct field_traits<varchar<N>> : field_traits<std::string> {
    static constexpr std::size_t max_length = N;

    static column_value_t to_column(const varchar<N>& v) { return static_cast<const std::string&>(v); }
    static varchar<N> from_column(const column_value_t& v) {
        return varchar<N>(field_traits<std::string>::from_column(v));
    }
};

template<typename Target, on_delete_policy Policy>
struct field_traits<references<Target, Policy>> {
    static constexpr column_type type = column_type::integer;
    static constexpr bool nullable = false;
    static constexpr on_delete_policy on_delete = Policy;

    static std::string foreign_table() { return entity_traits<Target>::schema().table_name; }
    static std::string foreign_column() { return entity_traits<Target>::schema().primary_key; }

    static column_value_t to_column(const references<Target, Policy>& v) { return v.key; }
    static references<Target, Policy> from_column(const column_value_t& v) {
        return references<Target, Policy>(detail::as_int64(v));
    }
};

// ============================================================================
// Entity registry - the set of entity types known to one application
// ============================================================================

/// A schema holding a foreign key to another one (implied one-to-many back-reference)
struct dependent_ref {
    const entity_schema* schema = nullptr;
    const column_def* column = nullptr;
};

class entity_registry {
public:
    template<typename E>
    const entity_schema& add() {
        const auto& schema = entity_traits<E>::schema();
        add(schema);
        return schema;
    }

    // Registering the same schema twice is a no-op
    void add(const entity_schema& schema);

    bool contains(const entity_schema& schema) const;

    // Linear scans, registration order
    const entity_schema* find(const std::string& entity_name) const;
    const entity_schema* find_by_table(const std::string& table_name) const;

    const std::vector<const entity_schema*>& all() const { return schemas_; }

    std::vector<dependent_ref> dependents(const entity_schema& parent) const;

    /// Create missing tables, referenced tables before the tables referencing them
    void create_all(database& db) const;

private:
    std::vector<const entity_schema*> schemas_;
};

namespace detail {

    template<typename Traits, typename = void>
    struct has_max_length : std::false_type {};
    template<typename Traits>
    struct has_max_length<Traits, std::void_t<decltype(Traits::max_length)>> : std::true_type {};

    template<typename Traits, typename = void>
    struct has_foreign_key : std::false_type {};
    template<typename Traits>
    struct has_foreign_key<Traits, std::void_t<decltype(Traits::foreign_table())>> : std::true_type {};

    // "inventory::Product" -> "Product"
    std::string unqualified_name(const char* name);

    template<typename T>
    void add_column(std::vector<column_def>& out, const char* name) {
        using traits = field_traits<T>;

        column_def col;
        col.name = name;
        col.type = traits::type;
        col.nullable = traits::nullable;
        if constexpr (has_max_length<traits>::value) {
            col.max_length = traits::max_length;
        }
        if constexpr (has_foreign_key<traits>::value) {
            col.foreign_key_table = traits::foreign_table();
            col.foreign_key_column = traits::foreign_column();
            col.on_delete = traits::on_delete;
        }
        out.push_back(std::move(col));
    }

    template<typename T>
    void add_primary_key(std::vector<column_def>& out, const char* name) {
        static_assert(std::is_same_v<T, record_key>,
                      "primary key member must be std::optional<tether::primary_key_t>");
        column_def col;
        col.name = name;
        col.type = column_type::integer;
        col.is_primary_key = true;
        out.push_back(std::move(col));
    }

    template<typename T>
    void read_field(const row_t& row, const char* name, T& out) {
        auto it = row.find(name);
        if (it != row.end()) {
            out = field_traits<T>::from_column(it->second);
        }
    }

} // namespace detail

} // namespace tether

// ============================================================================
// TETHER_ENTITY Macro System
//
// Usage:
//   struct Product {
//       std::optional<tether::primary_key_t> id;
//       tether::varchar<40> name;
//       int quantity;
//   };
//   TETHER_ENTITY(Product, "products", id, name, quantity);
//
// Must be used at global scope. The first member after the table name is the
// primary key; the rest are persisted in the order given. An entity may have
// no field besides its key: TETHER_ENTITY(Marker, "markers", id).
// ============================================================================

// FOR_EACH variadic macro helpers (recursive concatenation)
#define TFE_0(WHAT, cls)
#define TFE_1(WHAT, cls, X) WHAT(cls, X)
#define TFE_2(WHAT, cls, X, ...) WHAT(cls, X) TFE_1(WHAT, cls, __VA_ARGS__)
#define TFE_3(WHAT, cls, X, ...) WHAT(cls, X) TFE_2(WHAT, cls, __VA_ARGS__)
#define TFE_4(WHAT, cls, X, ...) WHAT(cls, X) TFE_3(WHAT, cls, __VA_ARGS__)
#define TFE_5(WHAT, cls, X, ...) WHAT(cls, X) TFE_4(WHAT, cls, __VA_ARGS__)
#define TFE_6(WHAT, cls, X, ...) WHAT(cls, X) TFE_5(WHAT, cls, __VA_ARGS__)
#define TFE_7(WHAT, cls, X, ...) WHAT(cls, X) TFE_6(WHAT, cls, __VA_ARGS__)
#define TFE_8(WHAT, cls, X, ...) WHAT(cls, X) TFE_7(WHAT, cls, __VA_ARGS__)
#define TFE_9(WHAT, cls, X, ...) WHAT(cls, X) TFE_8(WHAT, cls, __VA_ARGS__)
#define TFE_10(WHAT, cls, X, ...) WHAT(cls, X) TFE_9(WHAT, cls, __VA_ARGS__)
#define TFE_11(WHAT, cls, X, ...) WHAT(cls, X) TFE_10(WHAT, cls, __VA_ARGS__)
#define TFE_12(WHAT, cls, X, ...) WHAT(cls, X) TFE_11(WHAT, cls, __VA_ARGS__)
#define TFE_13(WHAT, cls, X, ...) WHAT(cls, X) TFE_12(WHAT, cls, __VA_ARGS__)
#define TFE_14(WHAT, cls, X, ...) WHAT(cls, X) TFE_13(WHAT, cls, __VA_ARGS__)
#define TFE_15(WHAT, cls, X, ...) WHAT(cls, X) TFE_14(WHAT, cls, __VA_ARGS__)
#define TFE_16(WHAT, cls, X, ...) WHAT(cls, X) TFE_15(WHAT, cls, __VA_ARGS__)

#define T_GET_MACRO(_0, _1, _2, _3, _4, _5, _6, _7, _8, _9, _10, _11, _12, _13, _14, _15, _16, NAME, ...) NAME

#define T_FOR_EACH(action, cls, ...) \
    T_GET_MACRO(_0, __VA_ARGS__, \
        TFE_16, TFE_15, TFE_14, TFE_13, TFE_12, TFE_11, TFE_10, TFE_9, \
        TFE_8, TFE_7, TFE_6, TFE_5, TFE_4, TFE_3, TFE_2, TFE_1, TFE_0)(action, cls, __VA_ARGS__)

#define TETHER_COLUMN_DEF(cls, field) \
    ::tether::detail::add_column<decltype(cls::field)>(result.columns, #field);

#define TETHER_TO_ROW(cls, field) \
    row[#field] = ::tether::field_traits<decltype(cls::field)>::to_column(obj.field);

#define TETHER_FROM_ROW(cls, field) \
    ::tether::detail::read_field(row, #field, obj.field);

#define TETHER_ENTITY(cls, table, pk, ...) \
    template<> \
    struct tether::entity_traits<cls> { \
        using entity_type = cls; \
        \
        static const ::tether::entity_schema& schema() { \
            static const ::tether::entity_schema s = []() { \
                ::tether::entity_schema result; \
                result.entity_name = ::tether::detail::unqualified_name(#cls); \
                result.table_name = table; \
                result.primary_key = #pk; \
                ::tether::detail::add_primary_key<decltype(cls::pk)>(result.columns, #pk); \
                __VA_OPT__(T_FOR_EACH(TETHER_COLUMN_DEF, cls, __VA_ARGS__)) \
                return result; \
            }(); \
            return s; \
        } \
        \
        static ::tether::row_t to_row(const cls& obj) { \
            ::tether::row_t row; \
            row[#pk] = ::tether::field_traits<decltype(cls::pk)>::to_column(obj.pk); \
            __VA_OPT__(T_FOR_EACH(TETHER_TO_ROW, cls, __VA_ARGS__)) \
            return row; \
        } \
        \
        static cls from_row(const ::tether::row_t& row) { \
            cls obj{}; \
            ::tether::detail::read_field(row, #pk, obj.pk); \
            __VA_OPT__(T_FOR_EACH(TETHER_FROM_ROW, cls, __VA_ARGS__)) \
            return obj; \
        } \
        \
        static ::tether::record_key key(const cls& obj) { return obj.pk; } \
    }
