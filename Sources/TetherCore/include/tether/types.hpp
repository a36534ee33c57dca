#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tether {

// Timestamp type (stored as seconds since Unix epoch, REAL)
using timestamp_t = std::chrono::system_clock::time_point;

// Primary key type
using primary_key_t = int64_t;

// Key of a record as seen from memory: nullopt until the store assigned one
using record_key = std::optional<primary_key_t>;

// Values as they travel to and from the store
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

// One fetched row, column name -> value
using row_t = std::unordered_map<std::string, column_value_t>;

// Schema column types. small_integer and big_integer belong to the integer family.
enum class column_type {
    integer,
    small_integer,
    big_integer,
    real,
    text,
    boolean,
    blob,
    timestamp
};

const char* to_string(column_type type);

// True when `type` is `family` or one of its members.
bool is_a(column_type type, column_type family);

enum class on_delete_policy {
    no_action,
    cascade,
    restrict,
    set_null
};

// Column definition for schema
struct column_def {
    std::string name;
    column_type type = column_type::integer;
    bool nullable = false;
    bool is_primary_key = false;
    std::optional<std::size_t> max_length;
    std::optional<std::string> foreign_key_table;
    std::optional<std::string> foreign_key_column;
    on_delete_policy on_delete = on_delete_policy::no_action;

    bool is_foreign_key() const { return foreign_key_table.has_value(); }
};

// Persisted layout of one entity type. Instances live in static storage
// (one per TETHER_ENTITY), so their address is the entity type's identity.
struct entity_schema {
    std::string entity_name;
    std::string table_name;
    std::string primary_key;
    std::vector<column_def> columns;

    const column_def* column(const std::string& name) const {
        for (const auto& col : columns) {
            if (col.name == name) return &col;
        }
        return nullptr;
    }
};

// Value types of view-model properties
enum class value_type {
    integer,
    real,
    text,
    boolean
};

const char* to_string(value_type type);

// nullptr is the NULL of a nullable property
using property_value_t = std::variant<std::nullptr_t, int64_t, double, std::string, bool>;

inline bool is_null(const property_value_t& value) {
    return std::holds_alternative<std::nullptr_t>(value);
}

// Caller errors in the view-model layer (unknown property, uncoercible value,
// mixed-type batch)
class model_error : public std::logic_error {
public:
    explicit model_error(const std::string& msg) : std::logic_error(msg) {}
};

// ============================================================================
// Field traits - C++ member type -> column type and value codec
// ============================================================================

template<typename T>
struct field_traits;

namespace detail {

    inline int64_t as_int64(const column_value_t& v) {
        if (std::holds_alternative<int64_t>(v)) return std::get<int64_t>(v);
        if (std::holds_alternative<double>(v)) return static_cast<int64_t>(std::get<double>(v));
        return 0;
    }

    inline double as_double(const column_value_t& v) {
        if (std::holds_alternative<double>(v)) return std::get<double>(v);
        if (std::holds_alternative<int64_t>(v)) return static_cast<double>(std::get<int64_t>(v));
        return 0.0;
    }

    inline std::string as_string(const column_value_t& v) {
        if (std::holds_alternative<std::string>(v)) return std::get<std::string>(v);
        return {};
    }

    template<typename Int, column_type Type>
    struct integer_field {
        static constexpr column_type type = Type;
        static constexpr bool nullable = false;

        static column_value_t to_column(Int v) { return static_cast<int64_t>(v); }
        static Int from_column(const column_value_t& v) { return static_cast<Int>(as_int64(v)); }
    };

} // namespace detail

template<> struct field_traits<int> : detail::integer_field<int, column_type::integer> {};
template<> struct field_traits<int64_t> : detail::integer_field<int64_t, column_type::big_integer> {};
template<> struct field_traits<int16_t> : detail::integer_field<int16_t, column_type::small_integer> {};

template<>
struct field_traits<bool> {
    static constexpr column_type type = column_type::boolean;
    static constexpr bool nullable = false;

    static column_value_t to_column(bool v) { return static_cast<int64_t>(v ? 1 : 0); }
    static bool from_column(const column_value_t& v) { return detail::as_int64(v) != 0; }
};

template<>
struct field_traits<double> {
    static constexpr column_type type = column_type::real;
    static constexpr bool nullable = false;

    static column_value_t to_column(double v) { return v; }
    static double from_column(const column_value_t& v) { return detail::as_double(v); }
};

template<>
struct field_traits<float> {
    static constexpr column_type type = column_type::real;
    static constexpr bool nullable = false;

    static column_value_t to_column(float v) { return static_cast<double>(v); }
    static float from_column(const column_value_t& v) { return static_cast<float>(detail::as_double(v)); }
};

template<>
struct field_traits<std::string> {
    static constexpr column_type type = column_type::text;
    static constexpr bool nullable = false;

    static column_value_t to_column(const std::string& v) { return v; }
    static std::string from_column(const column_value_t& v) { return detail::as_string(v); }
};

template<>
struct field_traits<std::vector<uint8_t>> {
    static constexpr column_type type = column_type::blob;
    static constexpr bool nullable = false;

    static column_value_t to_column(const std::vector<uint8_t>& v) { return v; }
    static std::vector<uint8_t> from_column(const column_value_t& v) {
        if (std::holds_alternative<std::vector<uint8_t>>(v)) return std::get<std::vector<uint8_t>>(v);
        return {};
    }
};

// Timestamp stored as double (seconds since epoch)
template<>
struct field_traits<timestamp_t> {
    static constexpr column_type type = column_type::timestamp;
    static constexpr bool nullable = false;

    static column_value_t to_column(timestamp_t v) {
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(v.time_since_epoch()).count();
        return static_cast<double>(millis) / 1000.0;
    }
    static timestamp_t from_column(const column_value_t& v) {
        auto millis = static_cast<int64_t>(detail::as_double(v) * 1000.0);
        return timestamp_t(std::chrono::milliseconds(millis));
    }
};

// Optional handling
template<typename T>
struct field_traits<std::optional<T>> : field_traits<T> {
    static constexpr bool nullable = true;

    static column_value_t to_column(const std::optional<T>& v) {
        if (!v.has_value()) return nullptr;
        return field_traits<T>::to_column(*v);
    }
    static std::optional<T> from_column(const column_value_t& v) {
        if (std::holds_alternative<std::nullptr_t>(v)) return std::nullopt;
        return field_traits<T>::from_column(v);
    }
};

} // namespace tether
