#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tether {

// ============================================================================
// type_mapper - schema column types -> view-model property value types
// ============================================================================
//
// An ordered table of (column family, value type) pairs. The first entry
// whose family contains the column type wins, so a member type such as
// big_integer resolves through the integer entry. Column types with no entry
// have no property: the field is left out of the view model.

class type_mapper {
public:
    struct mapping {
        column_type family;
        value_type type;
    };

    // integer -> integer, text -> text, real -> real, boolean -> boolean
    type_mapper();
    explicit type_mapper(std::vector<mapping> table);

    [[nodiscard]] std::optional<value_type> map(column_type column) const;

    // Appended entries are consulted after the existing ones
    void add_mapping(column_type family, value_type type);

    const std::vector<mapping>& mappings() const { return table_; }

private:
    std::vector<mapping> table_;
};

// 0, 0.0, "", false
property_value_t default_value(value_type type);

// Throws model_error for null, which has no value type
value_type type_of(const property_value_t& value);

// Numeric kinds convert between each other; text converts only to text.
// nullopt when the value cannot become `type`, null included.
std::optional<property_value_t> coerce(value_type type, const property_value_t& value);

// Store value -> property value. NULL stays null.
property_value_t to_property(value_type type, const column_value_t& value);

// Property value -> store value
column_value_t to_column(const property_value_t& value);

// User text -> property value: integers must be all digits, reals must parse
// completely, otherwise the default value is used.
property_value_t parse_value(value_type type, const std::string& text);

// Null formats as the empty string
std::string format_value(const property_value_t& value);

} // namespace tether
