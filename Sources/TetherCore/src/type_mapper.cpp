#include "tether/type_mapper.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <sstream>

namespace tether {

const char* to_string(value_type type) {
    switch (type) {
        case value_type::integer: return "integer";
        case value_type::real: return "real";
        case value_type::text: return "text";
        case value_type::boolean: return "boolean";
    }
    return "unknown";
}

type_mapper::type_mapper()
    : table_{
        {column_type::integer, value_type::integer},
        {column_type::text, value_type::text},
        {column_type::real, value_type::real},
        {column_type::boolean, value_type::boolean},
    } {}

type_mapper::type_mapper(std::vector<mapping> table) : table_(std::move(table)) {}

std::optional<value_type> type_mapper::map(column_type column) const {
    for (const auto& entry : table_) {
        if (is_a(column, entry.family)) {
            return entry.type;
        }
    }
    return std::nullopt;
}

void type_mapper::add_mapping(column_type family, value_type type) {
    table_.push_back({family, type});
}

property_value_t default_value(value_type type) {
    switch (type) {
        case value_type::integer: return int64_t{0};
        case value_type::real: return 0.0;
        case value_type::text: return std::string();
        case value_type::boolean: return false;
    }
    return int64_t{0};
}

value_type type_of(const property_value_t& value) {
    if (is_null(value)) {
        throw model_error("NULL has no value type");
    }
    if (std::holds_alternative<int64_t>(value)) return value_type::integer;
    if (std::holds_alternative<double>(value)) return value_type::real;
    if (std::holds_alternative<std::string>(value)) return value_type::text;
    return value_type::boolean;
}

std::optional<property_value_t> coerce(value_type type, const property_value_t& value) {
    if (is_null(value)) return std::nullopt;
    if (type_of(value) == type) return value;

    if (std::holds_alternative<std::string>(value) || type == value_type::text) {
        return std::nullopt;
    }

    double number = 0.0;
    if (std::holds_alternative<int64_t>(value)) {
        number = static_cast<double>(std::get<int64_t>(value));
    } else if (std::holds_alternative<double>(value)) {
        number = std::get<double>(value);
    } else {
        number = std::get<bool>(value) ? 1.0 : 0.0;
    }

    switch (type) {
        case value_type::integer:
            if (std::holds_alternative<int64_t>(value)) return value;
            if (std::holds_alternative<bool>(value)) return int64_t{std::get<bool>(value) ? 1 : 0};
            return static_cast<int64_t>(number);
        case value_type::real:
            return number;
        case value_type::boolean:
            return number != 0.0;
        case value_type::text:
            break;
    }
    return std::nullopt;
}

property_value_t to_property(value_type type, const column_value_t& value) {
    if (std::holds_alternative<std::nullptr_t>(value)) return nullptr;
    switch (type) {
        case value_type::integer:
            return detail::as_int64(value);
        case value_type::real:
            return detail::as_double(value);
        case value_type::text:
            return detail::as_string(value);
        case value_type::boolean:
            return detail::as_int64(value) != 0;
    }
    return default_value(type);
}

column_value_t to_column(const property_value_t& value) {
    return std::visit([](auto&& v) -> column_value_t {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return static_cast<int64_t>(v ? 1 : 0);
        } else {
            return v;
        }
    }, value);
}

property_value_t parse_value(value_type type, const std::string& text) {
    switch (type) {
        case value_type::integer: {
            bool digits = !text.empty() &&
                std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
            if (!digits) return int64_t{0};
            int64_t result = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
            if (ec != std::errc() || ptr != text.data() + text.size()) return int64_t{0};
            return result;
        }
        case value_type::real: {
            if (text.empty()) return 0.0;
            char* end = nullptr;
            errno = 0;
            double result = std::strtod(text.c_str(), &end);
            if (errno != 0 || end != text.c_str() + text.size()) return 0.0;
            return result;
        }
        case value_type::boolean: {
            std::string lowered(text);
            std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return lowered == "true" || lowered == "1" || lowered == "yes";
        }
        case value_type::text:
            return text;
    }
    return text;
}

std::string format_value(const property_value_t& value) {
    return std::visit([](auto&& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return {};
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream out;
            out << v;
            return out.str();
        } else {
            return std::to_string(v);
        }
    }, value);
}

} // namespace tether
