#include "tether/view_model.hpp"
#include "tether/log.hpp"

#include <atomic>

namespace tether {

// ============================================================================
// entity_descriptor
// ============================================================================

entity_descriptor::entity_descriptor(const entity_schema& schema,
                                     std::vector<property_def> properties,
                                     foreign_key_map foreign_keys)
    : schema_(&schema)
    , properties_(std::move(properties))
    , foreign_keys_(std::move(foreign_keys)) {}

const property_def* entity_descriptor::property(const std::string& name) const {
    for (const auto& prop : properties_) {
        if (prop.name == name) return &prop;
    }
    return nullptr;
}

std::optional<size_t> entity_descriptor::index_of(const std::string& name) const {
    for (size_t i = 0; i < properties_.size(); ++i) {
        if (properties_[i].name == name) return i;
    }
    return std::nullopt;
}

const entity_schema* entity_descriptor::references(const std::string& property) const {
    auto it = foreign_keys_.find(property);
    return it == foreign_keys_.end() ? nullptr : it->second;
}

bool entity_descriptor::depends_on(const entity_schema& target) const {
    for (const auto& [_, schema] : foreign_keys_) {
        if (schema == &target) return true;
    }
    return false;
}

// ============================================================================
// view_model
// ============================================================================

view_model::handle_t view_model::next_handle() {
    static std::atomic<handle_t> counter{1};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

view_model::view_model(descriptor_ptr descriptor, const property_init& init)
    : handle_(next_handle())
    , descriptor_(std::move(descriptor)) {
    if (!descriptor_) {
        throw model_error("View model requires a descriptor");
    }
    values_.reserve(descriptor_->properties().size());
    for (const auto& prop : descriptor_->properties()) {
        values_.push_back(prop.nullable ? property_value_t{nullptr} : default_value(prop.type));
    }

    for (const auto& [name, value] : init) {
        if (!has_property(name)) {
            LOG_DEBUG("view_model", "Ignoring unknown property %s for %s",
                      name.c_str(), descriptor_->entity_name().c_str());
            continue;
        }
        set(name, value);
    }
}

void view_model::set_key(record_key key) {
    if (key_ == key) return;
    key_ = key;
    notify(descriptor_->primary_key());
}

bool view_model::has_property(const std::string& name) const {
    return descriptor_->index_of(name).has_value();
}

property_value_t view_model::get(const std::string& name) const {
    auto index = descriptor_->index_of(name);
    if (!index) {
        throw model_error("Unknown property " + name + " of " + descriptor_->entity_name());
    }
    if (descriptor_->properties()[*index].is_primary_key) {
        return coerce(descriptor_->properties()[*index].type,
                      property_value_t{static_cast<int64_t>(key_.value_or(0))}).value();
    }
    return values_[*index];
}

void view_model::set(const std::string& name, property_value_t value) {
    auto index = descriptor_->index_of(name);
    if (!index) {
        throw model_error("Unknown property " + name + " of " + descriptor_->entity_name());
    }
    const auto& prop = descriptor_->properties()[*index];

    if (is_null(value)) {
        if (prop.is_primary_key) {
            set_key(std::nullopt);
            return;
        }
        if (!prop.nullable) {
            throw model_error("Cannot assign NULL to " + descriptor_->entity_name() + "." + name);
        }
        if (is_null(values_[*index])) return;
        values_[*index] = nullptr;
        notify(name);
        return;
    }

    auto coerced = coerce(prop.type, value);
    if (!coerced) {
        throw model_error("Cannot assign " + std::string(to_string(type_of(value))) +
                          " to " + descriptor_->entity_name() + "." + name +
                          " (" + to_string(prop.type) + ")");
    }

    if (prop.is_primary_key) {
        auto id = coerce(value_type::integer, *coerced);
        auto raw = std::get<int64_t>(*id);
        set_key(raw == 0 ? record_key{} : record_key{raw});
        return;
    }

    if (values_[*index] == *coerced) return;
    values_[*index] = std::move(*coerced);
    notify(name);
}

void view_model::set_text(const std::string& name, const std::string& text) {
    const auto* prop = descriptor_->property(name);
    if (!prop) {
        throw model_error("Unknown property " + name + " of " + descriptor_->entity_name());
    }
    if (prop->nullable && text.empty()) {
        set(name, nullptr);
        return;
    }
    set(name, parse_value(prop->type, text));
}

notification_token view_model::observe(observer_t callback) {
    return observers_.add(std::move(callback));
}

void view_model::notify(const std::string& property) {
    observers_.notify(*this, property);
}

row_t view_model::to_row() const {
    row_t row;
    const auto& props = descriptor_->properties();
    for (size_t i = 0; i < props.size(); ++i) {
        if (props[i].is_primary_key) continue;
        row[props[i].name] = to_column(values_[i]);
    }
    if (key_) {
        row[descriptor_->primary_key()] = *key_;
    } else {
        row[descriptor_->primary_key()] = nullptr;
    }
    return row;
}

// ============================================================================
// view_model_factory
// ============================================================================

view_model_factory::view_model_factory(const entity_registry& registry, type_mapper mapper)
    : registry_(registry)
    , mapper_(std::move(mapper)) {}

descriptor_ptr view_model_factory::derive(const entity_schema& schema) {
    if (auto it = cache_.find(&schema); it != cache_.end()) {
        return it->second;
    }

    std::vector<property_def> properties;
    entity_descriptor::foreign_key_map foreign_keys;

    for (const auto& col : schema.columns) {
        auto mapped = mapper_.map(col.type);
        if (!mapped) {
            LOG_DEBUG("view_model", "%s.%s has no property type (%s), skipped",
                      schema.entity_name.c_str(), col.name.c_str(), to_string(col.type));
            continue;
        }

        property_def prop;
        prop.name = col.name;
        prop.type = *mapped;
        prop.column = col.type;
        prop.is_primary_key = col.is_primary_key;
        prop.nullable = col.nullable;

        if (col.is_foreign_key()) {
            prop.references = registry_.find_by_table(*col.foreign_key_table);
            if (prop.references) {
                foreign_keys.emplace(col.name, prop.references);
            } else {
                LOG_WARN("view_model", "%s.%s references unregistered table %s",
                         schema.entity_name.c_str(), col.name.c_str(),
                         col.foreign_key_table->c_str());
            }
        }
        properties.push_back(std::move(prop));
    }

    auto descriptor = std::make_shared<const entity_descriptor>(
        schema, std::move(properties), std::move(foreign_keys));
    cache_.emplace(&schema, descriptor);
    LOG_DEBUG("view_model", "Derived descriptor for %s (%zu properties)",
              schema.entity_name.c_str(), descriptor->properties().size());
    return descriptor;
}

view_model_ptr view_model_factory::from_row(const descriptor_ptr& descriptor, const row_t& row) {
    auto vm = std::make_shared<view_model>(descriptor);
    for (const auto& prop : descriptor->properties()) {
        auto it = row.find(prop.name);
        if (it == row.end()) continue;
        if (prop.is_primary_key) {
            if (std::holds_alternative<std::nullptr_t>(it->second)) {
                vm->set_key(std::nullopt);
            } else {
                vm->set_key(detail::as_int64(it->second));
            }
            continue;
        }
        auto value = to_property(prop.type, it->second);
        if (is_null(value) && !prop.nullable) {
            value = default_value(prop.type);
        }
        vm->set(prop.name, std::move(value));
    }
    // Primary key left unmapped by a custom type table
    if (!descriptor->property(descriptor->primary_key())) {
        auto it = row.find(descriptor->primary_key());
        if (it != row.end() && !std::holds_alternative<std::nullptr_t>(it->second)) {
            vm->set_key(detail::as_int64(it->second));
        }
    }
    return vm;
}

} // namespace tether
