#pragma once

#include "observation.hpp"
#include "schema.hpp"
#include "type_mapper.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tether {

// ============================================================================
// entity_descriptor - derived, immutable view-model metadata of an entity type
// ============================================================================

struct property_def {
    std::string name;
    value_type type = value_type::integer;
    column_type column = column_type::integer;
    bool is_primary_key = false;
    /// Holds null when the stored value is NULL
    bool nullable = false;
    /// Referenced entity type; nullptr when not a foreign key or when the
    /// target table is not registered
    const entity_schema* references = nullptr;

    bool is_foreign_key() const { return references != nullptr; }
};

class entity_descriptor {
public:
    using foreign_key_map = std::map<std::string, const entity_schema*>;

    entity_descriptor(const entity_schema& schema,
                      std::vector<property_def> properties,
                      foreign_key_map foreign_keys);

    const entity_schema& schema() const { return *schema_; }
    const std::string& entity_name() const { return schema_->entity_name; }
    const std::string& primary_key() const { return schema_->primary_key; }

    const std::vector<property_def>& properties() const { return properties_; }
    const property_def* property(const std::string& name) const;
    std::optional<size_t> index_of(const std::string& name) const;

    /// property name -> referenced entity type
    const foreign_key_map& foreign_keys() const { return foreign_keys_; }
    const entity_schema* references(const std::string& property) const;

    /// True if any foreign key of this type points at `target`
    bool depends_on(const entity_schema& target) const;

private:
    const entity_schema* schema_;
    std::vector<property_def> properties_;
    foreign_key_map foreign_keys_;
};

using descriptor_ptr = std::shared_ptr<const entity_descriptor>;

/// Keyword initialization: (property name, value). Unknown names are ignored.
using property_init = std::vector<std::pair<std::string, property_value_t>>;

// ============================================================================
// view_model - observable in-memory mirror of one entity value
// ============================================================================

class view_model {
public:
    /// Stable surrogate identity, unique within the process
    using handle_t = uint64_t;
    using observer_t = std::function<void(const view_model&, const std::string& property)>;

    explicit view_model(descriptor_ptr descriptor, const property_init& init = {});

    // Identity objects: copying would fork the identity
    view_model(const view_model&) = delete;
    view_model& operator=(const view_model&) = delete;

    handle_t handle() const { return handle_; }
    const entity_descriptor& descriptor() const { return *descriptor_; }
    const descriptor_ptr& shared_descriptor() const { return descriptor_; }

    // MARK: Key

    /// nullopt while the record has not been stored
    const record_key& key() const { return key_; }
    bool is_pending() const { return !key_.has_value(); }
    void set_key(record_key key);

    // MARK: Properties

    bool has_property(const std::string& name) const;

    /// Throws model_error for an unknown property. The primary-key property
    /// reads 0 while the record is pending; a nullable property may read null.
    property_value_t get(const std::string& name) const;

    template<typename T>
    T get_as(const std::string& name) const {
        auto value = get(name);
        if (!std::holds_alternative<T>(value)) {
            throw model_error("Property " + name + " of " + descriptor_->entity_name() +
                              " is not of the requested type");
        }
        return std::get<T>(value);
    }

    /// Coerces `value` to the property's value type. Writing 0 or null to the
    /// primary-key property makes the record pending again. Null is accepted
    /// by nullable properties only.
    void set(const std::string& name, property_value_t value);

    /// Parses user text for the property's value type, then sets it. Empty
    /// text sets a nullable property to null.
    void set_text(const std::string& name, const std::string& text);

    /// Called after every set that changed a value, in registration order
    [[nodiscard]] notification_token observe(observer_t callback);

    // MARK: Conversion

    /// Row of every mapped property plus the key (NULL while pending)
    row_t to_row() const;

    template<typename E>
    E to_entity() const {
        if (&descriptor_->schema() != &entity_traits<E>::schema()) {
            throw model_error("View model of " + descriptor_->entity_name() +
                              " cannot become " + entity_traits<E>::schema().entity_name);
        }
        return entity_traits<E>::from_row(to_row());
    }

private:
    handle_t handle_;
    descriptor_ptr descriptor_;
    record_key key_;
    std::vector<property_value_t> values_;  // parallel to descriptor properties
    observer_list<const view_model&, const std::string&> observers_;

    static handle_t next_handle();
    void notify(const std::string& property);
};

using view_model_ptr = std::shared_ptr<view_model>;

// ============================================================================
// view_model_factory - derives descriptors and builds view models
// ============================================================================

class view_model_factory {
public:
    explicit view_model_factory(const entity_registry& registry, type_mapper mapper = {});

    view_model_factory(const view_model_factory&) = delete;
    view_model_factory& operator=(const view_model_factory&) = delete;

    /// Derived once per entity type, then served from the cache
    descriptor_ptr derive(const entity_schema& schema);

    template<typename E>
    descriptor_ptr derive() {
        return derive(entity_traits<E>::schema());
    }

    template<typename E>
    view_model_ptr create(const property_init& init = {}) {
        return std::make_shared<view_model>(derive<E>(), init);
    }

    view_model_ptr create(const entity_schema& schema, const property_init& init = {}) {
        return std::make_shared<view_model>(derive(schema), init);
    }

    static view_model_ptr create(const descriptor_ptr& descriptor, const property_init& init = {}) {
        return std::make_shared<view_model>(descriptor, init);
    }

    template<typename E>
    view_model_ptr from_entity(const E& entity) {
        return from_row(derive<E>(), entity_traits<E>::to_row(entity));
    }

    template<typename E>
    static E to_entity(const view_model& vm) {
        return vm.to_entity<E>();
    }

    static view_model_ptr from_row(const descriptor_ptr& descriptor, const row_t& row);

    const entity_registry& registry() const { return registry_; }
    const type_mapper& mapper() const { return mapper_; }

private:
    const entity_registry& registry_;
    type_mapper mapper_;
    std::unordered_map<const entity_schema*, descriptor_ptr> cache_;
};

} // namespace tether
