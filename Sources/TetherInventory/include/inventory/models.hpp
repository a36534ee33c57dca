#pragma once

#include <tether/schema.hpp>
#include <optional>

namespace tether::inventory {

struct Product {
    std::optional<primary_key_t> id;
    varchar<40> name;
    varchar<300> description;
    int quantity = 0;

    bool operator==(const Product&) const = default;
};

struct Order {
    std::optional<primary_key_t> id;
    references<Product, on_delete_policy::cascade> product_id;
    int quantity = 0;

    bool operator==(const Order&) const = default;
};

/// Register Product and Order, parent first
void register_inventory(entity_registry& registry);

} // namespace tether::inventory

TETHER_ENTITY(tether::inventory::Product, "products", id, name, description, quantity);
TETHER_ENTITY(tether::inventory::Order, "orders", id, product_id, quantity);
