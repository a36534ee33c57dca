#include "inventory/models.hpp"

namespace tether::inventory {

void register_inventory(entity_registry& registry) {
    registry.add<Product>();
    registry.add<Order>();
}

} // namespace tether::inventory
