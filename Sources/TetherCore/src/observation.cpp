#include "tether/observation.hpp"
#include "tether/log.hpp"

namespace tether {

notification_token event_bus::subscribe(callback_t callback) {
    auto token = subscribers_.add(std::move(callback));
    LOG_DEBUG("event_bus", "Subscribed (%zu subscribers)", subscribers_.size());
    return token;
}

void event_bus::publish(const change_notification& notification) const {
    LOG_DEBUG("event_bus", "Publishing change of %s to %zu subscribers",
              notification.entity ? notification.entity->entity_name.c_str() : "<none>",
              subscribers_.size());
    subscribers_.notify(notification);
}

} // namespace tether
