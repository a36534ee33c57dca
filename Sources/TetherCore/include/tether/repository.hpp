#pragma once

#include "db.hpp"
#include "observation.hpp"
#include "view_model.hpp"
#include <functional>
#include <memory>
#include <vector>

namespace tether {

// ============================================================================
// repository - moves view models to and from the store
// ============================================================================
//
// Every operation runs in exactly one transaction. save and remove publish one
// change notification for their entity type after a successful commit; a
// failed operation rolls back and leaves the view models untouched.

class repository {
public:
    using batch_t = std::vector<view_model_ptr>;

    repository(std::shared_ptr<database> db, view_model_factory& factory, event_bus& bus);

    repository(const repository&) = delete;
    repository& operator=(const repository&) = delete;

    /// Insert pending items, upsert persisted ones, then write the stored
    /// keys back onto `items` by position.
    /// Throws model_error if an item is not a view model of E.
    template<typename E>
    void save(const batch_t& items) {
        if (items.empty()) return;
        const auto& schema = entity_traits<E>::schema();
        check_batch(schema, items, "save");

        std::vector<row_t> rows;
        rows.reserve(items.size());
        for (const auto& item : items) {
            rows.push_back(entity_traits<E>::to_row(item->to_entity<E>()));
        }
        save_rows(schema, items, rows);
    }

    /// Delete the stored rows of `items`. Pending items are skipped, rows that
    /// are already gone count as deleted. A batch with no stored item never
    /// reaches the database but still publishes its notification.
    template<typename E>
    void remove(const batch_t& items) {
        if (items.empty()) return;
        const auto& schema = entity_traits<E>::schema();
        check_batch(schema, items, "remove");
        remove_rows(schema, items);
    }

    /// Every stored row, in primary-key order
    template<typename E>
    batch_t fetch_all() {
        return fetch_all(factory_.derive<E>());
    }

    batch_t fetch_all(const descriptor_ptr& descriptor);

    [[nodiscard]] notification_token subscribe(event_bus::callback_t callback);

    /// Run `block` inside one transaction
    void read(const std::function<void(database&)>& block);

    database& db() { return *db_; }
    view_model_factory& factory() { return factory_; }
    event_bus& bus() { return bus_; }

private:
    std::shared_ptr<database> db_;
    view_model_factory& factory_;
    event_bus& bus_;

    static void check_batch(const entity_schema& schema, const batch_t& items, const char* op);
    void save_rows(const entity_schema& schema, const batch_t& items, const std::vector<row_t>& rows);
    void remove_rows(const entity_schema& schema, const batch_t& items);
    void publish(const entity_schema& schema);
};

} // namespace tether
