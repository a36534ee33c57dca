#include "tether/repository.hpp"
#include "tether/log.hpp"

namespace tether {

repository::repository(std::shared_ptr<database> db, view_model_factory& factory, event_bus& bus)
    : db_(std::move(db))
    , factory_(factory)
    , bus_(bus) {
    if (!db_) {
        throw db_error("Repository requires an open database");
    }
}

void repository::check_batch(const entity_schema& schema, const batch_t& items, const char* op) {
    for (size_t i = 0; i < items.size(); ++i) {
        if (!items[i]) {
            throw model_error(std::string("Cannot ") + op + " a null view model (item " +
                              std::to_string(i) + ")");
        }
        const auto& item_schema = items[i]->descriptor().schema();
        if (&item_schema != &schema) {
            throw model_error(std::string("Cannot ") + op + " " + item_schema.entity_name +
                              " in a batch of " + schema.entity_name + " (item " +
                              std::to_string(i) + ")");
        }
    }
}

void repository::save_rows(const entity_schema& schema, const batch_t& items,
                           const std::vector<row_t>& rows) {
    std::vector<primary_key_t> keys;
    keys.reserve(rows.size());

    {
        transaction txn(*db_);
        try {
            for (const auto& row : rows) {
                auto pk_it = row.find(schema.primary_key);
                bool pending = pk_it == row.end() ||
                               std::holds_alternative<std::nullptr_t>(pk_it->second);

                std::vector<std::pair<std::string, column_value_t>> values;
                values.reserve(schema.columns.size());
                for (const auto& col : schema.columns) {
                    if (col.is_primary_key && pending) continue;
                    auto it = row.find(col.name);
                    values.emplace_back(col.name, it == row.end() ? column_value_t{nullptr} : it->second);
                }

                primary_key_t key = 0;
                if (pending) {
                    key = db_->insert(schema.table_name, values);
                } else {
                    key = std::get<int64_t>(pk_it->second);
                    db_->insert(schema.table_name, values, {schema.primary_key});
                }

                // Read the merged row back so the key comes from the store
                auto stored = db_->query("SELECT " + schema.primary_key + " FROM " +
                                         schema.table_name + " WHERE " + schema.primary_key + " = ?",
                                         {key});
                if (stored.empty()) {
                    throw db_error("Saved " + schema.entity_name + " row " +
                                   std::to_string(key) + " could not be read back");
                }
                keys.push_back(detail::as_int64(stored.front().at(schema.primary_key)));
            }
            txn.commit();
        } catch (const db_error& e) {
            LOG_ERROR("repository", "Save of %zu %s failed: %s",
                      rows.size(), schema.entity_name.c_str(), e.what());
            throw;
        }
    }

    for (size_t i = 0; i < items.size(); ++i) {
        items[i]->set_key(keys[i]);
    }
    LOG_DEBUG("repository", "Saved %zu %s", items.size(), schema.entity_name.c_str());
    publish(schema);
}

void repository::remove_rows(const entity_schema& schema, const batch_t& items) {
    std::vector<primary_key_t> keys;
    for (const auto& item : items) {
        if (!item->is_pending()) keys.push_back(*item->key());
    }
    // Nothing was ever stored: no transaction, but observers still hear of the delete
    if (keys.empty()) {
        LOG_DEBUG("repository", "Delete of %zu pending %s skipped", items.size(), schema.entity_name.c_str());
        publish(schema);
        return;
    }

    size_t deleted = 0;
    {
        transaction txn(*db_);
        try {
            for (auto key : keys) {
                if (db_->remove(schema.table_name, schema.primary_key, key)) {
                    ++deleted;
                }
            }
            txn.commit();
        } catch (const db_error& e) {
            LOG_ERROR("repository", "Delete of %zu %s failed: %s",
                      items.size(), schema.entity_name.c_str(), e.what());
            throw;
        }
    }
    LOG_DEBUG("repository", "Deleted %zu of %zu %s", deleted, items.size(), schema.entity_name.c_str());
    publish(schema);
}

repository::batch_t repository::fetch_all(const descriptor_ptr& descriptor) {
    const auto& schema = descriptor->schema();
    batch_t result;
    read([&](database& db) {
        auto rows = db.query("SELECT * FROM " + schema.table_name +
                             " ORDER BY " + schema.primary_key);
        result.reserve(rows.size());
        for (const auto& row : rows) {
            result.push_back(view_model_factory::from_row(descriptor, row));
        }
    });
    LOG_DEBUG("repository", "Fetched %zu %s", result.size(), schema.entity_name.c_str());
    return result;
}

notification_token repository::subscribe(event_bus::callback_t callback) {
    return bus_.subscribe(std::move(callback));
}

void repository::read(const std::function<void(database&)>& block) {
    transaction txn(*db_);
    block(*db_);
    txn.commit();
}

void repository::publish(const entity_schema& schema) {
    bus_.publish(change_notification{&schema});
}

} // namespace tether
