#pragma once

#include "log.hpp"
#include "observation.hpp"
#include "repository.hpp"
#include <algorithm>
#include <optional>
#include <stdexcept>
#include <vector>

namespace tether {

// ============================================================================
// observable_collection - ordered, observable list of view models of one type
// ============================================================================
//
// Each mutation emits exactly one collection_change. Items are identified by
// their view-model handle; persisted keys are not required to be unique.
// The collection reloads itself when a type it references by foreign key
// changes in the store.

template<typename E>
class observable_collection {
public:
    using value_type = view_model_ptr;
    using const_iterator = typename std::vector<view_model_ptr>::const_iterator;
    using callback_t = std::function<void(const collection_change&)>;

    explicit observable_collection(repository& repo)
        : repo_(repo)
        , descriptor_(repo.factory().derive<E>()) {
        subscription_ = repo_.subscribe([this](const change_notification& n) {
            on_store_changed(n);
        });
    }

    // The repository subscription captures `this`
    observable_collection(const observable_collection&) = delete;
    observable_collection& operator=(const observable_collection&) = delete;

    const descriptor_ptr& descriptor() const { return descriptor_; }
    repository& repo() { return repo_; }

    // MARK: Enumeration

    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    const view_model_ptr& at(size_t position) const { return items_.at(position); }
    const view_model_ptr& operator[](size_t position) const { return items_[position]; }

    const_iterator begin() const { return items_.begin(); }
    const_iterator end() const { return items_.end(); }

    std::optional<size_t> find(view_model::handle_t handle) const {
        for (size_t i = 0; i < items_.size(); ++i) {
            if (items_[i]->handle() == handle) return i;
        }
        return std::nullopt;
    }

    std::optional<size_t> find(const view_model& vm) const { return find(vm.handle()); }

    bool contains(const view_model& vm) const { return find(vm.handle()).has_value(); }

    // MARK: Mutation

    void append(view_model_ptr item) {
        check_item(item);
        items_.push_back(std::move(item));
        collection_change change;
        change.insertions.push_back(items_.size() - 1);
        notify(change);
    }

    void remove(size_t position) {
        if (position >= items_.size()) {
            throw std::out_of_range("observable_collection::remove: position " +
                                    std::to_string(position) + " of " + std::to_string(items_.size()));
        }
        items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(position));
        collection_change change;
        change.deletions.push_back(position);
        notify(change);
    }

    /// Remove `n_removals` items at `position`, then insert `additions` there
    void splice(size_t position, size_t n_removals, std::vector<view_model_ptr> additions) {
        if (position > items_.size() || n_removals > items_.size() - position) {
            throw std::out_of_range("observable_collection::splice: range past end");
        }
        for (const auto& item : additions) {
            check_item(item);
        }

        collection_change change;
        for (size_t i = 0; i < n_removals; ++i) {
            change.deletions.push_back(position + i);
        }
        for (size_t i = 0; i < additions.size(); ++i) {
            change.insertions.push_back(position + i);
        }

        auto first = items_.begin() + static_cast<std::ptrdiff_t>(position);
        items_.erase(first, first + static_cast<std::ptrdiff_t>(n_removals));
        items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(position),
                      std::make_move_iterator(additions.begin()),
                      std::make_move_iterator(additions.end()));
        notify(change);
    }

    void clear() {
        splice(0, items_.size(), {});
    }

    // MARK: Observation

    [[nodiscard]] notification_token observe(callback_t callback) {
        return observers_.add(std::move(callback));
    }

    /// Report every position as modified so bound views re-render
    void notify_modified_all() {
        collection_change change;
        for (size_t i = 0; i < items_.size(); ++i) {
            change.modifications.push_back(i);
        }
        notify(change);
    }

    // MARK: Store synchronization

    /// Replace the contents with everything stored, in one change
    void load_all() {
        auto loaded = repo_.fetch_all(descriptor_);
        LOG_DEBUG("collection", "Loaded %zu %s", loaded.size(), descriptor_->entity_name().c_str());
        splice(0, items_.size(), std::move(loaded));
    }

    /// Save `items`, then append the ones not listed yet
    void save_items(const std::vector<view_model_ptr>& items) {
        repo_.save<E>(items);
        for (const auto& item : items) {
            if (!contains(*item)) {
                append(item);
            }
        }
    }

    /// Delete `items` from the store, then drop the listed ones, pending included
    void delete_items(const std::vector<view_model_ptr>& items) {
        repo_.remove<E>(items);
        for (const auto& item : items) {
            if (auto position = find(*item)) {
                remove(*position);
            }
        }
    }

private:
    repository& repo_;
    descriptor_ptr descriptor_;
    std::vector<view_model_ptr> items_;
    observer_list<const collection_change&> observers_;
    notification_token subscription_;

    void check_item(const view_model_ptr& item) const {
        if (!item || &item->descriptor().schema() != &descriptor_->schema()) {
            throw model_error("Collection of " + descriptor_->entity_name() +
                              " only holds view models of that type");
        }
    }

    void notify(const collection_change& change) {
        observers_.notify(change);
    }

    void on_store_changed(const change_notification& notification) {
        if (notification.entity && descriptor_->depends_on(*notification.entity)) {
            LOG_DEBUG("collection", "%s changed, reloading %s",
                      notification.entity->entity_name.c_str(), descriptor_->entity_name().c_str());
            load_all();
        }
    }
};

} // namespace tether
