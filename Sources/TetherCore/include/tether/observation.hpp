#pragma once

#include "schema.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace tether {

// ============================================================================
// collection_change - Describes one change to an ordered collection
// ============================================================================

struct collection_change {
    /// Indices (before the change) of items that were removed
    std::vector<uint64_t> deletions;

    /// Indices (after the change) of items that were inserted
    std::vector<uint64_t> insertions;

    /// Indices of items whose contents changed in place
    std::vector<uint64_t> modifications;

    /// Returns true if no changes occurred
    [[nodiscard]] bool empty() const noexcept {
        return deletions.empty() && insertions.empty() && modifications.empty();
    }
};

// ============================================================================
// notification_token - Retains an observation until destroyed (move-only)
// ============================================================================

class notification_token {
public:
    notification_token() = default;

    explicit notification_token(std::function<void()> unregister_fn)
        : unregister_(std::move(unregister_fn)) {}

    ~notification_token() {
        unregister();
    }

    notification_token(const notification_token&) = delete;
    notification_token& operator=(const notification_token&) = delete;

    notification_token(notification_token&& other) noexcept
        : unregister_(std::move(other.unregister_)) {
        other.unregister_ = nullptr;
    }

    notification_token& operator=(notification_token&& other) noexcept {
        if (this != &other) {
            unregister();
            unregister_ = std::move(other.unregister_);
            other.unregister_ = nullptr;
        }
        return *this;
    }

    /// Explicitly unregister the observation
    void unregister() {
        if (unregister_) {
            auto fn = std::move(unregister_);
            unregister_ = nullptr;
            fn();
        }
    }

    /// Returns true if this token still holds an active observation
    [[nodiscard]] bool is_valid() const noexcept {
        return unregister_ != nullptr;
    }

    explicit operator bool() const noexcept {
        return is_valid();
    }

private:
    std::function<void()> unregister_;
};

// ============================================================================
// observer_list - ordered callbacks keyed by registration id
// ============================================================================
//
// Delivery walks a snapshot of the ids, so callbacks may register or
// unregister observers while being notified. An observer removed before its
// turn is skipped; one added during delivery waits for the next notify.

template<typename... Args>
class observer_list {
public:
    using callback_t = std::function<void(Args...)>;
    using observer_id = uint64_t;

    observer_list() : state_(std::make_shared<state>()) {}

    observer_list(const observer_list&) = delete;
    observer_list& operator=(const observer_list&) = delete;

    notification_token add(callback_t callback) {
        auto id = state_->next_id++;
        state_->callbacks.emplace(id, std::make_shared<callback_t>(std::move(callback)));
        std::weak_ptr<state> weak = state_;
        return notification_token([weak, id] {
            if (auto s = weak.lock()) {
                s->callbacks.erase(id);
            }
        });
    }

    void notify(Args... args) const {
        std::vector<observer_id> ids;
        ids.reserve(state_->callbacks.size());
        for (const auto& [id, _] : state_->callbacks) {
            ids.push_back(id);
        }

        // Keep the state alive even if the owner goes away mid-delivery
        auto keep = state_;
        for (auto id : ids) {
            auto it = keep->callbacks.find(id);
            if (it == keep->callbacks.end()) continue;
            auto callback = it->second;
            (*callback)(args...);
        }
    }

    size_t size() const { return state_->callbacks.size(); }
    bool empty() const { return state_->callbacks.empty(); }

private:
    struct state {
        observer_id next_id = 1;
        // Ordered by id, which is registration order
        std::map<observer_id, std::shared_ptr<callback_t>> callbacks;
    };

    std::shared_ptr<state> state_;
};

// ============================================================================
// Change notifications
// ============================================================================

/// "The stored rows of this entity type changed." No diff, no row ids.
struct change_notification {
    const entity_schema* entity = nullptr;

    template<typename E>
    bool is() const { return entity == &entity_traits<E>::schema(); }
};

/// Broadcasts change notifications. Owned by the application's composition
/// root and handed to every repository that should publish into it.
class event_bus {
public:
    using callback_t = std::function<void(const change_notification&)>;

    event_bus() = default;

    event_bus(const event_bus&) = delete;
    event_bus& operator=(const event_bus&) = delete;

    /// Subscribers are called synchronously, in subscription order, until
    /// the returned token is destroyed or unregistered.
    [[nodiscard]] notification_token subscribe(callback_t callback);

    void publish(const change_notification& notification) const;

    size_t subscriber_count() const { return subscribers_.size(); }

private:
    observer_list<const change_notification&> subscribers_;
};

} // namespace tether
