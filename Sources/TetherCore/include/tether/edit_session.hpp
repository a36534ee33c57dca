#pragma once

#include "choices.hpp"
#include "observable_collection.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace tether {

// ============================================================================
// edit_session - tracks the rows of a collection edited since the last save
// ============================================================================

template<typename E>
class edit_session {
public:
    explicit edit_session(observable_collection<E>& collection)
        : collection_(collection) {}

    edit_session(const edit_session&) = delete;
    edit_session& operator=(const edit_session&) = delete;

    /// Append an empty row to the collection; it is saved with the next save()
    view_model_ptr add_row(const property_init& init = {}) {
        repository& repo = collection_.repo();
        auto vm = repo.factory().create<E>(init);
        collection_.append(vm);
        track(vm);
        return vm;
    }

    void edit(const view_model_ptr& vm, const std::string& property, property_value_t value) {
        vm->set(property, std::move(value));
        track(vm);
    }

    /// Set from user text (digits only for integers, otherwise 0)
    void edit_text(const view_model_ptr& vm, const std::string& property, const std::string& text) {
        vm->set_text(property, text);
        track(vm);
    }

    void select_choice(const view_model_ptr& vm, const std::string& property,
                       const choice_list& choices, size_t index) {
        vm->set(property, property_value_t{static_cast<int64_t>(choices.key_at(index))});
        track(vm);
    }

    /// Delete the rows at `positions` and stop tracking them
    void remove_rows(const std::vector<size_t>& positions) {
        std::vector<view_model_ptr> doomed;
        for (auto position : positions) {
            const auto& vm = collection_.at(position);
            if (std::find(doomed.begin(), doomed.end(), vm) == doomed.end()) {
                doomed.push_back(vm);
            }
        }
        if (doomed.empty()) return;

        collection_.delete_items(doomed);
        for (const auto& vm : doomed) {
            untrack(*vm);
        }
    }

    /// Save every tracked row. Tracking survives a failed save.
    void save() {
        if (tracked_.empty()) return;
        collection_.save_items(tracked_);
        tracked_.clear();
    }

    size_t pending_count() const { return tracked_.size(); }

    bool is_tracked(const view_model& vm) const {
        return std::any_of(tracked_.begin(), tracked_.end(),
                           [&](const view_model_ptr& t) { return t->handle() == vm.handle(); });
    }

    const std::vector<view_model_ptr>& tracked() const { return tracked_; }

private:
    observable_collection<E>& collection_;
    std::vector<view_model_ptr> tracked_;  // insertion order, one entry per handle

    void track(const view_model_ptr& vm) {
        if (!is_tracked(*vm)) {
            tracked_.push_back(vm);
        }
    }

    void untrack(const view_model& vm) {
        tracked_.erase(std::remove_if(tracked_.begin(), tracked_.end(),
                                      [&](const view_model_ptr& t) { return t->handle() == vm.handle(); }),
                       tracked_.end());
    }
};

} // namespace tether
