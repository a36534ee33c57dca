#pragma once

#include "repository.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tether {

// ============================================================================
// choice_list - selectable rows of a foreign-key target
// ============================================================================

struct choice {
    std::string label;
    primary_key_t key = 0;
};

class choice_list {
public:
    using const_iterator = std::vector<choice>::const_iterator;

    choice_list() = default;
    explicit choice_list(std::vector<choice> choices) : choices_(std::move(choices)) {}

    /// Every stored row of the type `property` references, labelled by its
    /// `name` property or else its key. Empty for a property that is not a
    /// resolved foreign key.
    static choice_list load(repository& repo, const entity_descriptor& descriptor,
                            const std::string& property);

    size_t size() const { return choices_.size(); }
    bool empty() const { return choices_.empty(); }

    const choice& at(size_t index) const { return choices_.at(index); }
    primary_key_t key_at(size_t index) const { return choices_.at(index).key; }
    std::optional<size_t> index_of(primary_key_t key) const;
    std::vector<std::string> labels() const;

    const_iterator begin() const { return choices_.begin(); }
    const_iterator end() const { return choices_.end(); }

private:
    std::vector<choice> choices_;
};

} // namespace tether
