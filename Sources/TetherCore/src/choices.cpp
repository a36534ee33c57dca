#include "tether/choices.hpp"
#include "tether/log.hpp"

namespace tether {

choice_list choice_list::load(repository& repo, const entity_descriptor& descriptor,
                              const std::string& property) {
    const auto* target = descriptor.references(property);
    if (!target) {
        return {};
    }

    auto target_descriptor = repo.factory().derive(*target);
    bool has_name = target_descriptor->property("name") != nullptr;

    std::vector<choice> choices;
    for (const auto& vm : repo.fetch_all(target_descriptor)) {
        // Stored rows always carry a key
        primary_key_t key = vm->key().value_or(0);
        std::string label = has_name ? format_value(vm->get("name")) : std::to_string(key);
        choices.push_back({std::move(label), key});
    }
    LOG_DEBUG("choices", "%zu choices for %s.%s", choices.size(),
              descriptor.entity_name().c_str(), property.c_str());
    return choice_list(std::move(choices));
}

std::optional<size_t> choice_list::index_of(primary_key_t key) const {
    for (size_t i = 0; i < choices_.size(); ++i) {
        if (choices_[i].key == key) return i;
    }
    return std::nullopt;
}

std::vector<std::string> choice_list::labels() const {
    std::vector<std::string> result;
    result.reserve(choices_.size());
    for (const auto& c : choices_) {
        result.push_back(c.label);
    }
    return result;
}

} // namespace tether
