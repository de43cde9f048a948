#include "polyglot/core/TranslationStore.hpp"

#include "polyglot/core/KeyEncoder.hpp"

namespace polyglot::core {

void TranslationStore::clear() {
    items_.clear();
}

void TranslationStore::set(std::string_view original, std::string value) {
    items_[KeyEncoder::makeKey(original)] = std::move(value);
}

void TranslationStore::setRaw(std::string hashedKey, std::string value) {
    items_[std::move(hashedKey)] = std::move(value);
}

std::optional<std::string> TranslationStore::tryGet(std::string_view original) const {
    auto it = items_.find(KeyEncoder::makeKey(original));
    if (it == items_.end()) {
        return std::nullopt;
    }

    return it->second;
}

bool TranslationStore::contains(std::string_view original) const {
    return items_.find(KeyEncoder::makeKey(original)) != items_.end();
}

void TranslationStore::merge(const TranslationStore &other) {
    for (const auto &pair : other.items_) {
        items_[pair.first] = pair.second;
    }
}

bool TranslationStore::isEmpty() const noexcept {
    return items_.empty();
}

std::size_t TranslationStore::size() const noexcept {
    return items_.size();
}

} // namespace polyglot::core
