#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace polyglot::core {

/**
 * @brief In-memory table of runtime translations.
 *
 * Entries are keyed by KeyEncoder::makeKey of the untranslated text. Callers
 * always pass the original text; setRaw() is reserved for readers that
 * already hold a hashed key taken from a language file.
 */
class TranslationStore {
public:
    void clear();

    void set(std::string_view original, std::string value);
    void setRaw(std::string hashedKey, std::string value);

    [[nodiscard]] std::optional<std::string> tryGet(std::string_view original) const;
    [[nodiscard]] bool contains(std::string_view original) const;

    // Copies every entry of other, replacing values with equal keys.
    void merge(const TranslationStore &other);

    [[nodiscard]] bool isEmpty() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

private:
    std::unordered_map<std::string, std::string> items_;
};

} // namespace polyglot::core
