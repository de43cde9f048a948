#pragma once

#include "polyglot/engine/FormatStrategy.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace polyglot::engine {

/**
 * @brief JSON language files.
 *
 * Components are stored as nested objects below the root's name; attribute
 * values are strings and list attributes are joined with the list separator.
 * Runtime strings live in the top-level "Strings" object.
 * @code
 * {
 *   "Strings": {"1A4F710F": "Bonjour"},
 *   "Form1": {"Caption": "Main", "Button1": {"Caption": "OK"}}
 * }
 * @endcode
 */
class JsonFormat : public FormatStrategy {
public:
    static constexpr std::string_view kStringsKey{"Strings"};

    [[nodiscard]] core::PersistenceFormat format() const noexcept override;

    void deserialize(const EligibilityRules &rules,
                     model::Component *root,
                     const std::filesystem::path &file,
                     core::TranslationStore &strings) const override;

    void serialize(const EligibilityRules &rules,
                   const model::Component &root,
                   const std::filesystem::path &file) const override;

    [[nodiscard]] std::unique_ptr<core::LanguageInfoLoader> createInfoLoader() const override;

private:
    using Json = nlohmann::ordered_json;

    [[nodiscard]] Json writeComponent(const EligibilityRules &rules, const model::Component &component) const;
    void readComponent(const EligibilityRules &rules,
                       model::Component &root,
                       const std::string &path,
                       const Json &object) const;
};

} // namespace polyglot::engine
