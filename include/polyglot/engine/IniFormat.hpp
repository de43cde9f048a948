#pragma once

#include "polyglot/engine/FormatStrategy.hpp"
#include "polyglot/engine/IniDocument.hpp"

#include <string_view>

namespace polyglot::engine {

/**
 * @brief INI language files.
 *
 * Hierarchical layout writes one section per component, named after its
 * qualified name:
 * @code
 * [Form1.Button1]
 * Caption=OK
 * @endcode
 * Flat layout writes every value into the single UIElements section with
 * "QualifiedName.Attribute" keys. Both keep runtime strings in [strings].
 * List attributes are not stored in INI files.
 */
class IniFormat : public FormatStrategy {
public:
    enum class Layout {
        Hierarchical,
        Flat,
    };

    static constexpr std::string_view kStringsSection{"strings"};
    static constexpr std::string_view kFlatSection{"UIElements"};

    explicit IniFormat(Layout layout);

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
    void writeComponent(const EligibilityRules &rules,
                        const model::Component &component,
                        const model::Component &root,
                        IniDocument &document) const;
    void readSection(const EligibilityRules &rules,
                     model::Component &root,
                     const IniDocument &document,
                     const std::string &section) const;
    void readFlatSection(const EligibilityRules &rules, model::Component &root, const IniDocument &document) const;

    Layout layout_;
};

} // namespace polyglot::engine
