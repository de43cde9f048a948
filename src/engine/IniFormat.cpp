#include "polyglot/engine/IniFormat.hpp"

#include "polyglot/core/KeyEncoder.hpp"
#include "polyglot/engine/QualifiedName.hpp"
#include "polyglot/info/IniLanguageInfoLoader.hpp"

#include <algorithm>
#include <cctype>

namespace polyglot::engine {

namespace {

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
               return std::tolower(a) == std::tolower(b);
           });
}

} // namespace

IniFormat::IniFormat(Layout layout) : layout_(layout) {}

core::PersistenceFormat IniFormat::format() const noexcept {
    return layout_ == Layout::Flat ? core::PersistenceFormat::IniFlat : core::PersistenceFormat::Ini;
}

void IniFormat::deserialize(const EligibilityRules &rules,
                            model::Component *root,
                            const std::filesystem::path &file,
                            core::TranslationStore &strings) const {
    const auto document = IniDocument::fromFile(file);

    for (const auto &section : document.sections()) {
        if (equalsIgnoreCase(section, kStringsSection)) {
            for (const auto &[key, value] : document.sectionValues(section)) {
                strings.setRaw(core::KeyEncoder::denormalizeKey(key), core::KeyEncoder::restoreMultiline(value));
            }
            continue;
        }

        if (root == nullptr) {
            continue;
        }

        if (layout_ == Layout::Flat) {
            if (equalsIgnoreCase(section, kFlatSection)) {
                readFlatSection(rules, *root, document);
            }
            continue;
        }

        readSection(rules, *root, document, section);
    }
}

void IniFormat::serialize(const EligibilityRules &rules,
                          const model::Component &root,
                          const std::filesystem::path &file) const {
    // Existing content is kept so runtime strings and unknown sections survive.
    auto document = std::filesystem::exists(file) ? IniDocument::fromFile(file) : IniDocument{};

    writeComponent(rules, root, root, document);
    document.saveToFile(file);
}

std::unique_ptr<core::LanguageInfoLoader> IniFormat::createInfoLoader() const {
    return std::make_unique<info::IniLanguageInfoLoader>();
}

void IniFormat::writeComponent(const EligibilityRules &rules,
                               const model::Component &component,
                               const model::Component &root,
                               IniDocument &document) const {
    if (!rules.isEligibleType(&component)) {
        return;
    }

    const auto qualifiedName = component.qualifiedName(root);
    if (component.name().empty() || qualifiedName.empty()) {
        return;
    }

    for (const auto &attribute : component.type().attributes) {
        if (attribute.type == model::AttributeType::TextList || !rules.shouldPersist(attribute, component)) {
            continue;
        }

        auto value = encodeAttribute(attribute, component);
        if (!value) {
            continue;
        }

        if (layout_ == Layout::Flat) {
            document.write(kFlatSection, core::KeyEncoder::normalizeKey(qualifiedName + "." + attribute.name),
                           std::move(*value));
        } else {
            document.write(qualifiedName, core::KeyEncoder::normalizeKey(attribute.name), std::move(*value));
        }
    }

    for (const auto &child : component.components()) {
        writeComponent(rules, *child, root, document);
    }
}

void IniFormat::readSection(const EligibilityRules &rules,
                            model::Component &root,
                            const IniDocument &document,
                            const std::string &section) const {
    auto *component = resolveQualifiedName(root, section);
    if (!rules.isEligibleType(component)) {
        return;
    }

    for (const auto &[key, value] : document.sectionValues(section)) {
        applyAttribute(rules, *component, core::KeyEncoder::denormalizeKey(key), value);
    }
}

void IniFormat::readFlatSection(const EligibilityRules &rules,
                                model::Component &root,
                                const IniDocument &document) const {
    for (const auto &[key, value] : document.sectionValues(kFlatSection)) {
        const auto fullKey = core::KeyEncoder::denormalizeKey(key);
        const auto separator = fullKey.rfind('.');
        if (separator == std::string::npos || separator == 0) {
            continue;
        }

        auto *component = resolveQualifiedName(root, std::string_view{fullKey}.substr(0, separator));
        if (!rules.isEligibleType(component)) {
            continue;
        }
        applyAttribute(rules, *component, std::string_view{fullKey}.substr(separator + 1), value);
    }
}

} // namespace polyglot::engine
