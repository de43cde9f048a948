#include "polyglot/engine/Eligibility.hpp"

#include "polyglot/core/KeyEncoder.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace polyglot::engine {

namespace {

constexpr std::array<std::string_view, 3> kActionManagedAttributes{"Caption", "Hint", "Text"};

// Value written for menu separators; never worth translating.
constexpr std::string_view kSeparatorValue{"-"};

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
               return std::tolower(a) == std::tolower(b);
           });
}

bool containsIgnoreCase(const std::vector<std::string> &names, std::string_view name) {
    return std::any_of(names.begin(), names.end(), [name](const std::string &entry) {
        return equalsIgnoreCase(entry, name);
    });
}

std::vector<std::string> splitList(std::string_view stored) {
    std::vector<std::string> items;
    if (stored.empty()) {
        return items;
    }

    const auto separator = core::KeyEncoder::kListSeparator;
    std::size_t current = 0;
    while (true) {
        const auto position = stored.find(separator, current);
        if (position == std::string_view::npos) {
            items.push_back(core::KeyEncoder::unescape(stored.substr(current)));
            break;
        }
        items.push_back(core::KeyEncoder::unescape(stored.substr(current, position - current)));
        current = position + separator.size();
    }
    return items;
}

} // namespace

EligibilityRules::EligibilityRules(const EngineOptions &options) : options_(options) {}

bool EligibilityRules::isTranslatable(const model::AttributeDescriptor &attribute) noexcept {
    return attribute.published && attribute.isStringTyped() && attribute.isReadable() && attribute.isWritable() &&
           attribute.name != model::kNameAttribute;
}

bool EligibilityRules::isActionManaged(std::string_view attributeName) noexcept {
    return std::find(kActionManagedAttributes.begin(), kActionManagedAttributes.end(), attributeName) !=
           kActionManagedAttributes.end();
}

bool EligibilityRules::isEligibleType(const model::Component *component) const {
    return component != nullptr && !containsIgnoreCase(options_.excludedTypes, component->typeName());
}

bool EligibilityRules::shouldPersist(const model::AttributeDescriptor &attribute,
                                     const model::Component &) const {
    return isTranslatable(attribute) && !isExcludedAttribute(attribute.name);
}

bool EligibilityRules::shouldTranslate(const model::AttributeDescriptor &attribute,
                                       const model::Component &component) const {
    if (!shouldPersist(attribute, component)) {
        return false;
    }

    return !(options_.excludeOnAction && component.hasAction() && isActionManaged(attribute.name));
}

bool EligibilityRules::isExcludedAttribute(std::string_view attributeName) const {
    return containsIgnoreCase(options_.excludedAttributes, attributeName);
}

std::optional<std::string> encodeAttribute(const model::AttributeDescriptor &attribute,
                                           const model::Component &component) {
    if (attribute.type == model::AttributeType::TextList) {
        std::string joined;
        bool first = true;
        for (const auto &item : attribute.readList(component)) {
            if (!first) {
                joined.append(core::KeyEncoder::kListSeparator);
            }
            joined.append(core::KeyEncoder::escape(item));
            first = false;
        }
        return joined;
    }

    auto value = core::KeyEncoder::joinMultiline(attribute.readText(component));
    if (value == kSeparatorValue) {
        return std::nullopt;
    }
    return value;
}

bool applyAttribute(const EligibilityRules &rules,
                    model::Component &component,
                    std::string_view attributeName,
                    std::string_view storedValue) {
    const auto *attribute = component.type().find(attributeName);
    if (attribute == nullptr || !rules.shouldTranslate(*attribute, component)) {
        return false;
    }

    if (attribute->type == model::AttributeType::TextList) {
        attribute->writeList(component, splitList(storedValue));
    } else {
        attribute->writeText(component, core::KeyEncoder::restoreMultiline(storedValue));
    }
    return true;
}

} // namespace polyglot::engine
