#pragma once

#include "polyglot/model/Component.hpp"
#include "polyglot/model/TypeDescriptor.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace polyglot::engine {

struct EngineOptions {
    bool createIfMissing{false};
    bool excludeOnAction{false};
    std::vector<std::string> excludedTypes;
    std::vector<std::string> excludedAttributes;
};

/**
 * @brief Decides which attributes an engine reads and writes.
 *
 * Eligibility is checked on two levels:
 *  - structural: the attribute is published, string-typed, readable, writable
 *    and is not the identity attribute. Only the declaration is inspected.
 *  - contextual: the attribute name is not excluded and, when
 *    excludeOnAction is set, the attribute is not one an action supplies.
 *
 * Saving ignores the action rule, so a file always holds every value a
 * later load could apply.
 */
class EligibilityRules {
public:
    explicit EligibilityRules(const EngineOptions &options);

    [[nodiscard]] static bool isTranslatable(const model::AttributeDescriptor &attribute) noexcept;
    [[nodiscard]] static bool isActionManaged(std::string_view attributeName) noexcept;

    [[nodiscard]] bool isEligibleType(const model::Component *component) const;
    [[nodiscard]] bool shouldPersist(const model::AttributeDescriptor &attribute,
                                     const model::Component &component) const;
    [[nodiscard]] bool shouldTranslate(const model::AttributeDescriptor &attribute,
                                       const model::Component &component) const;

private:
    [[nodiscard]] bool isExcludedAttribute(std::string_view attributeName) const;

    const EngineOptions &options_;
};

// Stored form of an attribute value, or nullopt when it must not be written.
[[nodiscard]] std::optional<std::string> encodeAttribute(const model::AttributeDescriptor &attribute,
                                                         const model::Component &component);

// Applies a stored value when the rules allow it. Returns true if the attribute was written.
bool applyAttribute(const EligibilityRules &rules,
                    model::Component &component,
                    std::string_view attributeName,
                    std::string_view storedValue);

} // namespace polyglot::engine
