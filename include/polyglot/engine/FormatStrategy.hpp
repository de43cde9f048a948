#pragma once

#include "polyglot/core/LanguageInfo.hpp"
#include "polyglot/core/PersistenceFormat.hpp"
#include "polyglot/core/TranslationStore.hpp"
#include "polyglot/engine/Eligibility.hpp"
#include "polyglot/model/Component.hpp"

#include <filesystem>
#include <memory>

namespace polyglot::engine {

/**
 * @brief File-format specific half of a translation engine.
 *
 * Implementations only convert between a file and a component tree; file
 * existence, directory creation and the runtime dictionary are handled by
 * TranslationEngine. Read, write and parse errors propagate to the caller.
 */
class FormatStrategy {
public:
    virtual ~FormatStrategy() = default;

    [[nodiscard]] virtual core::PersistenceFormat format() const noexcept = 0;

    // Applies eligible values onto root's tree (when root is set) and
    // collects the runtime strings of the file into strings.
    virtual void deserialize(const EligibilityRules &rules,
                             model::Component *root,
                             const std::filesystem::path &file,
                             core::TranslationStore &strings) const = 0;

    virtual void serialize(const EligibilityRules &rules,
                           const model::Component &root,
                           const std::filesystem::path &file) const = 0;

    [[nodiscard]] virtual std::unique_ptr<core::LanguageInfoLoader> createInfoLoader() const = 0;
};

} // namespace polyglot::engine
