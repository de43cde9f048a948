#pragma once

#include "polyglot/core/Errors.hpp"
#include "polyglot/core/LanguageInfo.hpp"
#include "polyglot/core/PersistenceFormat.hpp"
#include "polyglot/core/TranslationStore.hpp"
#include "polyglot/engine/Eligibility.hpp"
#include "polyglot/engine/FormatStrategy.hpp"
#include "polyglot/model/Component.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace polyglot::engine {

/**
 * @brief Loads and saves the translatable attributes of a component tree.
 *
 * The engine owns the policy shared by every format (file existence,
 * automatic creation, eligibility, runtime dictionary) and delegates the
 * file layout to its FormatStrategy.
 */
class TranslationEngine {
public:
    explicit TranslationEngine(std::unique_ptr<FormatStrategy> strategy);

    [[nodiscard]] core::PersistenceFormat format() const noexcept;

    [[nodiscard]] EngineOptions &options() noexcept { return options_; }
    [[nodiscard]] const EngineOptions &options() const noexcept { return options_; }
    void setOptions(EngineOptions options);

    // Reads file into container's tree and, when store is set, copies the
    // runtime strings into it. A missing file is created first when
    // createIfMissing is enabled and a container is given.
    core::OperationResult load(model::Component *container,
                               const std::filesystem::path &file,
                               core::TranslationStore *store = nullptr);

    core::OperationResult save(const model::Component &container, const std::filesystem::path &file) const;

    // Runtime string from the last load, or text itself. Never throws on a miss.
    [[nodiscard]] std::string translate(const std::string &text) const;

    [[nodiscard]] core::LanguageInfo readLanguageInfo(const std::filesystem::path &file) const;

    [[nodiscard]] const core::TranslationStore &runtimeStrings() const noexcept { return runtime_; }

private:
    void ensureDirectory(const std::filesystem::path &file) const;

    std::unique_ptr<FormatStrategy> strategy_;
    EngineOptions options_;
    core::TranslationStore runtime_;
};

} // namespace polyglot::engine
