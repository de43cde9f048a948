#pragma once

#include "polyglot/config/LanguageSettings.hpp"
#include "polyglot/core/Errors.hpp"
#include "polyglot/core/LanguageInfo.hpp"
#include "polyglot/core/PersistenceFormat.hpp"
#include "polyglot/core/TranslationStore.hpp"
#include "polyglot/engine/EngineRegistry.hpp"
#include "polyglot/engine/TranslationEngine.hpp"
#include "polyglot/model/Component.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace polyglot::language {

class LanguageServer;

/**
 * @brief Translates one component tree.
 *
 * The coordinator owns the engine and the runtime strings of its container.
 * Its file path is <root>/<language>/<container name><extension> whenever
 * both root and language are set; changing either one, the format, or the
 * file path itself reloads the tree. Nothing is loaded while the
 * coordinator is being constructed.
 *
 * The server, when given, must outlive the coordinator.
 */
class LanguageCoordinator {
public:
    using BeforeHandler = std::function<void(const model::Component &, const std::filesystem::path &, bool &allow)>;
    using AfterHandler = std::function<void(const model::Component &, const std::filesystem::path &)>;
    using ErrorHandler = std::function<void(const std::string &message)>;

    LanguageCoordinator(model::Component &container,
                        engine::EngineRegistry &registry,
                        LanguageServer *server = nullptr,
                        config::LanguageSettings settings = {});
    ~LanguageCoordinator();

    LanguageCoordinator(const LanguageCoordinator &) = delete;
    LanguageCoordinator &operator=(const LanguageCoordinator &) = delete;

    [[nodiscard]] model::Component &container() noexcept { return container_; }

    [[nodiscard]] const std::filesystem::path &rootPath() const noexcept { return rootPath_; }
    void setRootPath(std::filesystem::path rootPath);

    [[nodiscard]] const std::string &language() const noexcept { return language_; }
    // Throws ConfigurationError for an empty id.
    void setLanguage(std::string language);

    [[nodiscard]] const std::filesystem::path &filePath() const noexcept { return filePath_; }
    // Derives language and root from the path: <root>/<language>/<file>.
    void setFilePath(std::filesystem::path filePath);

    [[nodiscard]] core::PersistenceFormat format() const noexcept { return format_; }
    void setFormat(core::PersistenceFormat format);

    [[nodiscard]] const engine::EngineOptions &options() const noexcept { return options_; }
    void setOptions(engine::EngineOptions options);

    [[nodiscard]] bool isReady() const noexcept;

    // Return false when nothing was loaded or saved: not ready, cancelled,
    // or a failure reported through the error handler.
    bool load();
    bool load(model::Component &container, const std::filesystem::path &file);
    bool save();
    bool save(const model::Component &container, const std::filesystem::path &file);

    // Local runtime string, then the server's, then text itself.
    [[nodiscard]] std::string translate(const std::string &text) const;

    [[nodiscard]] const core::TranslationStore &strings() const noexcept { return strings_; }

    [[nodiscard]] const core::LanguageInfo &languageInfo() const noexcept { return languageInfo_; }
    void setLanguageInfo(core::LanguageInfo info);

    // Applies a server push as one transition followed by a single reload.
    void applyServerState(const std::string &language,
                          const std::filesystem::path &rootPath,
                          core::PersistenceFormat format);

    void onBeforeLoad(BeforeHandler handler) { beforeLoad_ = std::move(handler); }
    void onAfterLoad(AfterHandler handler) { afterLoad_ = std::move(handler); }
    void onBeforeSave(BeforeHandler handler) { beforeSave_ = std::move(handler); }
    void onAfterSave(AfterHandler handler) { afterSave_ = std::move(handler); }
    void onError(ErrorHandler handler) { error_ = std::move(handler); }

private:
    void recreateEngine();
    [[nodiscard]] bool ensureEngine();
    void updateFilePath();
    void reload();
    bool handleResult(const core::OperationResult &result);
    void reportError(const std::string &message) const;

    model::Component &container_;
    engine::EngineRegistry &registry_;
    LanguageServer *server_;

    std::filesystem::path rootPath_;
    std::string language_;
    std::filesystem::path filePath_;
    core::PersistenceFormat format_;
    engine::EngineOptions options_;
    bool suspendReload_{false};

    std::unique_ptr<engine::TranslationEngine> engine_;
    core::TranslationStore strings_;
    core::LanguageInfo languageInfo_;

    BeforeHandler beforeLoad_;
    AfterHandler afterLoad_;
    BeforeHandler beforeSave_;
    AfterHandler afterSave_;
    ErrorHandler error_;
};

} // namespace polyglot::language
