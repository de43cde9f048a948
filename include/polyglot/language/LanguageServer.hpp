#pragma once

#include "polyglot/core/LanguageInfo.hpp"
#include "polyglot/core/PersistenceFormat.hpp"
#include "polyglot/core/TranslationStore.hpp"
#include "polyglot/engine/EngineRegistry.hpp"
#include "polyglot/engine/TranslationEngine.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace polyglot::language {

class LanguageCoordinator;

/**
 * @brief Shared language state for every coordinator of a process.
 *
 * Create one server at startup and hand it to the coordinators. Whenever the
 * language or root changes and <root>/<language> exists, the server:
 *  1. loads runtime<ext> into its shared store,
 *  2. pushes language, root and format to every client,
 *  3. reads lang<ext> metadata,
 *  4. pushes the metadata to every client,
 *  5. fires the change handler.
 * All steps run on the calling thread before the setter returns.
 */
class LanguageServer {
public:
    using ChangeHandler = std::function<void(const std::string &language, const std::filesystem::path &rootPath)>;

    static constexpr char kRuntimeFileName[] = "runtime";
    static constexpr char kMetadataFileName[] = "lang";

    explicit LanguageServer(engine::EngineRegistry &registry,
                            core::PersistenceFormat format = core::PersistenceFormat::Ini);

    LanguageServer(const LanguageServer &) = delete;
    LanguageServer &operator=(const LanguageServer &) = delete;

    // Adding a client twice has no effect. A new client is synchronized at once when canSync().
    void registerClient(LanguageCoordinator &client);
    void unregisterClient(LanguageCoordinator &client);
    [[nodiscard]] bool isRegistered(const LanguageCoordinator &client) const;
    [[nodiscard]] std::size_t clientCount() const;

    [[nodiscard]] std::string language() const;
    void setLanguage(std::string language);

    [[nodiscard]] std::filesystem::path rootPath() const;
    void setRootPath(std::filesystem::path rootPath);

    [[nodiscard]] core::PersistenceFormat format() const;
    void setFormat(core::PersistenceFormat format);

    [[nodiscard]] core::LanguageInfo languageInfo() const;

    // Language and root are set and <root>/<language> is a directory.
    [[nodiscard]] bool canSync() const;

    // Shared runtime string for text, or text itself.
    [[nodiscard]] std::string translate(const std::string &text) const;

    void onLanguageChanged(ChangeHandler handler);

    void updateData();

private:
    [[nodiscard]] bool isLiveClient(const LanguageCoordinator *client) const;
    [[nodiscard]] std::filesystem::path languageFolder() const;
    [[nodiscard]] std::filesystem::path reservedFile(const char *baseName) const;
    void importRuntimeStrings();
    void readLanguageInfo();

    engine::EngineRegistry &registry_;

    mutable std::recursive_mutex mutex_;
    std::string language_;
    std::filesystem::path rootPath_;
    core::PersistenceFormat format_;
    std::unique_ptr<engine::TranslationEngine> engine_;
    std::vector<LanguageCoordinator *> clients_;
    core::LanguageInfo languageInfo_;
    ChangeHandler changed_;

    mutable std::shared_mutex storeMutex_;
    core::TranslationStore strings_;
};

} // namespace polyglot::language
