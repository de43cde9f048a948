#include "polyglot/language/LanguageServer.hpp"

#include "polyglot/language/LanguageCoordinator.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>

namespace polyglot::language {

LanguageServer::LanguageServer(engine::EngineRegistry &registry, core::PersistenceFormat format)
    : registry_(registry), format_(format) {}

void LanguageServer::registerClient(LanguageCoordinator &client) {
    std::lock_guard lock(mutex_);
    if (std::find(clients_.begin(), clients_.end(), &client) != clients_.end()) {
        return;
    }

    clients_.push_back(&client);
    if (!canSync()) {
        return;
    }

    // A client whose first load throws is not kept; its constructor may be unwinding.
    try {
        client.applyServerState(language_, rootPath_, format_);
        client.setLanguageInfo(languageInfo_);
    } catch (...) {
        clients_.erase(std::remove(clients_.begin(), clients_.end(), &client), clients_.end());
        throw;
    }
}

void LanguageServer::unregisterClient(LanguageCoordinator &client) {
    std::lock_guard lock(mutex_);
    clients_.erase(std::remove(clients_.begin(), clients_.end(), &client), clients_.end());
}

bool LanguageServer::isRegistered(const LanguageCoordinator &client) const {
    std::lock_guard lock(mutex_);
    return std::find(clients_.begin(), clients_.end(), &client) != clients_.end();
}

std::size_t LanguageServer::clientCount() const {
    std::lock_guard lock(mutex_);
    return clients_.size();
}

std::string LanguageServer::language() const {
    std::lock_guard lock(mutex_);
    return language_;
}

void LanguageServer::setLanguage(std::string language) {
    std::lock_guard lock(mutex_);
    if (language == language_) {
        return;
    }

    language_ = std::move(language);
    updateData();
}

std::filesystem::path LanguageServer::rootPath() const {
    std::lock_guard lock(mutex_);
    return rootPath_;
}

void LanguageServer::setRootPath(std::filesystem::path rootPath) {
    std::lock_guard lock(mutex_);
    if (rootPath == rootPath_) {
        return;
    }

    rootPath_ = std::move(rootPath);
    updateData();
}

core::PersistenceFormat LanguageServer::format() const {
    std::lock_guard lock(mutex_);
    return format_;
}

void LanguageServer::setFormat(core::PersistenceFormat format) {
    std::lock_guard lock(mutex_);
    if (format == format_) {
        return;
    }

    format_ = format;
    engine_.reset();
    {
        std::unique_lock storeLock(storeMutex_);
        strings_.clear();
    }
    updateData();
}

core::LanguageInfo LanguageServer::languageInfo() const {
    std::lock_guard lock(mutex_);
    return languageInfo_;
}

bool LanguageServer::canSync() const {
    std::lock_guard lock(mutex_);
    if (language_.empty() || rootPath_.empty()) {
        return false;
    }

    std::error_code error;
    return std::filesystem::is_directory(languageFolder(), error);
}

std::string LanguageServer::translate(const std::string &text) const {
    if (text.empty()) {
        return text;
    }

    std::shared_lock lock(storeMutex_);
    if (auto value = strings_.tryGet(text)) {
        return *value;
    }
    return text;
}

void LanguageServer::onLanguageChanged(ChangeHandler handler) {
    std::lock_guard lock(mutex_);
    changed_ = std::move(handler);
}

void LanguageServer::updateData() {
    std::lock_guard lock(mutex_);
    if (!canSync()) {
        return;
    }

    if (!engine_) {
        engine_ = registry_.create(format_);
    }

    importRuntimeStrings();

    // Handlers may destroy other clients while being synchronized, so every
    // pointer of the snapshot is checked against the live list before use.
    const auto clients = clients_;
    for (auto *client : clients) {
        if (isLiveClient(client)) {
            client->applyServerState(language_, rootPath_, format_);
        }
    }

    readLanguageInfo();
    for (auto *client : clients) {
        if (isLiveClient(client)) {
            client->setLanguageInfo(languageInfo_);
        }
    }

    if (changed_) {
        changed_(language_, rootPath_);
    }
}

bool LanguageServer::isLiveClient(const LanguageCoordinator *client) const {
    return std::find(clients_.begin(), clients_.end(), client) != clients_.end();
}

std::filesystem::path LanguageServer::languageFolder() const {
    return rootPath_ / language_;
}

std::filesystem::path LanguageServer::reservedFile(const char *baseName) const {
    return languageFolder() / (std::string{baseName} + std::string{core::fileExtension(format_)});
}

void LanguageServer::importRuntimeStrings() {
    const auto file = reservedFile(kRuntimeFileName);

    core::TranslationStore loaded;
    if (std::filesystem::exists(file)) {
        const auto result = engine_->load(nullptr, file, &loaded);
        if (!result.succeeded()) {
            std::cerr << "[Polyglot] Unable to import runtime strings: " << result.message << '\n';
        }
    }

    std::unique_lock storeLock(storeMutex_);
    strings_ = std::move(loaded);
}

void LanguageServer::readLanguageInfo() {
    const auto file = reservedFile(kMetadataFileName);
    if (!std::filesystem::exists(file)) {
        languageInfo_ = {};
        return;
    }

    languageInfo_ = engine_->readLanguageInfo(file);
}

} // namespace polyglot::language
