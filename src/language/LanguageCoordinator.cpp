#include "polyglot/language/LanguageCoordinator.hpp"

#include "polyglot/language/LanguageServer.hpp"

#include <iostream>

namespace polyglot::language {

LanguageCoordinator::LanguageCoordinator(model::Component &container,
                                         engine::EngineRegistry &registry,
                                         LanguageServer *server,
                                         config::LanguageSettings settings)
    : container_(container),
      registry_(registry),
      server_(server),
      rootPath_(std::move(settings.rootPath)),
      language_(std::move(settings.language)),
      format_(settings.format),
      options_(settings.engineOptions()) {
    if (container_.name().empty()) {
        throw core::ConfigurationError("Language coordinator requires a named container");
    }

    suspendReload_ = true;
    recreateEngine();
    updateFilePath();
    suspendReload_ = false;

    if (server_ != nullptr && settings.registerOnStart) {
        server_->registerClient(*this);
    }
}

LanguageCoordinator::~LanguageCoordinator() {
    if (server_ != nullptr) {
        server_->unregisterClient(*this);
    }
}

void LanguageCoordinator::setRootPath(std::filesystem::path rootPath) {
    rootPath_ = std::move(rootPath);
    updateFilePath();
}

void LanguageCoordinator::setLanguage(std::string language) {
    if (language.empty()) {
        throw core::ConfigurationError("Language id must not be empty");
    }

    language_ = std::move(language);
    updateFilePath();
}

void LanguageCoordinator::setFilePath(std::filesystem::path filePath) {
    filePath_ = std::move(filePath);

    const auto folder = filePath_.parent_path();
    language_ = folder.filename().string();
    rootPath_ = folder.parent_path();
    reload();
}

void LanguageCoordinator::setFormat(core::PersistenceFormat format) {
    if (format == format_ && engine_) {
        return;
    }

    format_ = format;
    recreateEngine();

    const bool suspended = suspendReload_;
    suspendReload_ = true;
    updateFilePath();
    suspendReload_ = suspended;
    reload();
}

void LanguageCoordinator::setOptions(engine::EngineOptions options) {
    options_ = std::move(options);
    if (engine_) {
        engine_->setOptions(options_);
    }
}

bool LanguageCoordinator::isReady() const noexcept {
    return engine_ != nullptr && !filePath_.empty();
}

bool LanguageCoordinator::load() {
    return load(container_, filePath_);
}

bool LanguageCoordinator::load(model::Component &container, const std::filesystem::path &file) {
    if (file.empty()) {
        return false;
    }
    if (!ensureEngine()) {
        return false;
    }

    bool allow = true;
    if (beforeLoad_) {
        beforeLoad_(container, file, allow);
    }
    if (!allow) {
        return false;
    }

    strings_.clear();
    if (!handleResult(engine_->load(&container, file, &strings_))) {
        return false;
    }

    if (afterLoad_) {
        afterLoad_(container, file);
    }
    return true;
}

bool LanguageCoordinator::save() {
    return save(container_, filePath_);
}

bool LanguageCoordinator::save(const model::Component &container, const std::filesystem::path &file) {
    if (file.empty()) {
        throw core::ConfigurationError("No language file selected for " + container.name());
    }
    if (!ensureEngine()) {
        return false;
    }

    bool allow = true;
    if (beforeSave_) {
        beforeSave_(container, file, allow);
    }
    if (!allow) {
        return false;
    }

    if (!handleResult(engine_->save(container, file))) {
        return false;
    }

    if (afterSave_) {
        afterSave_(container, file);
    }
    return true;
}

std::string LanguageCoordinator::translate(const std::string &text) const {
    if (auto value = strings_.tryGet(text)) {
        return *value;
    }
    if (server_ != nullptr) {
        return server_->translate(text);
    }
    return text;
}

void LanguageCoordinator::setLanguageInfo(core::LanguageInfo info) {
    languageInfo_ = std::move(info);
}

void LanguageCoordinator::applyServerState(const std::string &language,
                                           const std::filesystem::path &rootPath,
                                           core::PersistenceFormat format) {
    suspendReload_ = true;
    if (format != format_ || !engine_) {
        format_ = format;
        recreateEngine();
    }
    rootPath_ = rootPath;
    if (!language.empty()) {
        language_ = language;
    }
    updateFilePath();
    suspendReload_ = false;

    reload();
}

void LanguageCoordinator::recreateEngine() {
    engine_.reset();
    try {
        engine_ = registry_.create(format_);
        engine_->setOptions(options_);
    } catch (const core::ConfigurationError &error) {
        std::cerr << "[Polyglot] " << container_.name() << ": " << error.what() << '\n';
    }
}

bool LanguageCoordinator::ensureEngine() {
    if (engine_) {
        return true;
    }

    try {
        engine_ = registry_.create(format_);
        engine_->setOptions(options_);
    } catch (const core::ConfigurationError &error) {
        reportError(error.what());
        return false;
    }
    return true;
}

void LanguageCoordinator::updateFilePath() {
    if (rootPath_.empty() || language_.empty()) {
        return;
    }

    filePath_ = rootPath_ / language_ / (container_.name() + std::string{core::fileExtension(format_)});
    reload();
}

void LanguageCoordinator::reload() {
    if (suspendReload_) {
        return;
    }
    load();
}

bool LanguageCoordinator::handleResult(const core::OperationResult &result) {
    switch (result.failure) {
    case core::FailureKind::None:
        return true;
    case core::FailureKind::Domain:
        reportError(result.message);
        return false;
    case core::FailureKind::Configuration:
        throw core::ConfigurationError(result.message);
    }
    return false;
}

void LanguageCoordinator::reportError(const std::string &message) const {
    if (error_) {
        error_(message);
        return;
    }
    std::cerr << "[Polyglot] " << container_.name() << ": " << message << '\n';
}

} // namespace polyglot::language
