#include "polyglot/engine/TranslationEngine.hpp"

#include <stdexcept>

namespace polyglot::engine {

namespace {

constexpr char kNoFileSelected[] = "No language file selected.";

} // namespace

TranslationEngine::TranslationEngine(std::unique_ptr<FormatStrategy> strategy) : strategy_(std::move(strategy)) {
    if (!strategy_) {
        throw std::invalid_argument("TranslationEngine requires a format strategy");
    }
}

core::PersistenceFormat TranslationEngine::format() const noexcept {
    return strategy_->format();
}

void TranslationEngine::setOptions(EngineOptions options) {
    options_ = std::move(options);
}

core::OperationResult TranslationEngine::load(model::Component *container,
                                              const std::filesystem::path &file,
                                              core::TranslationStore *store) {
    if (file.empty()) {
        return core::OperationResult::configuration(kNoFileSelected);
    }

    ensureDirectory(file);

    if (!std::filesystem::exists(file)) {
        if (!options_.createIfMissing || container == nullptr) {
            return core::OperationResult::domain("Language file not found: " + file.string());
        }

        auto created = save(*container, file);
        if (!created.succeeded()) {
            return created;
        }
    }

    const EligibilityRules rules(options_);
    core::TranslationStore loaded;
    strategy_->deserialize(rules, container, file, loaded);

    runtime_ = std::move(loaded);
    if (store != nullptr) {
        store->merge(runtime_);
    }

    return core::OperationResult::ok();
}

core::OperationResult TranslationEngine::save(const model::Component &container,
                                              const std::filesystem::path &file) const {
    if (file.empty()) {
        return core::OperationResult::configuration(kNoFileSelected);
    }

    ensureDirectory(file);

    const EligibilityRules rules(options_);
    strategy_->serialize(rules, container, file);
    return core::OperationResult::ok();
}

std::string TranslationEngine::translate(const std::string &text) const {
    if (auto value = runtime_.tryGet(text)) {
        return *value;
    }
    return text;
}

core::LanguageInfo TranslationEngine::readLanguageInfo(const std::filesystem::path &file) const {
    return strategy_->createInfoLoader()->loadFromFile(file);
}

void TranslationEngine::ensureDirectory(const std::filesystem::path &file) const {
    const auto directory = file.parent_path();
    if (!options_.createIfMissing || directory.empty() || std::filesystem::exists(directory)) {
        return;
    }

    std::filesystem::create_directories(directory);
}

} // namespace polyglot::engine
