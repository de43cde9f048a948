#pragma once

#include "polyglot/core/PersistenceFormat.hpp"
#include "polyglot/engine/Eligibility.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace polyglot::config {

struct LanguageSettings {
    std::filesystem::path rootPath;
    std::string language;
    core::PersistenceFormat format{core::PersistenceFormat::Ini};
    bool createIfMissing{false};
    bool excludeOnAction{true};
    std::vector<std::string> excludeTypes;
    std::vector<std::string> excludeAttributes;
    bool registerOnStart{true};

    [[nodiscard]] engine::EngineOptions engineOptions() const;
};

// Missing file yields the defaults. Malformed JSON raises; wrongly typed keys keep their defaults.
[[nodiscard]] LanguageSettings loadSettings(const std::filesystem::path &path);
void saveSettings(const LanguageSettings &settings, const std::filesystem::path &path);

// POLYGLOT_LANGUAGE, POLYGLOT_ROOT and POLYGLOT_FORMAT take precedence over the file.
void applyEnvironmentOverrides(LanguageSettings &settings);

} // namespace polyglot::config
