#include "polyglot/config/LanguageSettings.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <type_traits>

namespace polyglot::config {

namespace {

constexpr char kLanguageVariable[] = "POLYGLOT_LANGUAGE";
constexpr char kRootVariable[] = "POLYGLOT_ROOT";
constexpr char kFormatVariable[] = "POLYGLOT_FORMAT";

std::vector<std::string> readNames(const nlohmann::json &json, const char *key) {
    std::vector<std::string> names;
    if (!json.contains(key) || !json[key].is_array()) {
        return names;
    }

    for (const auto &entry : json[key]) {
        if (entry.is_string() && !entry.get<std::string>().empty()) {
            names.push_back(entry.get<std::string>());
        }
    }
    return names;
}

template <typename T>
void readValue(const nlohmann::json &json, const char *key, T &target) {
    if (!json.contains(key)) {
        return;
    }

    const auto &value = json[key];
    if constexpr (std::is_same_v<T, bool>) {
        if (value.is_boolean()) {
            target = value.get<bool>();
        }
    } else {
        if (value.is_string()) {
            target = value.get<std::string>();
        }
    }
}

nlohmann::json serialize(const LanguageSettings &settings) {
    nlohmann::json json;
    json["rootPath"] = settings.rootPath.string();
    json["language"] = settings.language;
    json["format"] = core::toString(settings.format);
    json["createIfMissing"] = settings.createIfMissing;
    json["excludeOnAction"] = settings.excludeOnAction;
    json["excludeTypes"] = settings.excludeTypes;
    json["excludeAttributes"] = settings.excludeAttributes;
    json["registerOnStart"] = settings.registerOnStart;
    return json;
}

LanguageSettings deserialize(const nlohmann::json &json) {
    LanguageSettings settings;
    if (!json.is_object()) {
        throw std::runtime_error("Settings document must be an object");
    }

    std::string rootPath;
    readValue(json, "rootPath", rootPath);
    settings.rootPath = rootPath;
    readValue(json, "language", settings.language);

    std::string format;
    readValue(json, "format", format);
    if (!format.empty()) {
        if (auto parsed = core::parsePersistenceFormat(format)) {
            settings.format = *parsed;
        } else {
            std::cerr << "[Polyglot] Unknown persistence format \"" << format << "\", using "
                      << core::toString(settings.format) << '\n';
        }
    }

    readValue(json, "createIfMissing", settings.createIfMissing);
    readValue(json, "excludeOnAction", settings.excludeOnAction);
    readValue(json, "registerOnStart", settings.registerOnStart);
    settings.excludeTypes = readNames(json, "excludeTypes");
    settings.excludeAttributes = readNames(json, "excludeAttributes");
    return settings;
}

} // namespace

engine::EngineOptions LanguageSettings::engineOptions() const {
    engine::EngineOptions options;
    options.createIfMissing = createIfMissing;
    options.excludeOnAction = excludeOnAction;
    options.excludedTypes = excludeTypes;
    options.excludedAttributes = excludeAttributes;
    return options;
}

LanguageSettings loadSettings(const std::filesystem::path &path) {
    std::error_code error;
    if (!std::filesystem::exists(path, error)) {
        return {};
    }

    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open settings file: " + path.string());
    }

    return deserialize(nlohmann::json::parse(input));
}

void saveSettings(const LanguageSettings &settings, const std::filesystem::path &path) {
    const auto directory = path.parent_path();
    if (!directory.empty()) {
        std::filesystem::create_directories(directory);
    }

    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to write settings file: " + path.string());
    }
    output << serialize(settings).dump(4) << '\n';
}

void applyEnvironmentOverrides(LanguageSettings &settings) {
    if (const char *language = std::getenv(kLanguageVariable); language != nullptr && *language != '\0') {
        settings.language = language;
    }
    if (const char *root = std::getenv(kRootVariable); root != nullptr && *root != '\0') {
        settings.rootPath = root;
    }
    if (const char *format = std::getenv(kFormatVariable); format != nullptr && *format != '\0') {
        if (auto parsed = core::parsePersistenceFormat(format)) {
            settings.format = *parsed;
        } else {
            std::cerr << "[Polyglot] Ignoring " << kFormatVariable << "=" << format << '\n';
        }
    }
}

} // namespace polyglot::config
