#include "polyglot/info/JsonLanguageInfoLoader.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>
#include <string>

namespace polyglot::info {

namespace {

std::string readString(const nlohmann::json &object, const char *key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

bool readBool(const nlohmann::json &object, const char *key) {
    const auto it = object.find(key);
    return it != object.end() && it->is_boolean() && it->get<bool>();
}

} // namespace

core::LanguageInfo JsonLanguageInfoLoader::loadFromFile(const std::filesystem::path &path) const {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open language info file: " + path.string());
    }

    const auto document = nlohmann::json::parse(input);

    core::LanguageInfo info;
    if (!document.is_object() || !document.contains("language") || !document["language"].is_object()) {
        return info;
    }

    const auto &language = document["language"];
    info.id = readString(language, "id");
    info.name = readString(language, "name");
    info.nativeName = readString(language, "nativeName");
    info.rightToLeft = readBool(language, "isRightToLeft");
    info.uiFont = readString(language, "uiFont");
    info.fallbackFont = readString(language, "fallbackFont");
    return info;
}

} // namespace polyglot::info
