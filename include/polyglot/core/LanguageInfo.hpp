#pragma once

#include <filesystem>
#include <string>

namespace polyglot::core {

// Metadata describing one language, read from the "lang" file of a language folder.
struct LanguageInfo {
    std::string id;
    std::string name;
    std::string nativeName;
    bool rightToLeft{false};
    std::string uiFont;
    std::string fallbackFont;

    bool operator==(const LanguageInfo &) const = default;
};

class LanguageInfoLoader {
public:
    virtual ~LanguageInfoLoader() = default;

    // Missing fields are left at their defaults; read and parse errors propagate.
    virtual LanguageInfo loadFromFile(const std::filesystem::path &path) const = 0;
};

} // namespace polyglot::core
