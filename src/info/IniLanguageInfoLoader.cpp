#include "polyglot/info/IniLanguageInfoLoader.hpp"

#include "polyglot/engine/IniDocument.hpp"

namespace polyglot::info {

namespace {

constexpr char kSection[] = "Language";

} // namespace

core::LanguageInfo IniLanguageInfoLoader::loadFromFile(const std::filesystem::path &path) const {
    const auto document = engine::IniDocument::fromFile(path);

    core::LanguageInfo info;
    info.id = document.readString(kSection, "Id");
    info.name = document.readString(kSection, "Name");
    info.nativeName = document.readString(kSection, "NativeName");
    info.rightToLeft = document.readBool(kSection, "IsRightToLeft", false);
    info.uiFont = document.readString(kSection, "UIFont");
    info.fallbackFont = document.readString(kSection, "FallbackFont");
    return info;
}

} // namespace polyglot::info
