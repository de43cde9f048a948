#pragma once

#include "polyglot/core/LanguageInfo.hpp"

namespace polyglot::info {

// Reads the [Language] section: Id, Name, NativeName, IsRightToLeft, UIFont, FallbackFont.
class IniLanguageInfoLoader : public core::LanguageInfoLoader {
public:
    core::LanguageInfo loadFromFile(const std::filesystem::path &path) const override;
};

} // namespace polyglot::info
