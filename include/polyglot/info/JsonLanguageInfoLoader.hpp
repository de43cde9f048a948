#pragma once

#include "polyglot/core/LanguageInfo.hpp"

namespace polyglot::info {

/**
 * @brief Reads the "language" object of a JSON metadata file.
 *
 * @code
 * {"language": {"id": "ar-SA", "name": "Arabic", "nativeName": "...",
 *               "isRightToLeft": true, "uiFont": "...", "fallbackFont": "..."}}
 * @endcode
 */
class JsonLanguageInfoLoader : public core::LanguageInfoLoader {
public:
    core::LanguageInfo loadFromFile(const std::filesystem::path &path) const override;
};

} // namespace polyglot::info
