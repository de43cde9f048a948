#include "polyglot/core/PersistenceFormat.hpp"

#include <algorithm>
#include <cctype>

namespace polyglot::core {

std::string_view fileExtension(PersistenceFormat format) noexcept {
    switch (format) {
    case PersistenceFormat::Json:
        return ".json";
    case PersistenceFormat::Ini:
        return ".lng";
    case PersistenceFormat::IniFlat:
        return ".clng";
    }
    return {};
}

std::string toString(PersistenceFormat format) {
    switch (format) {
    case PersistenceFormat::Json:
        return "json";
    case PersistenceFormat::Ini:
        return "ini";
    case PersistenceFormat::IniFlat:
        return "ini-flat";
    }
    return "unknown";
}

std::optional<PersistenceFormat> parsePersistenceFormat(std::string_view text) {
    std::string lowered{text};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    if (lowered == "json") {
        return PersistenceFormat::Json;
    }
    if (lowered == "ini" || lowered == "lng") {
        return PersistenceFormat::Ini;
    }
    if (lowered == "ini-flat" || lowered == "iniflat" || lowered == "clng") {
        return PersistenceFormat::IniFlat;
    }

    return std::nullopt;
}

} // namespace polyglot::core
