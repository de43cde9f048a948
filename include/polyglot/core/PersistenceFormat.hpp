#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace polyglot::core {

enum class PersistenceFormat {
    Json,
    Ini,
    IniFlat,
};

// File extension including the leading dot: ".json", ".lng", ".clng".
[[nodiscard]] std::string_view fileExtension(PersistenceFormat format) noexcept;

// Identifiers used in settings files: "json", "ini", "ini-flat".
[[nodiscard]] std::string toString(PersistenceFormat format);
[[nodiscard]] std::optional<PersistenceFormat> parsePersistenceFormat(std::string_view text);

} // namespace polyglot::core
