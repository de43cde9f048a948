#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace polyglot::core {

/**
 * @brief Stateless helpers that turn strings into storage keys and make
 * arbitrary text safe for single-line persistence.
 *
 * Input and output are UTF-8. Hashing works on the UTF-16 code units of the
 * text so that keys match files produced on any platform.
 */
class KeyEncoder {
public:
    // CRC32 (polynomial 0xEDB88320) over the low then high byte of every UTF-16 code unit.
    [[nodiscard]] static std::uint32_t crc32(std::string_view text);

    // Eight upper-case hexadecimal digits of crc32(text).
    [[nodiscard]] static std::string makeKey(std::string_view text);

    // Replaces line breaks and the list separator with bracketed tokens.
    [[nodiscard]] static std::string escape(std::string_view text);
    [[nodiscard]] static std::string unescape(std::string_view text);

    // Replaces line breaks with the "~~" placeholder.
    [[nodiscard]] static std::string joinMultiline(std::string_view text);
    [[nodiscard]] static std::string restoreMultiline(std::string_view text);

    // Escapes the assignment and comment characters of INI keys.
    [[nodiscard]] static std::string normalizeKey(std::string_view key);
    [[nodiscard]] static std::string denormalizeKey(std::string_view key);

    // Separator used when a list attribute is stored as one value.
    static constexpr std::string_view kListSeparator{"\xC2\xA7"};
};

} // namespace polyglot::core
