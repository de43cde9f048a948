#include "polyglot/core/KeyEncoder.hpp"

#include <array>
#include <cstdio>
#include <vector>

namespace {

constexpr std::array<std::uint32_t, 256> buildCrcTable() {
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t index = 0; index < table.size(); ++index) {
        std::uint32_t value = index;
        for (int bit = 0; bit < 8; ++bit) {
            value = (value & 1u) ? (value >> 1) ^ 0xEDB88320u : value >> 1;
        }
        table[index] = value;
    }
    return table;
}

constexpr auto kCrcTable = buildCrcTable();

constexpr std::string_view kTokenCrLf{"[CRLF]"};
constexpr std::string_view kTokenLf{"[LF]"};
constexpr std::string_view kTokenCr{"[CR]"};
constexpr std::string_view kTokenSeparator{"[SECT]"};
constexpr std::string_view kTokenBracket{"[[]"};

constexpr std::array<std::string_view, 5> kEscapeTokens{kTokenCrLf, kTokenLf, kTokenCr, kTokenSeparator, kTokenBracket};

bool startsWithToken(std::string_view text) {
    for (auto token : kEscapeTokens) {
        if (text.starts_with(token)) {
            return true;
        }
    }
    return false;
}

// Decodes UTF-8 into UTF-16 code units. Bytes that do not form a valid
// sequence are taken as Latin-1 so that every input hashes deterministically.
std::vector<char16_t> toUtf16(std::string_view text) {
    std::vector<char16_t> units;
    units.reserve(text.size());

    std::size_t index = 0;
    while (index < text.size()) {
        const auto lead = static_cast<unsigned char>(text[index]);
        std::size_t length = 0;
        char32_t codePoint = 0;

        if (lead < 0x80) {
            length = 1;
            codePoint = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            codePoint = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            codePoint = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            codePoint = lead & 0x07;
        }

        bool valid = length > 0 && index + length <= text.size();
        for (std::size_t offset = 1; valid && offset < length; ++offset) {
            const auto next = static_cast<unsigned char>(text[index + offset]);
            if ((next & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            codePoint = (codePoint << 6) | (next & 0x3F);
        }

        if (!valid || codePoint > 0x10FFFF) {
            units.push_back(static_cast<char16_t>(lead));
            ++index;
            continue;
        }

        if (codePoint >= 0x10000) {
            codePoint -= 0x10000;
            units.push_back(static_cast<char16_t>(0xD800 + (codePoint >> 10)));
            units.push_back(static_cast<char16_t>(0xDC00 + (codePoint & 0x3FF)));
        } else {
            units.push_back(static_cast<char16_t>(codePoint));
        }
        index += length;
    }

    return units;
}

std::string replaceAll(std::string_view text, std::string_view from, std::string_view to) {
    std::string result;
    result.reserve(text.size());

    std::size_t current = 0;
    while (true) {
        const auto position = text.find(from, current);
        if (position == std::string_view::npos) {
            result.append(text.substr(current));
            break;
        }
        result.append(text.substr(current, position - current));
        result.append(to);
        current = position + from.size();
    }

    return result;
}

} // namespace

namespace polyglot::core {

std::uint32_t KeyEncoder::crc32(std::string_view text) {
    std::uint32_t crc = 0xFFFFFFFFu;
    for (char16_t unit : toUtf16(text)) {
        const auto low = static_cast<std::uint32_t>(unit) & 0xFFu;
        crc = (crc >> 8) ^ kCrcTable[(crc ^ low) & 0xFFu];
        const auto high = (static_cast<std::uint32_t>(unit) >> 8) & 0xFFu;
        crc = (crc >> 8) ^ kCrcTable[(crc ^ high) & 0xFFu];
    }
    return crc ^ 0xFFFFFFFFu;
}

std::string KeyEncoder::makeKey(std::string_view text) {
    std::array<char, 9> buffer{};
    std::snprintf(buffer.data(), buffer.size(), "%08X", static_cast<unsigned int>(crc32(text)));
    return std::string{buffer.data(), 8};
}

std::string KeyEncoder::escape(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    std::size_t index = 0;
    while (index < text.size()) {
        const auto rest = text.substr(index);
        if (rest.starts_with("\r\n")) {
            result.append(kTokenCrLf);
            index += 2;
        } else if (rest.front() == '\n') {
            result.append(kTokenLf);
            ++index;
        } else if (rest.front() == '\r') {
            result.append(kTokenCr);
            ++index;
        } else if (rest.starts_with(kListSeparator)) {
            result.append(kTokenSeparator);
            index += kListSeparator.size();
        } else if (rest.front() == '[' && startsWithToken(rest)) {
            // A literal bracket that would otherwise read back as a token.
            result.append(kTokenBracket);
            ++index;
        } else {
            result.push_back(rest.front());
            ++index;
        }
    }

    return result;
}

std::string KeyEncoder::unescape(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    std::size_t index = 0;
    while (index < text.size()) {
        const auto rest = text.substr(index);
        if (rest.front() != '[') {
            result.push_back(rest.front());
            ++index;
            continue;
        }

        if (rest.starts_with(kTokenCrLf)) {
            result.append("\r\n");
            index += kTokenCrLf.size();
        } else if (rest.starts_with(kTokenLf)) {
            result.push_back('\n');
            index += kTokenLf.size();
        } else if (rest.starts_with(kTokenCr)) {
            result.push_back('\r');
            index += kTokenCr.size();
        } else if (rest.starts_with(kTokenSeparator)) {
            result.append(kListSeparator);
            index += kTokenSeparator.size();
        } else if (rest.starts_with(kTokenBracket)) {
            result.push_back('[');
            index += kTokenBracket.size();
        } else {
            result.push_back('[');
            ++index;
        }
    }

    return result;
}

std::string KeyEncoder::joinMultiline(std::string_view text) {
    // '~' is doubled as "~-" so that "~~" only ever stands for a line break.
    std::string result;
    result.reserve(text.size());

    for (char ch : text) {
        switch (ch) {
        case '\n':
            result.append("~~");
            break;
        case '\r':
            result.append("~r");
            break;
        case '~':
            result.append("~-");
            break;
        default:
            result.push_back(ch);
            break;
        }
    }

    return result;
}

std::string KeyEncoder::restoreMultiline(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    std::size_t index = 0;
    while (index < text.size()) {
        const char ch = text[index];
        if (ch != '~' || index + 1 >= text.size()) {
            result.push_back(ch);
            ++index;
            continue;
        }

        switch (text[index + 1]) {
        case '~':
            result.push_back('\n');
            index += 2;
            break;
        case 'r':
            result.push_back('\r');
            index += 2;
            break;
        case '-':
            result.push_back('~');
            index += 2;
            break;
        default:
            result.push_back(ch);
            ++index;
            break;
        }
    }

    return result;
}

std::string KeyEncoder::normalizeKey(std::string_view key) {
    auto result = replaceAll(key, "'", "''");
    result = replaceAll(result, ";", "[SEMICOLON]");
    return replaceAll(result, "=", "[EQUAL]");
}

std::string KeyEncoder::denormalizeKey(std::string_view key) {
    auto result = replaceAll(key, "[EQUAL]", "=");
    result = replaceAll(result, "[SEMICOLON]", ";");
    return replaceAll(result, "''", "'");
}

} // namespace polyglot::core
