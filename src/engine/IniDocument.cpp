#include "polyglot/engine/IniDocument.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace polyglot::engine {

namespace {

constexpr std::string_view kUtf8Bom{"\xEF\xBB\xBF"};

std::string_view trimView(std::string_view view) {
    const auto begin = view.find_first_not_of(" \t\r");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = view.find_last_not_of(" \t\r");
    return view.substr(begin, end - begin + 1);
}

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
               return std::tolower(a) == std::tolower(b);
           });
}

} // namespace

IniDocument IniDocument::fromFile(const std::filesystem::path &path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open language file: " + path.string());
    }

    std::stringstream buffer;
    buffer << input.rdbuf();
    return parse(buffer.str());
}

IniDocument IniDocument::parse(std::string_view text) {
    if (text.starts_with(kUtf8Bom)) {
        text.remove_prefix(kUtf8Bom.size());
    }

    IniDocument document;
    Section *current = nullptr;

    std::size_t position = 0;
    while (position <= text.size()) {
        auto end = text.find('\n', position);
        if (end == std::string_view::npos) {
            end = text.size();
        }

        auto line = text.substr(position, end - position);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        position = end + 1;

        const auto trimmed = trimView(line);
        if (trimmed.empty() || trimmed.front() == ';' || trimmed.front() == '#') {
            continue;
        }

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            current = &document.ensureSection(trimView(trimmed.substr(1, trimmed.size() - 2)));
            continue;
        }

        const auto separator = line.find('=');
        if (current == nullptr || separator == std::string_view::npos) {
            continue;
        }

        const auto key = trimView(line.substr(0, separator));
        if (key.empty()) {
            continue;
        }
        current->values.emplace_back(std::string{key}, std::string{line.substr(separator + 1)});
    }

    return document;
}

void IniDocument::saveToFile(const std::filesystem::path &path) const {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to write language file: " + path.string());
    }

    output << toString();
    if (!output) {
        throw std::runtime_error("Failed while writing language file: " + path.string());
    }
}

std::string IniDocument::toString() const {
    std::string text;
    for (const auto &section : sections_) {
        if (!text.empty()) {
            text.push_back('\n');
        }
        text.append("[").append(section.name).append("]\n");
        for (const auto &[key, value] : section.values) {
            text.append(key).append("=").append(value).push_back('\n');
        }
    }
    return text;
}

std::vector<std::string> IniDocument::sections() const {
    std::vector<std::string> names;
    names.reserve(sections_.size());
    for (const auto &section : sections_) {
        names.push_back(section.name);
    }
    return names;
}

bool IniDocument::hasSection(std::string_view section) const {
    return findSection(section) != nullptr;
}

std::vector<IniDocument::Entry> IniDocument::sectionValues(std::string_view section) const {
    const auto *found = findSection(section);
    if (found == nullptr) {
        return {};
    }
    return found->values;
}

std::optional<std::string> IniDocument::read(std::string_view section, std::string_view key) const {
    const auto *found = findSection(section);
    if (found == nullptr) {
        return std::nullopt;
    }

    for (const auto &[entryKey, value] : found->values) {
        if (equalsIgnoreCase(entryKey, key)) {
            return value;
        }
    }
    return std::nullopt;
}

std::string IniDocument::readString(std::string_view section,
                                    std::string_view key,
                                    const std::string &fallback) const {
    return read(section, key).value_or(fallback);
}

bool IniDocument::readBool(std::string_view section, std::string_view key, bool fallback) const {
    const auto value = read(section, key);
    if (!value) {
        return fallback;
    }

    const auto trimmed = trimView(*value);
    if (trimmed == "1" || equalsIgnoreCase(trimmed, "true") || equalsIgnoreCase(trimmed, "yes")) {
        return true;
    }
    if (trimmed == "0" || equalsIgnoreCase(trimmed, "false") || equalsIgnoreCase(trimmed, "no")) {
        return false;
    }
    return fallback;
}

void IniDocument::write(std::string_view section, std::string_view key, std::string value) {
    auto &target = ensureSection(section);
    for (auto &[entryKey, entryValue] : target.values) {
        if (equalsIgnoreCase(entryKey, key)) {
            entryValue = std::move(value);
            return;
        }
    }
    target.values.emplace_back(std::string{key}, std::move(value));
}

const IniDocument::Section *IniDocument::findSection(std::string_view name) const {
    for (const auto &section : sections_) {
        if (equalsIgnoreCase(section.name, name)) {
            return &section;
        }
    }
    return nullptr;
}

IniDocument::Section &IniDocument::ensureSection(std::string_view name) {
    for (auto &section : sections_) {
        if (equalsIgnoreCase(section.name, name)) {
            return section;
        }
    }
    sections_.push_back(Section{std::string{name}, {}});
    return sections_.back();
}

} // namespace polyglot::engine
