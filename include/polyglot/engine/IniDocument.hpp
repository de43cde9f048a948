#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace polyglot::engine {

/**
 * @brief In-memory INI file.
 *
 * Section and key lookups ignore ASCII case; order of sections and keys is
 * kept as read or written. Lines starting with ';' or '#' are comments and
 * are dropped on read. Values are kept verbatim after the first '='.
 */
class IniDocument {
public:
    using Entry = std::pair<std::string, std::string>;

    static IniDocument fromFile(const std::filesystem::path &path);
    static IniDocument parse(std::string_view text);

    void saveToFile(const std::filesystem::path &path) const;
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] std::vector<std::string> sections() const;
    [[nodiscard]] bool hasSection(std::string_view section) const;
    [[nodiscard]] std::vector<Entry> sectionValues(std::string_view section) const;

    [[nodiscard]] std::optional<std::string> read(std::string_view section, std::string_view key) const;
    [[nodiscard]] std::string readString(std::string_view section,
                                         std::string_view key,
                                         const std::string &fallback = {}) const;
    [[nodiscard]] bool readBool(std::string_view section, std::string_view key, bool fallback) const;

    void write(std::string_view section, std::string_view key, std::string value);

private:
    struct Section {
        std::string name;
        std::vector<Entry> values;
    };

    [[nodiscard]] const Section *findSection(std::string_view name) const;
    Section &ensureSection(std::string_view name);

    std::vector<Section> sections_;
};

} // namespace polyglot::engine
