#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace polyglot::model {

class Component;

enum class AttributeType {
    Text,
    TextList,
    Integer,
    Boolean,
};

/**
 * @brief Declares one attribute of a component type.
 *
 * An attribute is readable when it has a reader and writable when it has a
 * writer. Text and TextList attributes use the matching accessor pair; other
 * types expose their value through the text accessors for display only.
 */
struct AttributeDescriptor {
    using TextReader = std::function<std::string(const Component &)>;
    using TextWriter = std::function<void(Component &, const std::string &)>;
    using ListReader = std::function<std::vector<std::string>(const Component &)>;
    using ListWriter = std::function<void(Component &, const std::vector<std::string> &)>;

    std::string name;
    AttributeType type{AttributeType::Text};
    bool published{true};
    TextReader readText;
    TextWriter writeText;
    ListReader readList;
    ListWriter writeList;

    [[nodiscard]] bool isReadable() const noexcept {
        return type == AttributeType::TextList ? static_cast<bool>(readList) : static_cast<bool>(readText);
    }

    [[nodiscard]] bool isWritable() const noexcept {
        return type == AttributeType::TextList ? static_cast<bool>(writeList) : static_cast<bool>(writeText);
    }

    [[nodiscard]] bool isStringTyped() const noexcept {
        return type == AttributeType::Text || type == AttributeType::TextList;
    }
};

struct TypeDescriptor {
    std::string name;
    std::vector<AttributeDescriptor> attributes;

    [[nodiscard]] const AttributeDescriptor *find(std::string_view attributeName) const;
};

// Name of the identity attribute every component type declares.
inline constexpr std::string_view kNameAttribute{"Name"};

} // namespace polyglot::model
