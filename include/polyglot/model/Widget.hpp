#pragma once

#include "polyglot/model/Component.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace polyglot::model {

// Component whose attribute values live in maps, for types declared at runtime.
class Widget : public Component {
public:
    Widget(const TypeDescriptor &type, std::string name);

    [[nodiscard]] std::string text(std::string_view attribute) const;
    void setText(const std::string &attribute, std::string value);

    [[nodiscard]] std::vector<std::string> list(std::string_view attribute) const;
    void setList(const std::string &attribute, std::vector<std::string> items);

private:
    std::map<std::string, std::string, std::less<>> text_;
    std::map<std::string, std::vector<std::string>, std::less<>> lists_;
};

} // namespace polyglot::model
