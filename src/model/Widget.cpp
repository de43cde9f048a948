#include "polyglot/model/Widget.hpp"

namespace polyglot::model {

Widget::Widget(const TypeDescriptor &type, std::string name) : Component(type, std::move(name)) {}

std::string Widget::text(std::string_view attribute) const {
    auto it = text_.find(attribute);
    if (it == text_.end()) {
        return {};
    }
    return it->second;
}

void Widget::setText(const std::string &attribute, std::string value) {
    text_[attribute] = std::move(value);
}

std::vector<std::string> Widget::list(std::string_view attribute) const {
    auto it = lists_.find(attribute);
    if (it == lists_.end()) {
        return {};
    }
    return it->second;
}

void Widget::setList(const std::string &attribute, std::vector<std::string> items) {
    lists_[attribute] = std::move(items);
}

} // namespace polyglot::model
