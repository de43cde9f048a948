#include "polyglot/model/Component.hpp"

#include <stdexcept>

namespace polyglot::model {

Component::Component(const TypeDescriptor &type, std::string name) : type_(type), name_(std::move(name)) {}

void Component::setName(std::string name) {
    name_ = std::move(name);
}

Component &Component::adopt(std::unique_ptr<Component> child) {
    if (!child) {
        throw std::invalid_argument("Cannot adopt an empty component");
    }

    child->owner_ = this;
    children_.push_back(std::move(child));
    return *children_.back();
}

Component *Component::findComponent(std::string_view name) const {
    if (name.empty()) {
        return nullptr;
    }

    for (const auto &child : children_) {
        if (child->name_ == name) {
            return child.get();
        }
    }
    return nullptr;
}

Component *Component::findDescendant(std::string_view name) const {
    if (name.empty()) {
        return nullptr;
    }

    for (const auto &child : children_) {
        if (child->name_ == name) {
            return child.get();
        }
        if (auto *match = child->findDescendant(name)) {
            return match;
        }
    }
    return nullptr;
}

std::string Component::qualifiedName(const Component &root) const {
    std::string result = name_;
    const Component *current = this;
    while (current != &root) {
        current = current->owner_;
        if (current == nullptr) {
            return {};
        }
        result = current->name_ + "." + result;
    }
    return result;
}

} // namespace polyglot::model
