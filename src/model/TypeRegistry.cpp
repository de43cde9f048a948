#include "polyglot/model/TypeRegistry.hpp"

#include "polyglot/model/TypeBuilder.hpp"
#include "polyglot/model/Widget.hpp"

#include <stdexcept>

namespace polyglot::model {

const TypeDescriptor &TypeRegistry::registerType(TypeDescriptor descriptor) {
    auto it = types_.find(descriptor.name);
    if (it != types_.end()) {
        return *it->second;
    }

    auto name = descriptor.name;
    auto inserted = types_.emplace(std::move(name), std::make_unique<TypeDescriptor>(std::move(descriptor)));
    return *inserted.first->second;
}

const TypeDescriptor &TypeRegistry::declareWidget(const std::string &typeName,
                                                  const std::vector<std::string> &textAttributes,
                                                  const std::vector<std::string> &listAttributes) {
    TypeBuilder<Widget> builder(typeName);
    for (const auto &attribute : textAttributes) {
        if (attribute == kNameAttribute) {
            continue;
        }
        builder.text(
            attribute,
            [attribute](const Widget &widget) { return widget.text(attribute); },
            [attribute](Widget &widget, const std::string &value) { widget.setText(attribute, value); });
    }
    for (const auto &attribute : listAttributes) {
        builder.textList(
            attribute,
            [attribute](const Widget &widget) { return widget.list(attribute); },
            [attribute](Widget &widget, const std::vector<std::string> &items) { widget.setList(attribute, items); });
    }
    return registerType(builder.build());
}

bool TypeRegistry::contains(std::string_view typeName) const {
    return types_.find(typeName) != types_.end();
}

const TypeDescriptor *TypeRegistry::find(std::string_view typeName) const {
    auto it = types_.find(typeName);
    if (it == types_.end()) {
        return nullptr;
    }
    return it->second.get();
}

const TypeDescriptor &TypeRegistry::get(std::string_view typeName) const {
    const auto *descriptor = find(typeName);
    if (descriptor == nullptr) {
        throw std::out_of_range("Unknown component type: " + std::string{typeName});
    }
    return *descriptor;
}

std::vector<std::string> TypeRegistry::typeNames() const {
    std::vector<std::string> result;
    result.reserve(types_.size());
    for (const auto &pair : types_) {
        result.push_back(pair.first);
    }
    return result;
}

} // namespace polyglot::model
