#include "polyglot/model/TypeDescriptor.hpp"

namespace polyglot::model {

const AttributeDescriptor *TypeDescriptor::find(std::string_view attributeName) const {
    for (const auto &attribute : attributes) {
        if (attribute.name == attributeName) {
            return &attribute;
        }
    }
    return nullptr;
}

} // namespace polyglot::model
