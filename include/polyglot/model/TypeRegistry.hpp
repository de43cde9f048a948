#pragma once

#include "polyglot/model/TypeDescriptor.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace polyglot::model {

/**
 * @brief Owns the attribute declarations of every component type.
 *
 * Descriptors keep a stable address for the lifetime of the registry, so
 * components may hold references to them. Registering a name twice keeps
 * the first declaration.
 */
class TypeRegistry {
public:
    const TypeDescriptor &registerType(TypeDescriptor descriptor);

    // Declares a Widget type with the given text and list attributes.
    const TypeDescriptor &declareWidget(const std::string &typeName,
                                        const std::vector<std::string> &textAttributes,
                                        const std::vector<std::string> &listAttributes = {});

    [[nodiscard]] bool contains(std::string_view typeName) const;
    [[nodiscard]] const TypeDescriptor *find(std::string_view typeName) const;

    // Throws std::out_of_range for unknown types.
    [[nodiscard]] const TypeDescriptor &get(std::string_view typeName) const;

    [[nodiscard]] std::vector<std::string> typeNames() const;

private:
    std::map<std::string, std::unique_ptr<TypeDescriptor>, std::less<>> types_;
};

} // namespace polyglot::model
