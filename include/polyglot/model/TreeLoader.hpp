#pragma once

#include "polyglot/model/Component.hpp"
#include "polyglot/model/TypeRegistry.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace polyglot::model {

/**
 * @brief Builds a Widget tree from a JSON description.
 *
 * Document layout:
 * @code
 * {
 *   "types": { "Button": ["Caption", "Hint"], "ListBox": {"text": ["Hint"], "lists": ["Items"]} },
 *   "root": {
 *     "type": "Form", "name": "Form1", "attributes": {"Caption": "Main"},
 *     "children": [ {"type": "Button", "name": "Button1", "action": "actOpen", ...} ]
 *   }
 * }
 * @endcode
 *
 * Types are declared in the registry passed to the constructor, which must
 * outlive the returned tree. Invalid documents raise std::runtime_error.
 */
class TreeLoader {
public:
    explicit TreeLoader(TypeRegistry &registry);

    std::unique_ptr<Component> loadFromFile(const std::filesystem::path &path) const;
    std::unique_ptr<Component> loadFromString(const std::string &text) const;

private:
    using PendingAction = std::pair<Component *, std::string>;

    std::unique_ptr<Component> parseDocument(const nlohmann::json &document) const;
    void parseTypes(const nlohmann::json &types) const;
    std::unique_ptr<Component> parseNode(const nlohmann::json &node, std::vector<PendingAction> &actions) const;
    void applyAttributes(Component &component, const nlohmann::json &attributes) const;

    TypeRegistry &registry_;
};

std::vector<std::string> describeAttributes(const Component &root);

} // namespace polyglot::model
