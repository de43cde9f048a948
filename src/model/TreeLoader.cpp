#include "polyglot/model/TreeLoader.hpp"

#include "polyglot/model/Widget.hpp"

#include <fstream>
#include <stdexcept>

namespace polyglot::model {

namespace {

std::vector<std::string> readNameList(const nlohmann::json &json, const std::string &context) {
    if (!json.is_array()) {
        throw std::runtime_error(context + " must be an array of attribute names.");
    }

    std::vector<std::string> names;
    for (const auto &entry : json) {
        if (!entry.is_string() || entry.get<std::string>().empty()) {
            throw std::runtime_error(context + " must contain only non-empty strings.");
        }
        names.push_back(entry.get<std::string>());
    }
    return names;
}

void collectAttributes(const Component &component, const Component &root, std::vector<std::string> &lines) {
    const auto prefix = component.qualifiedName(root);
    for (const auto &attribute : component.type().attributes) {
        if (attribute.name == kNameAttribute || !attribute.isReadable()) {
            continue;
        }

        std::string value;
        if (attribute.type == AttributeType::TextList) {
            for (const auto &item : attribute.readList(component)) {
                value += value.empty() ? item : "|" + item;
            }
        } else {
            value = attribute.readText(component);
        }
        lines.push_back(prefix + "." + attribute.name + "=" + value);
    }

    for (const auto &child : component.components()) {
        collectAttributes(*child, root, lines);
    }
}

} // namespace

TreeLoader::TreeLoader(TypeRegistry &registry) : registry_(registry) {}

std::unique_ptr<Component> TreeLoader::loadFromFile(const std::filesystem::path &path) const {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Failed to open tree file: " + path.string());
    }

    return parseDocument(nlohmann::json::parse(input));
}

std::unique_ptr<Component> TreeLoader::loadFromString(const std::string &text) const {
    return parseDocument(nlohmann::json::parse(text));
}

std::unique_ptr<Component> TreeLoader::parseDocument(const nlohmann::json &document) const {
    if (!document.is_object()) {
        throw std::runtime_error("Tree document must be a JSON object.");
    }

    if (document.contains("types")) {
        parseTypes(document["types"]);
    }

    if (!document.contains("root") || !document["root"].is_object()) {
        throw std::runtime_error("Tree document missing \"root\" object.");
    }

    std::vector<PendingAction> actions;
    auto root = parseNode(document["root"], actions);

    for (auto &[component, actionName] : actions) {
        const Component *action = root->name() == actionName ? root.get() : root->findDescendant(actionName);
        if (action == nullptr) {
            throw std::runtime_error("Component \"" + component->name() + "\" refers to unknown action \"" +
                                     actionName + "\".");
        }
        component->setAction(action);
    }

    return root;
}

void TreeLoader::parseTypes(const nlohmann::json &types) const {
    if (!types.is_object()) {
        throw std::runtime_error("Tree document field \"types\" must be an object.");
    }

    for (auto it = types.begin(); it != types.end(); ++it) {
        const std::string context = "Type \"" + it.key() + "\"";
        const auto &declaration = it.value();

        if (declaration.is_array()) {
            registry_.declareWidget(it.key(), readNameList(declaration, context));
            continue;
        }

        if (!declaration.is_object()) {
            throw std::runtime_error(context + " must be an array or an object.");
        }

        std::vector<std::string> text;
        std::vector<std::string> lists;
        if (declaration.contains("text")) {
            text = readNameList(declaration["text"], context + " text");
        }
        if (declaration.contains("lists")) {
            lists = readNameList(declaration["lists"], context + " lists");
        }
        registry_.declareWidget(it.key(), text, lists);
    }
}

std::unique_ptr<Component> TreeLoader::parseNode(const nlohmann::json &node,
                                                 std::vector<PendingAction> &actions) const {
    if (node.contains("name") && !node["name"].is_string()) {
        throw std::runtime_error("Component field \"name\" must be a string.");
    }
    const auto name = node.value("name", std::string{});
    if (node.contains("type") && !node["type"].is_string()) {
        throw std::runtime_error("Component \"" + name + "\" field \"type\" must be a string.");
    }
    const auto typeName = node.value("type", std::string{});
    if (name.empty()) {
        throw std::runtime_error("Every component requires a non-empty name.");
    }
    if (typeName.empty()) {
        throw std::runtime_error("Component \"" + name + "\" requires a non-empty type.");
    }

    const auto *descriptor = registry_.find(typeName);
    if (descriptor == nullptr) {
        descriptor = &registry_.declareWidget(typeName, {});
    }

    auto component = std::make_unique<Widget>(*descriptor, name);

    if (node.contains("attributes")) {
        applyAttributes(*component, node["attributes"]);
    }

    if (node.contains("action")) {
        if (!node["action"].is_string()) {
            throw std::runtime_error("Component \"" + name + "\" action must be a string.");
        }
        actions.emplace_back(component.get(), node["action"].get<std::string>());
    }

    if (node.contains("children")) {
        const auto &children = node["children"];
        if (!children.is_array()) {
            throw std::runtime_error("Component \"" + name + "\" children must be an array.");
        }
        for (const auto &child : children) {
            if (!child.is_object()) {
                throw std::runtime_error("Component \"" + name + "\" has a child that is not an object.");
            }
            component->adopt(parseNode(child, actions));
        }
    }

    return component;
}

void TreeLoader::applyAttributes(Component &component, const nlohmann::json &attributes) const {
    if (!attributes.is_object()) {
        throw std::runtime_error("Component \"" + component.name() + "\" attributes must be an object.");
    }

    for (auto it = attributes.begin(); it != attributes.end(); ++it) {
        const auto *attribute = component.type().find(it.key());
        if (attribute == nullptr || attribute->name == kNameAttribute) {
            throw std::runtime_error("Component \"" + component.name() + "\" sets undeclared attribute \"" +
                                     it.key() + "\".");
        }

        const auto &value = it.value();
        if (attribute->type == AttributeType::TextList) {
            if (!value.is_array()) {
                throw std::runtime_error("Attribute \"" + it.key() + "\" of \"" + component.name() +
                                         "\" must be an array of strings.");
            }
            std::vector<std::string> items;
            for (const auto &item : value) {
                if (!item.is_string()) {
                    throw std::runtime_error("Attribute \"" + it.key() + "\" of \"" + component.name() +
                                             "\" contains a non-string item.");
                }
                items.push_back(item.get<std::string>());
            }
            attribute->writeList(component, items);
            continue;
        }

        if (!value.is_string()) {
            throw std::runtime_error("Attribute \"" + it.key() + "\" of \"" + component.name() +
                                     "\" must be a string.");
        }
        attribute->writeText(component, value.get<std::string>());
    }
}

std::vector<std::string> describeAttributes(const Component &root) {
    std::vector<std::string> lines;
    collectAttributes(root, root, lines);
    return lines;
}

} // namespace polyglot::model
