#include "polyglot/engine/JsonFormat.hpp"

#include "polyglot/engine/QualifiedName.hpp"
#include "polyglot/info/JsonLanguageInfoLoader.hpp"

#include <fstream>
#include <stdexcept>

namespace polyglot::engine {

namespace {

nlohmann::ordered_json readDocument(const std::filesystem::path &file) {
    std::ifstream input(file);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open language file: " + file.string());
    }

    auto document = nlohmann::ordered_json::parse(input);
    if (!document.is_object()) {
        throw std::runtime_error("Language file root must be an object: " + file.string());
    }
    return document;
}

} // namespace

core::PersistenceFormat JsonFormat::format() const noexcept {
    return core::PersistenceFormat::Json;
}

void JsonFormat::deserialize(const EligibilityRules &rules,
                             model::Component *root,
                             const std::filesystem::path &file,
                             core::TranslationStore &strings) const {
    const auto document = readDocument(file);

    for (const auto &[key, value] : document.items()) {
        if (key == kStringsKey) {
            if (!value.is_object()) {
                throw std::runtime_error("Language file field \"Strings\" must be an object");
            }
            for (const auto &[hash, text] : value.items()) {
                if (text.is_string()) {
                    strings.setRaw(hash, text.get<std::string>());
                }
            }
            continue;
        }

        if (root != nullptr && value.is_object()) {
            readComponent(rules, *root, key, value);
        }
    }
}

void JsonFormat::serialize(const EligibilityRules &rules,
                           const model::Component &root,
                           const std::filesystem::path &file) const {
    // Top-level objects other than the root's own are written back untouched.
    Json document = Json::object();
    if (std::filesystem::exists(file)) {
        document = readDocument(file);
    }

    if (rules.isEligibleType(&root) && !root.name().empty()) {
        document[root.name()] = writeComponent(rules, root);
    } else if (!root.name().empty()) {
        document.erase(root.name());
    }

    std::ofstream output(file, std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to write language file: " + file.string());
    }
    output << document.dump(2) << '\n';
}

std::unique_ptr<core::LanguageInfoLoader> JsonFormat::createInfoLoader() const {
    return std::make_unique<info::JsonLanguageInfoLoader>();
}

JsonFormat::Json JsonFormat::writeComponent(const EligibilityRules &rules, const model::Component &component) const {
    Json object = Json::object();

    for (const auto &attribute : component.type().attributes) {
        if (!rules.shouldPersist(attribute, component)) {
            continue;
        }
        if (auto value = encodeAttribute(attribute, component)) {
            object[attribute.name] = std::move(*value);
        }
    }

    for (const auto &child : component.components()) {
        if (child->name().empty() || !rules.isEligibleType(child.get())) {
            continue;
        }
        object[child->name()] = writeComponent(rules, *child);
    }

    return object;
}

void JsonFormat::readComponent(const EligibilityRules &rules,
                               model::Component &root,
                               const std::string &path,
                               const Json &object) const {
    auto *component = resolveQualifiedName(root, path);
    if (component == nullptr) {
        return;
    }
    // An excluded type hides its whole subtree.
    if (!rules.isEligibleType(component)) {
        return;
    }

    for (const auto &[key, value] : object.items()) {
        if (value.is_string()) {
            applyAttribute(rules, *component, key, value.get<std::string>());
        } else if (value.is_object()) {
            readComponent(rules, root, path + "." + key, value);
        }
    }
}

} // namespace polyglot::engine
