#include "polyglot/engine/QualifiedName.hpp"

#include <vector>

namespace polyglot::engine {

namespace {

std::vector<std::string_view> splitSegments(std::string_view text) {
    std::vector<std::string_view> segments;
    std::size_t current = 0;
    while (current <= text.size()) {
        const auto position = text.find('.', current);
        if (position == std::string_view::npos) {
            segments.push_back(text.substr(current));
            break;
        }
        segments.push_back(text.substr(current, position - current));
        current = position + 1;
    }
    return segments;
}

} // namespace

model::Component *resolveQualifiedName(model::Component &root, std::string_view qualifiedName) {
    if (qualifiedName.empty()) {
        return nullptr;
    }

    const auto segments = splitSegments(qualifiedName);

    std::size_t index = 0;
    if (segments.front() == root.name()) {
        index = 1;
    }

    model::Component *current = &root;
    for (; index < segments.size() && current != nullptr; ++index) {
        current = current->findComponent(segments[index]);
    }

    if (current != nullptr) {
        return current;
    }

    const auto leaf = segments.back();
    if (leaf == root.name()) {
        return &root;
    }
    return root.findDescendant(leaf);
}

} // namespace polyglot::engine
