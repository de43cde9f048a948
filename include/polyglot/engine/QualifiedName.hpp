#pragma once

#include "polyglot/model/Component.hpp"

#include <string_view>

namespace polyglot::engine {

/**
 * @brief Finds the component a dotted name refers to, starting at root.
 *
 * The first segment may name root itself. Each following segment must be a
 * direct child of the previous component. When that walk fails the last
 * segment is searched across the whole tree, so a value may land on another
 * component that shares the leaf name after an ancestor was renamed.
 */
[[nodiscard]] model::Component *resolveQualifiedName(model::Component &root, std::string_view qualifiedName);

} // namespace polyglot::engine
