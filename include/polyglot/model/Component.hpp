#pragma once

#include "polyglot/model/TypeDescriptor.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace polyglot::model {

/**
 * @brief A named node of the object tree that gets translated.
 *
 * A component owns its children. The optional action is a non-owning link to
 * another component (usually an action inside an action list) that supplies
 * Caption, Hint and Text at runtime.
 */
class Component {
public:
    Component(const TypeDescriptor &type, std::string name);
    virtual ~Component() = default;

    Component(const Component &) = delete;
    Component &operator=(const Component &) = delete;

    [[nodiscard]] const TypeDescriptor &type() const noexcept { return type_; }
    [[nodiscard]] const std::string &typeName() const noexcept { return type_.name; }

    [[nodiscard]] const std::string &name() const noexcept { return name_; }
    void setName(std::string name);

    [[nodiscard]] Component *owner() const noexcept { return owner_; }

    Component &adopt(std::unique_ptr<Component> child);

    template <typename T, typename... Args>
    T &add(Args &&...args) {
        auto child = std::make_unique<T>(std::forward<Args>(args)...);
        T &reference = *child;
        adopt(std::move(child));
        return reference;
    }

    [[nodiscard]] const std::vector<std::unique_ptr<Component>> &components() const noexcept { return children_; }

    // Direct child with the given name.
    [[nodiscard]] Component *findComponent(std::string_view name) const;

    // Depth-first search of the whole subtree, this component excluded.
    [[nodiscard]] Component *findDescendant(std::string_view name) const;

    [[nodiscard]] const Component *action() const noexcept { return action_; }
    void setAction(const Component *action) noexcept { action_ = action; }
    [[nodiscard]] bool hasAction() const noexcept { return action_ != nullptr; }

    // Dot-joined names from root (inclusive) down to this component. Empty
    // when root is not an ancestor of this component.
    [[nodiscard]] std::string qualifiedName(const Component &root) const;

private:
    const TypeDescriptor &type_;
    std::string name_;
    Component *owner_{nullptr};
    const Component *action_{nullptr};
    std::vector<std::unique_ptr<Component>> children_;
};

} // namespace polyglot::model
