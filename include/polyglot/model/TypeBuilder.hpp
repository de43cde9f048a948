#pragma once

#include "polyglot/model/Component.hpp"
#include "polyglot/model/TypeDescriptor.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace polyglot::model {

/**
 * @brief Fluent declaration of the attributes a component type exposes.
 *
 * Accessors receive the concrete type T; the builder wraps them so that the
 * engines can work with plain Component references.
 *
 * @code
 * auto descriptor = TypeBuilder<Button>("Button")
 *     .text("Caption", &Button::caption, &Button::setCaption)
 *     .build();
 * @endcode
 */
template <typename T>
class TypeBuilder {
public:
    using Getter = std::function<std::string(const T &)>;
    using Setter = std::function<void(T &, const std::string &)>;
    using ListGetter = std::function<std::vector<std::string>(const T &)>;
    using ListSetter = std::function<void(T &, const std::vector<std::string> &)>;

    explicit TypeBuilder(std::string typeName) {
        descriptor_.name = std::move(typeName);

        AttributeDescriptor identity;
        identity.name = std::string{kNameAttribute};
        identity.readText = [](const Component &component) { return component.name(); };
        identity.writeText = [](Component &component, const std::string &value) { component.setName(value); };
        descriptor_.attributes.push_back(std::move(identity));
    }

    // Copies the attributes of a base type, skipping its identity attribute.
    TypeBuilder &inherit(const TypeDescriptor &base) {
        for (const auto &attribute : base.attributes) {
            if (attribute.name != kNameAttribute) {
                descriptor_.attributes.push_back(attribute);
            }
        }
        return *this;
    }

    TypeBuilder &text(std::string name, Getter getter, Setter setter = {}, bool published = true) {
        AttributeDescriptor attribute;
        attribute.name = std::move(name);
        attribute.type = AttributeType::Text;
        attribute.published = published;
        attribute.readText = wrap(std::move(getter));
        attribute.writeText = wrap(std::move(setter));
        descriptor_.attributes.push_back(std::move(attribute));
        return *this;
    }

    TypeBuilder &textList(std::string name, ListGetter getter, ListSetter setter = {}, bool published = true) {
        AttributeDescriptor attribute;
        attribute.name = std::move(name);
        attribute.type = AttributeType::TextList;
        attribute.published = published;
        if (getter) {
            attribute.readList = [getter = std::move(getter)](const Component &component) {
                return getter(static_cast<const T &>(component));
            };
        }
        if (setter) {
            attribute.writeList = [setter = std::move(setter)](Component &component,
                                                               const std::vector<std::string> &value) {
                setter(static_cast<T &>(component), value);
            };
        }
        descriptor_.attributes.push_back(std::move(attribute));
        return *this;
    }

    // Non-string attribute; the text accessors carry its printable form.
    TypeBuilder &value(std::string name, AttributeType type, Getter getter, Setter setter = {}) {
        AttributeDescriptor attribute;
        attribute.name = std::move(name);
        attribute.type = type;
        attribute.readText = wrap(std::move(getter));
        attribute.writeText = wrap(std::move(setter));
        descriptor_.attributes.push_back(std::move(attribute));
        return *this;
    }

    [[nodiscard]] TypeDescriptor build() const { return descriptor_; }

private:
    static AttributeDescriptor::TextReader wrap(Getter getter) {
        if (!getter) {
            return {};
        }
        return [getter = std::move(getter)](const Component &component) {
            return getter(static_cast<const T &>(component));
        };
    }

    static AttributeDescriptor::TextWriter wrap(Setter setter) {
        if (!setter) {
            return {};
        }
        return [setter = std::move(setter)](Component &component, const std::string &value) {
            setter(static_cast<T &>(component), value);
        };
    }

    TypeDescriptor descriptor_;
};

} // namespace polyglot::model
