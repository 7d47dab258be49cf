#pragma once

// Reflection side table consumed by the case builder.
//
// C++ has no runtime introspection, so fixtures describe themselves once at
// registration time: a TypeInfo lists the members usable as case sources and
// how to default-construct the type, a MethodInfo lists one candidate test
// method with its signature and attributes. registration.h fills both from
// member pointers.

#include "caseforge/arguments.h"
#include "caseforge/attributes.h"

#include <any>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeindex>
#include <variant>
#include <vector>

namespace caseforge {

// Raised for registration problems and for case sources that cannot be
// constructed or read. Expected irregularities never use it.
class reflection_error : public std::runtime_error {
  public:
    explicit reflection_error(const std::string &message) : std::runtime_error(message) {}
};

enum class MemberKind {
    Field,
    Property,
    Method,
};

enum class Access {
    Public,
    Protected,
    Private,
};

// Enumerated contents of a case source, one std::any per element.
using CaseSequence = std::vector<std::any>;

struct MemberInfo {
    std::string name;
    MemberKind  kind      = MemberKind::Field;
    Access      access    = Access::Public;
    bool        is_static = false;
    // Reads the field/property or calls the zero-argument method. `instance`
    // is null for static members.
    std::function<CaseSequence(void *instance)> read;
};

struct TypeInfo {
    std::string name;
    // Empty when the type is not default-constructible.
    std::function<std::shared_ptr<void>()> construct;
    std::vector<MemberInfo>                members;
};

struct ParameterInfo {
    std::string     name;
    std::type_index type;
};

// Calls the registered function. `instance` is null for static tests.
using Invoker = std::function<void(void *instance, const ArgumentList &arguments)>;

struct MethodInfo {
    std::string                     name;
    std::shared_ptr<const TypeInfo> reflected_type;
    std::type_index                 return_type{typeid(void)};
    std::vector<ParameterInfo>      parameters;
    std::vector<Attribute>          attributes;
    // Overridden declaration whose attributes are inherited; must outlive this method.
    const MethodInfo               *base_declaration = nullptr;
    bool                            is_static        = false;
    Invoker                         invoke;

    [[nodiscard]] std::string fixture_name() const { return reflected_type ? reflected_type->name : std::string{}; }
};

// All members named `name`, across access levels, static and instance.
std::vector<const MemberInfo *> find_members(const TypeInfo &type, std::string_view name);

// Default-construct an instance of `type`; throws reflection_error when the
// type has no registered constructor.
std::shared_ptr<void> construct_instance(const TypeInfo &type);

enum class Inherit {
    No,
    Yes,
};

// Attributes of kind `A` in declaration order; with Inherit::Yes the base
// declaration chain follows the method's own attributes.
template <typename A> std::vector<const A *> get_attributes(const MethodInfo &method, Inherit inherit) {
    std::vector<const A *> out;
    for (const MethodInfo *current = &method; current != nullptr; current = current->base_declaration) {
        for (const auto &attr : current->attributes) {
            if (const auto *typed = std::get_if<A>(&attr))
                out.push_back(typed);
        }
        if (inherit == Inherit::No)
            break;
    }
    return out;
}

template <typename A> bool is_defined(const MethodInfo &method, Inherit inherit) {
    for (const MethodInfo *current = &method; current != nullptr; current = current->base_declaration) {
        for (const auto &attr : current->attributes) {
            if (std::holds_alternative<A>(attr))
                return true;
        }
        if (inherit == Inherit::No)
            break;
    }
    return false;
}

} // namespace caseforge
