#include "caseforge/reflect.h"
#include "caseforge/registration.h"

#include <fmt/core.h>

namespace caseforge {

std::vector<const MemberInfo *> find_members(const TypeInfo &type, std::string_view name) {
    std::vector<const MemberInfo *> out;
    for (const auto &member : type.members) {
        if (member.name == name)
            out.push_back(&member);
    }
    return out;
}

std::shared_ptr<void> construct_instance(const TypeInfo &type) {
    if (!type.construct)
        throw reflection_error(fmt::format("type '{}' has no default constructor", type.name));
    auto instance = type.construct();
    if (!instance)
        throw reflection_error(fmt::format("constructing '{}' produced no instance", type.name));
    return instance;
}

namespace detail {

void check_arity(std::string_view method, std::size_t needed, std::size_t passed) {
    if (needed != passed)
        throw reflection_error(fmt::format("'{}' takes {} arguments but was invoked with {}", method, needed, passed));
}

void check_instance(std::string_view method, const void *instance) {
    if (instance == nullptr)
        throw reflection_error(fmt::format("'{}' is a member test and needs a fixture instance", method));
}

} // namespace detail

} // namespace caseforge
