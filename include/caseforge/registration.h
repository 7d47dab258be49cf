#pragma once

// Registration helpers that fill the reflection side table from member
// pointers.
//
//   struct Calculator {
//       static std::vector<int> samples() { return {10, 20, 30}; }
//       void add(int a, int b);
//       void check(int x);
//   };
//
//   auto fixture = caseforge::TypeBuilder<Calculator>("Calculator")
//                      .static_method("samples", &Calculator::samples)
//                      .test("add", &Calculator::add,
//                            {caseforge::TestCaseAttribute{caseforge::args(1, 2)}}, {"a", "b"})
//                      .test("check", &Calculator::check,
//                            {caseforge::TestCaseSourceAttribute{"samples"}}, {"x"})
//                      .build();
//
// Source members may be backed by any range; every element is stored as a
// std::any so TestCaseData, ArgumentList and raw values keep their own
// conversion rules in the expander.

#include "caseforge/reflect.h"

#include <cstddef>
#include <memory>
#include <ranges>
#include <string>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

namespace caseforge {

// A registered fixture type and its candidate test methods, in registration order.
struct Fixture {
    std::shared_ptr<const TypeInfo> type;
    std::vector<MethodInfo>         methods;
};

namespace detail {

template <typename R>
    requires std::ranges::input_range<const R>
CaseSequence to_case_sequence(const R &range) {
    CaseSequence out;
    for (const auto &element : range)
        out.emplace_back(element);
    return out;
}

void check_arity(std::string_view method, std::size_t needed, std::size_t passed);
void check_instance(std::string_view method, const void *instance);

template <typename T, typename F, typename... Params, std::size_t... I>
void call_member(F fn, T &self, const ArgumentList &arguments, std::index_sequence<I...>) {
    (void)(self.*fn)(std::any_cast<std::decay_t<Params>>(arguments[I])...);
}

template <typename F, typename... Params, std::size_t... I>
void call_static(F fn, const ArgumentList &arguments, std::index_sequence<I...>) {
    (void)fn(std::any_cast<std::decay_t<Params>>(arguments[I])...);
}

} // namespace detail

template <typename T> class TypeBuilder {
  public:
    explicit TypeBuilder(std::string name) {
        info_.name = std::move(name);
        if constexpr (std::is_default_constructible_v<T>) {
            info_.construct = [] { return std::shared_ptr<void>(std::make_shared<T>()); };
        }
    }

    template <typename V> TypeBuilder &field(std::string name, V T::*member, Access access = Access::Public) {
        return add_member(std::move(name), MemberKind::Field, access, false,
                          [member](void *instance) { return detail::to_case_sequence(static_cast<T *>(instance)->*member); });
    }

    template <typename V> TypeBuilder &static_field(std::string name, const V *value, Access access = Access::Public) {
        return add_member(std::move(name), MemberKind::Field, access, true,
                          [value](void *) { return detail::to_case_sequence(*value); });
    }

    template <typename R> TypeBuilder &property(std::string name, R (T::*getter)() const, Access access = Access::Public) {
        return add_member(std::move(name), MemberKind::Property, access, false,
                          [getter](void *instance) { return detail::to_case_sequence((static_cast<T *>(instance)->*getter)()); });
    }

    template <typename R> TypeBuilder &static_property(std::string name, R (*getter)(), Access access = Access::Public) {
        return add_member(std::move(name), MemberKind::Property, access, true,
                          [getter](void *) { return detail::to_case_sequence(getter()); });
    }

    template <typename R> TypeBuilder &method(std::string name, R (T::*fn)(), Access access = Access::Public) {
        return add_member(std::move(name), MemberKind::Method, access, false,
                          [fn](void *instance) { return detail::to_case_sequence((static_cast<T *>(instance)->*fn)()); });
    }

    template <typename R> TypeBuilder &method(std::string name, R (T::*fn)() const, Access access = Access::Public) {
        return add_member(std::move(name), MemberKind::Method, access, false,
                          [fn](void *instance) { return detail::to_case_sequence((static_cast<T *>(instance)->*fn)()); });
    }

    template <typename R> TypeBuilder &static_method(std::string name, R (*fn)(), Access access = Access::Public) {
        return add_member(std::move(name), MemberKind::Method, access, true,
                          [fn](void *) { return detail::to_case_sequence(fn()); });
    }

    template <typename R, typename... Params>
    TypeBuilder &test(std::string name, R (T::*fn)(Params...), std::vector<Attribute> attributes = {},
                      std::vector<std::string> parameter_names = {}) {
        return add_member_test<R, Params...>(std::move(name), fn, std::move(attributes), std::move(parameter_names));
    }

    template <typename R, typename... Params>
    TypeBuilder &test(std::string name, R (T::*fn)(Params...) const, std::vector<Attribute> attributes = {},
                      std::vector<std::string> parameter_names = {}) {
        return add_member_test<R, Params...>(std::move(name), fn, std::move(attributes), std::move(parameter_names));
    }

    template <typename R, typename... Params>
    TypeBuilder &static_test(std::string name, R (*fn)(Params...), std::vector<Attribute> attributes = {},
                             std::vector<std::string> parameter_names = {}) {
        MethodInfo info = make_method<R, Params...>(std::move(name), std::move(attributes), std::move(parameter_names));
        info.is_static  = true;
        info.invoke     = [fn, method = info.name](void *, const ArgumentList &arguments) {
            detail::check_arity(method, sizeof...(Params), arguments.size());
            detail::call_static<decltype(fn), Params...>(fn, arguments, std::index_sequence_for<Params...>{});
        };
        methods_.push_back(std::move(info));
        return *this;
    }

    // Link the most recently registered test to the declaration it overrides.
    TypeBuilder &inherits(const MethodInfo &base) {
        if (methods_.empty())
            throw reflection_error("inherits() requires a previously registered test on '" + info_.name + "'");
        methods_.back().base_declaration = &base;
        return *this;
    }

    [[nodiscard]] Fixture build() const {
        Fixture out;
        out.type    = std::make_shared<const TypeInfo>(info_);
        out.methods = methods_;
        for (auto &m : out.methods)
            m.reflected_type = out.type;
        return out;
    }

  private:
    template <typename Reader>
    TypeBuilder &add_member(std::string name, MemberKind kind, Access access, bool is_static, Reader reader) {
        MemberInfo member;
        member.name      = std::move(name);
        member.kind      = kind;
        member.access    = access;
        member.is_static = is_static;
        member.read      = std::move(reader);
        info_.members.push_back(std::move(member));
        return *this;
    }

    template <typename R, typename... Params>
    MethodInfo make_method(std::string name, std::vector<Attribute> attributes, std::vector<std::string> parameter_names) const {
        if (!parameter_names.empty() && parameter_names.size() != sizeof...(Params)) {
            throw reflection_error("test '" + info_.name + "/" + name + "' declares " + std::to_string(sizeof...(Params)) +
                                   " parameters but " + std::to_string(parameter_names.size()) + " parameter names were given");
        }
        MethodInfo info;
        info.name        = std::move(name);
        info.return_type = std::type_index(typeid(R));
        info.attributes  = std::move(attributes);
        [[maybe_unused]] std::size_t idx = 0;
        ((info.parameters.push_back(ParameterInfo{
              .name = parameter_names.empty() ? "arg" + std::to_string(idx) : parameter_names[idx],
              .type = std::type_index(typeid(std::decay_t<Params>)),
          }),
          ++idx),
         ...);
        return info;
    }

    template <typename R, typename... Params, typename F>
    TypeBuilder &add_member_test(std::string name, F fn, std::vector<Attribute> attributes, std::vector<std::string> parameter_names) {
        MethodInfo info = make_method<R, Params...>(std::move(name), std::move(attributes), std::move(parameter_names));
        info.invoke     = [fn, method = info.name](void *instance, const ArgumentList &arguments) {
            detail::check_instance(method, instance);
            detail::check_arity(method, sizeof...(Params), arguments.size());
            detail::call_member<T, F, Params...>(fn, *static_cast<T *>(instance), arguments, std::index_sequence_for<Params...>{});
        };
        methods_.push_back(std::move(info));
        return *this;
    }

    TypeInfo                info_;
    std::vector<MethodInfo> methods_;
};

} // namespace caseforge
