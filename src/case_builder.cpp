#include "case_builder.h"

#include "caseforge/builder.h"
#include "log.h"

#include <algorithm>
#include <fmt/core.h>
#include <typeindex>
#include <utility>

namespace caseforge {

namespace detail {

namespace {
void add_unique(std::vector<std::string> &values, const std::string &value) {
    if (std::find(values.begin(), values.end(), value) == values.end())
        values.push_back(value);
}
} // namespace

bool has_valid_signature(TestMethod &test, const MethodInfo &method, const ArgumentList *arguments) {
    if (method.return_type != std::type_index(typeid(void))) {
        test.mark_not_runnable("A TestMethod must return void");
        return false;
    }

    const std::size_t needed = method.parameters.size();
    const std::size_t passed = arguments == nullptr ? 0 : arguments->size();

    if (needed == 0 && passed > 0) {
        test.mark_not_runnable("Arguments may not be specified for a method with no parameters");
        return false;
    }

    if (needed > 0 && passed == 0) {
        test.mark_not_runnable("No arguments provided for a method requiring them");
        return false;
    }

    if (needed != passed) {
        test.mark_not_runnable(fmt::format("Expected {} arguments, but received {}", needed, passed));
        return false;
    }

    return true;
}

void apply_common_attributes(TestMethod &test, const MethodInfo &method) {
    auto &meta = test.metadata();

    if (const auto descriptions = get_attributes<DescriptionAttribute>(method, Inherit::Yes); !descriptions.empty())
        meta.description = descriptions.front()->text;
    for (const auto *category : get_attributes<CategoryAttribute>(method, Inherit::Yes))
        add_unique(meta.categories, category->name);
    for (const auto *property : get_attributes<PropertyAttribute>(method, Inherit::Yes))
        meta.properties.emplace_back(property->name, property->value);
    if (const auto timeouts = get_attributes<TimeoutAttribute>(method, Inherit::Yes); !timeouts.empty())
        meta.timeout = timeouts.front()->timeout;

    if (const auto ignores = get_attributes<IgnoreAttribute>(method, Inherit::Yes); !ignores.empty())
        test.mark_ignored(ignores.front()->reason);
}

} // namespace detail

TestMethod build_test_method(const MethodInfo &method, std::optional<ArgumentList> arguments) {
    TestMethod test(method, std::move(arguments));

    const ArgumentList *bound = test.arguments() ? &*test.arguments() : nullptr;
    if (!detail::has_valid_signature(test, method, bound)) {
        detail::log_debug("{} is not runnable: {}", test.full_name(), test.reason());
        return test;
    }

    detail::apply_common_attributes(test, method);

    const auto expected = get_attributes<ExpectedExceptionAttribute>(method, Inherit::No);
    if (!expected.empty())
        test.set_exception_processor(ExpectedExceptionProcessor(test.full_name(), *expected.front()));

    return test;
}

} // namespace caseforge
