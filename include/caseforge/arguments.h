#pragma once

#include <any>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

namespace caseforge {

// A single opaque argument value bound to one test parameter.
using Argument = std::any;

// Ordered argument values for one invocation of a test method.
using ArgumentList = std::vector<Argument>;

// Build an ArgumentList from heterogeneous values:
//   caseforge::args(1, 2.5, std::string("x"))
// String literals decay to `const char *`.
template <typename... Ts> ArgumentList args(Ts &&...values) {
    ArgumentList out;
    out.reserve(sizeof...(Ts));
    (out.emplace_back(std::forward<Ts>(values)), ...);
    return out;
}

// Explicit argument carrier yielded by case sources. Its arguments are used
// verbatim, whatever the parameter count of the consuming method.
struct TestCaseData {
    ArgumentList arguments;
};

template <typename... Ts> TestCaseData case_data(Ts &&...values) { return TestCaseData{args(std::forward<Ts>(values)...)}; }

// Human-readable type name (demangled where the ABI allows it).
std::string type_name(const std::type_info &type);

// Render one argument for display names and listings. Known scalar and string
// types print as literals, nested lists as `[a, b]`, anything else as `<type>`.
std::string format_argument(const Argument &value);

// Comma-separated rendering of a whole list, without brackets.
std::string format_arguments(const ArgumentList &values);

} // namespace caseforge
