#pragma once

#include "caseforge/arguments.h"
#include "caseforge/reflect.h"

#include <any>
#include <cstddef>
#include <vector>

namespace caseforge::detail {

// One argument list per TestCaseAttribute declared on the method itself.
std::vector<ArgumentList> collect_inline_cases(const MethodInfo &method);

// Argument lists enumerated from one case source. A source name that matches
// no member, or more than one, yields nothing.
std::vector<ArgumentList> collect_source_cases(const MethodInfo &method, const TestCaseSourceAttribute &source);

// TestCaseData -> its arguments; ArgumentList of matching arity -> as-is;
// anything else -> a one-element list.
ArgumentList to_argument_list(const std::any &element, std::size_t parameter_count);

} // namespace caseforge::detail
