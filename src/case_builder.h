#pragma once

#include "caseforge/arguments.h"
#include "caseforge/reflect.h"
#include "caseforge/test.h"

namespace caseforge::detail {

// Checks return type and argument count in a fixed order; the first failure
// marks `test` NotRunnable with its reason and returns false.
bool has_valid_signature(TestMethod &test, const MethodInfo &method, const ArgumentList *arguments);

// Description, categories, properties, timeout and ignore, including inherited ones.
void apply_common_attributes(TestMethod &test, const MethodInfo &method);

} // namespace caseforge::detail
