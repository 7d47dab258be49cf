#pragma once

// Test case construction pipeline:
//
//   is_test_method -> expand_test_cases -> build_test_method (per case) -> build_from
//
// None of these throw for malformed tests: signature problems become
// NotRunnable cases with a reason, and unresolvable case sources contribute no
// cases. Exceptions raised while constructing or reading a case source do
// propagate.
//
// Built tests refer to the MethodInfo they came from; keep the Fixture (or the
// MethodInfo) alive for as long as the tests are used.

#include "caseforge/arguments.h"
#include "caseforge/reflect.h"
#include "caseforge/registration.h"
#include "caseforge/test.h"

#include <optional>
#include <vector>

namespace caseforge {

// True when the method (or a base declaration) is marked with TestAttribute,
// TestCaseAttribute or TestCaseSourceAttribute.
[[nodiscard]] bool is_test_method(const MethodInfo &method);

// Inline cases first, then every case source in declaration order.
[[nodiscard]] std::vector<ArgumentList> expand_test_cases(const MethodInfo &method);

// Build and validate one case. `arguments` is nullopt for argument-less tests.
[[nodiscard]] TestMethod build_test_method(const MethodInfo &method, std::optional<ArgumentList> arguments);

// A single TestMethod for zero or one argument sets, otherwise a
// ParameterizedMethodSuite holding one case per set.
[[nodiscard]] Test build_from(const MethodInfo &method);

// Classify and build every registered method of a fixture, in registration order.
[[nodiscard]] std::vector<Test> build_fixture(const Fixture &fixture);

} // namespace caseforge
