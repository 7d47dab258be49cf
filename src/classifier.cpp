#include "caseforge/builder.h"

namespace caseforge {

bool is_test_method(const MethodInfo &method) {
    return is_defined<TestAttribute>(method, Inherit::Yes) || is_defined<TestCaseAttribute>(method, Inherit::Yes) ||
           is_defined<TestCaseSourceAttribute>(method, Inherit::Yes);
}

} // namespace caseforge
