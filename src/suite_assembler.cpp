#include "caseforge/builder.h"

#include "log.h"

#include <utility>

namespace caseforge {

Test build_from(const MethodInfo &method) {
    std::vector<ArgumentList> data = expand_test_cases(method);

    if (data.empty())
        return build_test_method(method, std::nullopt);
    if (data.size() == 1)
        return build_test_method(method, std::move(data.front()));

    ParameterizedMethodSuite suite(method);
    for (auto &arguments : data)
        suite.add(build_test_method(method, std::move(arguments)));
    detail::log_debug("built {} cases for {}", suite.size(), suite.full_name());
    return suite;
}

std::vector<Test> build_fixture(const Fixture &fixture) {
    std::vector<Test> tests;
    tests.reserve(fixture.methods.size());
    for (const auto &method : fixture.methods) {
        if (!is_test_method(method)) {
            detail::log_debug("{}/{} is not a test method", method.fixture_name(), method.name);
            continue;
        }
        tests.push_back(build_from(method));
    }
    return tests;
}

} // namespace caseforge
