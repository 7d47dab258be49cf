#include "common/fixtures.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <variant>
#include <vector>

using namespace caseforge;
using fixtures::method_named;

namespace {

std::vector<int> ints(const std::optional<ArgumentList> &list) {
    std::vector<int> out;
    if (!list)
        return out;
    for (const auto &a : *list)
        out.push_back(std::any_cast<int>(a));
    return out;
}

struct Sequence {
    void step(int) {}
};

} // namespace

TEST(Assembler, InlineCasesBecomeSuite) {
    const auto fixture = fixtures::make_calculator();
    const caseforge::Test test    = build_from(method_named(fixture, "add"));

    const auto *suite = std::get_if<ParameterizedMethodSuite>(&test);
    ASSERT_NE(suite, nullptr);
    EXPECT_EQ(suite->name(), "add");
    EXPECT_EQ(suite->full_name(), "Calculator/add");
    ASSERT_EQ(suite->size(), 2u);
    EXPECT_TRUE(suite->tests()[0].is_runnable());
    EXPECT_TRUE(suite->tests()[1].is_runnable());
    EXPECT_EQ(ints(suite->tests()[0].arguments()), (std::vector<int>{1, 2}));
    EXPECT_EQ(ints(suite->tests()[1].arguments()), (std::vector<int>{3, 4}));
    EXPECT_EQ(suite->tests()[1].full_name(), "Calculator/add(3, 4)");
}

TEST(Assembler, SourceMethodCasesBecomeSuite) {
    const auto fixture = fixtures::make_calculator();
    const caseforge::Test test    = build_from(method_named(fixture, "check"));

    const auto *suite = std::get_if<ParameterizedMethodSuite>(&test);
    ASSERT_NE(suite, nullptr);
    ASSERT_EQ(suite->size(), 3u);
    EXPECT_EQ(ints(suite->tests()[0].arguments()), std::vector<int>{10});
    EXPECT_EQ(ints(suite->tests()[1].arguments()), std::vector<int>{20});
    EXPECT_EQ(ints(suite->tests()[2].arguments()), std::vector<int>{30});
    for (const auto &t : suite->tests())
        EXPECT_TRUE(t.is_runnable()) << t.full_name();
}

TEST(Assembler, NoCaseDataGivesSingleArgumentlessCase) {
    const auto fixture = fixtures::make_calculator();
    const caseforge::Test test    = build_from(method_named(fixture, "plain"));

    const auto *single = std::get_if<TestMethod>(&test);
    ASSERT_NE(single, nullptr);
    EXPECT_TRUE(single->is_runnable());
    EXPECT_FALSE(single->arguments().has_value());
    EXPECT_EQ(single->full_name(), "Calculator/plain");
}

TEST(Assembler, SingleArgumentSetIsNotWrapped) {
    const auto fixture = fixtures::make_calculator();
    const caseforge::Test test    = build_from(method_named(fixture, "no_args"));

    const auto *single = std::get_if<TestMethod>(&test);
    ASSERT_NE(single, nullptr);
    EXPECT_EQ(single->run_state(), RunState::NotRunnable);
    EXPECT_EQ(single->reason(), "Arguments may not be specified for a method with no parameters");
}

TEST(Assembler, SingleValidArgumentSetIsNotWrapped) {
    const auto fixture = TypeBuilder<Sequence>("Sequence").test("step", &Sequence::step, {TestCaseAttribute{args(9)}}).build();
    const caseforge::Test test    = build_from(fixture.methods.front());

    const auto *single = std::get_if<TestMethod>(&test);
    ASSERT_NE(single, nullptr);
    EXPECT_TRUE(single->is_runnable());
    EXPECT_EQ(single->full_name(), "Sequence/step(9)");
}

TEST(Assembler, MissingSourceFallsBackToArgumentlessCase) {
    const auto fixture = fixtures::make_calculator();
    const caseforge::Test test    = build_from(method_named(fixture, "missing_source"));

    const auto *single = std::get_if<TestMethod>(&test);
    ASSERT_NE(single, nullptr);
    EXPECT_EQ(single->run_state(), RunState::NotRunnable);
    EXPECT_EQ(single->reason(), "No arguments provided for a method requiring them");
}

TEST(Assembler, SuiteKeepsInvalidCases) {
    const auto fixture = TypeBuilder<Sequence>("Sequence")
                             .test("step", &Sequence::step,
                                   {TestCaseAttribute{args(1)}, TestCaseAttribute{args(1, 2)}, TestCaseAttribute{args(3)}})
                             .build();
    const caseforge::Test test    = build_from(fixture.methods.front());

    const auto *suite = std::get_if<ParameterizedMethodSuite>(&test);
    ASSERT_NE(suite, nullptr);
    ASSERT_EQ(suite->size(), 3u);
    EXPECT_TRUE(suite->tests()[0].is_runnable());
    EXPECT_EQ(suite->tests()[1].reason(), "Expected 1 arguments, but received 2");
    EXPECT_TRUE(suite->tests()[2].is_runnable());
}

TEST(Assembler, BuildingTwiceIsIdempotent) {
    const auto fixture = fixtures::make_calculator();
    for (const char *name : {"add", "check", "no_args", "missing_source", "returns_value"}) {
        const caseforge::Test first  = build_from(method_named(fixture, name));
        const caseforge::Test second = build_from(method_named(fixture, name));
        const auto a      = leaves(first);
        const auto b      = leaves(second);
        ASSERT_EQ(a.size(), b.size()) << name;
        for (std::size_t i = 0; i < a.size(); ++i) {
            EXPECT_EQ(a[i]->run_state(), b[i]->run_state()) << name;
            EXPECT_EQ(a[i]->reason(), b[i]->reason()) << name;
            EXPECT_EQ(a[i]->full_name(), b[i]->full_name()) << name;
            EXPECT_EQ(ints(a[i]->arguments()), ints(b[i]->arguments())) << name;
        }
    }
}

TEST(Assembler, FixtureSkipsNonTestsAndKeepsOrder) {
    const auto fixture = fixtures::make_calculator();
    const auto tests   = build_fixture(fixture);

    // A method with a single argument set is built as that one case.
    std::vector<std::string> names;
    for (const auto &t : tests)
        names.push_back(test_name(t));
    EXPECT_EQ(names, (std::vector<std::string>{"add", "check", "no_args(1)", "plain", "returns_value", "missing_source"}));
}

TEST(Assembler, LeavesAndCaseCount) {
    const auto fixture = fixtures::make_calculator();
    const auto tests   = build_fixture(fixture);

    std::size_t total = 0;
    for (const auto &t : tests) {
        EXPECT_EQ(leaves(t).size(), test_case_count(t)) << test_full_name(t);
        total += test_case_count(t);
    }
    // add: 2, check: 3, the rest: 1 each.
    EXPECT_EQ(total, 9u);
}

TEST(Assembler, DescribeSuite) {
    const auto fixture = fixtures::make_calculator();
    const caseforge::Test test    = build_from(method_named(fixture, "add"));
    EXPECT_EQ(describe(test), "Calculator/add (2 cases)\n"
                              "  Calculator/add(1, 2) [categories=math]\n"
                              "  Calculator/add(3, 4) [categories=math]\n");
}

TEST(Assembler, DescribeNotRunnableCase) {
    const auto fixture = fixtures::make_calculator();
    const caseforge::Test test    = build_from(method_named(fixture, "returns_value"));
    EXPECT_EQ(describe(test), "Calculator/returns_value [not-runnable=A TestMethod must return void]\n");
}

TEST(Assembler, DescribeExpectationAndTimeout) {
    const auto fixture = TypeBuilder<Sequence>("Sequence")
                             .test("step", &Sequence::step,
                                   {TestCaseAttribute{args(4)}, TimeoutAttribute{std::chrono::milliseconds(50)},
                                    ExpectedExceptionAttribute{}})
                             .build();
    const caseforge::Test test    = build_from(fixture.methods.front());
    EXPECT_EQ(describe(test), "Sequence/step(4) [expects=any;timeout=50ms]\n");
}

TEST(Assembler, DescribeIgnoredCase) {
    const auto fixture = TypeBuilder<Sequence>("Sequence")
                             .test("step", &Sequence::step, {TestCaseAttribute{args(4)}, IgnoreAttribute{"pending"}})
                             .build();
    EXPECT_EQ(describe(build_from(fixture.methods.front())), "Sequence/step(4) [ignored=pending]\n");
}
