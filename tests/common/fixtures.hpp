#pragma once

#include "caseforge/builder.h"
#include "caseforge/registration.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace fixtures {

struct Calculator {
    int last = 0;

    void add(int a, int b) { last = a + b; }
    void check(int x) { last = x; }
    void no_args() {}
    int  returns_value() { return last; }
    void helper() {}

    static std::vector<int> samples() { return {10, 20, 30}; }
};

// Registers the calculator scenarios used across test areas:
//   add            two inline cases (1,2) and (3,4), category "math"
//   check          case source "samples" (static method) -> 10, 20, 30
//   no_args        inline case with one argument on a parameterless method
//   plain          ordinary test without case data
//   helper         no test attributes
//   returns_value  test marker on a non-void method
//   missing_source case source naming a member that does not exist
inline caseforge::Fixture make_calculator() {
    using namespace caseforge;
    return TypeBuilder<Calculator>("Calculator")
        .static_method("samples", &Calculator::samples)
        .test("add", &Calculator::add,
              {TestCaseAttribute{args(1, 2)}, TestCaseAttribute{args(3, 4)}, CategoryAttribute{"math"}}, {"a", "b"})
        .test("check", &Calculator::check, {TestCaseSourceAttribute{"samples", nullptr}}, {"x"})
        .test("no_args", &Calculator::no_args, {TestCaseAttribute{args(1)}})
        .test("plain", &Calculator::no_args, {TestAttribute{}})
        .test("helper", &Calculator::helper)
        .test("returns_value", &Calculator::returns_value, {TestAttribute{}})
        .test("missing_source", &Calculator::check, {TestCaseSourceAttribute{"does_not_exist", nullptr}}, {"x"})
        .build();
}

inline const caseforge::MethodInfo &method_named(const caseforge::Fixture &fixture, const std::string &name) {
    for (const auto &m : fixture.methods) {
        if (m.name == name)
            return m;
    }
    throw std::out_of_range("no registered method named " + name);
}

// Case source whose instance members require construction.
struct PairSource {
    static inline int constructions = 0;

    std::vector<caseforge::ArgumentList> pairs{caseforge::args(1, 2), caseforge::args(5, 8)};

    PairSource() { ++constructions; }

    [[nodiscard]] std::vector<caseforge::TestCaseData> explicit_cases() const { return {caseforge::case_data(7, 9)}; }
    [[nodiscard]] std::vector<int>                     numbers() const { return {4, 5}; }

    static const std::vector<int> shared_numbers;
};

inline const std::vector<int> PairSource::shared_numbers{100, 200};

inline std::shared_ptr<const caseforge::TypeInfo> make_pair_source() {
    using namespace caseforge;
    auto fixture = TypeBuilder<PairSource>("PairSource")
                       .field("pairs", &PairSource::pairs)
                       .method("explicit_cases", &PairSource::explicit_cases)
                       .property("numbers", &PairSource::numbers, Access::Private)
                       .static_field("shared_numbers", &PairSource::shared_numbers)
                       .method("ambiguous", &PairSource::numbers)
                       .property("ambiguous", &PairSource::numbers)
                       .build();
    return fixture.type;
}

struct NoDefaultConstructor {
    explicit NoDefaultConstructor(int initial) : seed(initial) {}
    [[nodiscard]] std::vector<int> values() const { return {seed}; }
    int seed;
};

struct ThrowingSource {
    [[nodiscard]] std::vector<int> broken() const { throw std::runtime_error("source failed"); }
};

} // namespace fixtures
