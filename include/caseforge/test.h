#pragma once

#include "caseforge/arguments.h"
#include "caseforge/expected_exception.h"
#include "caseforge/reflect.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace caseforge {

enum class RunState {
    Runnable,
    NotRunnable,
    Ignored,
};

std::string_view to_string(RunState state);

// Declarative metadata propagated from the method onto runnable cases.
struct TestMetadata {
    std::string                                      description;
    std::vector<std::string>                         categories;
    std::vector<std::pair<std::string, std::string>> properties;
    std::optional<std::chrono::milliseconds>         timeout;
};

// One executable test case: a method plus an optional bound argument list.
//
// The run state only ever moves away from Runnable, so a case marked
// NotRunnable or Ignored keeps that state and its first reason.
class TestMethod {
  public:
    TestMethod(const MethodInfo &method, std::optional<ArgumentList> arguments);

    [[nodiscard]] const MethodInfo                  &method() const { return *method_; }
    [[nodiscard]] const std::string                 &name() const { return name_; }
    [[nodiscard]] const std::string                 &full_name() const { return full_name_; }
    [[nodiscard]] const std::optional<ArgumentList> &arguments() const { return arguments_; }
    [[nodiscard]] RunState                           run_state() const { return run_state_; }
    [[nodiscard]] const std::string                 &reason() const { return reason_; }
    [[nodiscard]] bool                               is_runnable() const { return run_state_ == RunState::Runnable; }

    [[nodiscard]] const TestMetadata &metadata() const { return metadata_; }
    TestMetadata                     &metadata() { return metadata_; }

    // Null unless the method declares an expected exception and the case is valid.
    [[nodiscard]] const ExpectedExceptionProcessor *exception_processor() const {
        return exception_processor_ ? &*exception_processor_ : nullptr;
    }
    void set_exception_processor(ExpectedExceptionProcessor processor) { exception_processor_ = std::move(processor); }

    void mark_not_runnable(std::string reason);
    void mark_ignored(std::string reason);

  private:
    const MethodInfo                         *method_;
    std::optional<ArgumentList>               arguments_;
    std::string                               name_;
    std::string                               full_name_;
    RunState                                  run_state_ = RunState::Runnable;
    std::string                               reason_;
    TestMetadata                              metadata_;
    std::optional<ExpectedExceptionProcessor> exception_processor_;
};

// Cases expanded from one parameterized method, in expansion order.
class ParameterizedMethodSuite {
  public:
    explicit ParameterizedMethodSuite(const MethodInfo &method);

    [[nodiscard]] const MethodInfo              &method() const { return *method_; }
    [[nodiscard]] const std::string             &name() const { return method_->name; }
    [[nodiscard]] const std::string             &full_name() const { return full_name_; }
    [[nodiscard]] const std::vector<TestMethod> &tests() const { return tests_; }
    [[nodiscard]] std::size_t                    size() const { return tests_.size(); }

    void add(TestMethod test) { tests_.push_back(std::move(test)); }

  private:
    const MethodInfo       *method_;
    std::string             full_name_;
    std::vector<TestMethod> tests_;
};

using Test = std::variant<TestMethod, ParameterizedMethodSuite>;

const std::string &test_name(const Test &test);
const std::string &test_full_name(const Test &test);
std::size_t        test_case_count(const Test &test);

// Individually reportable cases, in order.
std::vector<const TestMethod *> leaves(const Test &test);

// Indented multi-line listing of a test and its cases.
std::string describe(const Test &test);

} // namespace caseforge
