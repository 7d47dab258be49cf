#pragma once

#include "caseforge/attributes.h"

#include <exception>
#include <string>

namespace caseforge {

struct ExceptionVerdict {
    bool        passed = false;
    std::string message;
};

// Interprets the outcome of one test case declared with an
// ExpectedExceptionAttribute. Attached by the case builder to runnable cases
// only; the runner consults it instead of treating a throw as a failure.
class ExpectedExceptionProcessor {
  public:
    ExpectedExceptionProcessor(std::string test_name, ExpectedExceptionAttribute attribute);

    [[nodiscard]] const std::string                &test_name() const { return test_name_; }
    [[nodiscard]] const ExpectedExceptionAttribute &attribute() const { return attribute_; }

    // The test returned normally.
    [[nodiscard]] ExceptionVerdict process_no_exception() const;
    // The test threw; `thrown` must be non-null.
    [[nodiscard]] ExceptionVerdict process_exception(const std::exception_ptr &thrown) const;

  private:
    [[nodiscard]] bool        message_matches(const std::string &actual) const;
    [[nodiscard]] std::string with_user_message(std::string text) const;

    std::string                test_name_;
    ExpectedExceptionAttribute attribute_;
};

} // namespace caseforge
