#pragma once

// Declarative test metadata.
//
// Attributes are plain values attached to a method when its fixture is
// registered (see registration.h), so no source scanning is needed:
//
//   builder.test("add", &Calculator::add,
//                {caseforge::TestCaseAttribute{caseforge::args(1, 2)},
//                 caseforge::TestCaseAttribute{caseforge::args(3, 4)},
//                 caseforge::CategoryAttribute{"math"}});
//
// A method is a test when it carries TestAttribute, TestCaseAttribute or
// TestCaseSourceAttribute. Everything else is metadata applied to runnable
// cases.

#include "caseforge/arguments.h"

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <typeinfo>
#include <variant>

namespace caseforge {

struct TypeInfo;

// Plain test marker.
struct TestAttribute {};

// One inline case: the argument list is passed to the method as-is.
struct TestCaseAttribute {
    ArgumentList arguments;
};

// Named case source. `source_type` defaults to the fixture owning the method.
struct TestCaseSourceAttribute {
    std::string                     source_name;
    std::shared_ptr<const TypeInfo> source_type;
};

enum class MessageMatch {
    Exact,
    Contains,
    StartsWith,
    Regex,
};

// Returns true when the captured exception is the anticipated one.
using ExceptionMatcher = std::function<bool(const std::exception_ptr &)>;

// Expected-failure declaration. An empty matcher accepts any exception.
struct ExpectedExceptionAttribute {
    std::string                exception_name;
    ExceptionMatcher           matcher;
    std::optional<std::string> expected_message;
    MessageMatch               match_type = MessageMatch::Exact;
    std::string                user_message;
};

// Expect an exception of type `E` (or derived from it).
template <typename E>
ExpectedExceptionAttribute expected_exception(std::optional<std::string> message = std::nullopt,
                                              MessageMatch               match_type = MessageMatch::Exact) {
    ExpectedExceptionAttribute attr;
    attr.exception_name   = type_name(typeid(E));
    attr.expected_message = std::move(message);
    attr.match_type       = match_type;
    attr.matcher          = [](const std::exception_ptr &ep) {
        if (!ep)
            return false;
        try {
            std::rethrow_exception(ep);
        } catch (const E &) {
            return true;
        } catch (...) {
            return false;
        }
    };
    return attr;
}

struct DescriptionAttribute {
    std::string text;
};

struct CategoryAttribute {
    std::string name;
};

struct PropertyAttribute {
    std::string name;
    std::string value;
};

struct TimeoutAttribute {
    std::chrono::milliseconds timeout{0};
};

// Runnable cases become Ignored with this reason.
struct IgnoreAttribute {
    std::string reason;
};

using Attribute = std::variant<TestAttribute, TestCaseAttribute, TestCaseSourceAttribute, ExpectedExceptionAttribute,
                               DescriptionAttribute, CategoryAttribute, PropertyAttribute, TimeoutAttribute, IgnoreAttribute>;

} // namespace caseforge
