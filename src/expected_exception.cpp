#include "caseforge/expected_exception.h"

#include <fmt/core.h>
#include <regex>
#include <typeinfo>
#include <utility>

namespace caseforge {

namespace {

struct ThrownInfo {
    std::string type;
    std::string message;
};

ThrownInfo describe_thrown(const std::exception_ptr &thrown) {
    try {
        std::rethrow_exception(thrown);
    } catch (const std::exception &e) {
        return ThrownInfo{type_name(typeid(e)), e.what()};
    } catch (...) {
        return ThrownInfo{"unknown exception", std::string{}};
    }
}

std::string_view expectation_label(MessageMatch match) {
    switch (match) {
    case MessageMatch::Exact: return "Expected: ";
    case MessageMatch::Contains: return "Expected message containing: ";
    case MessageMatch::StartsWith: return "Expected message starting: ";
    case MessageMatch::Regex: return "Expected message matching: ";
    }
    return "Expected: ";
}

} // namespace

ExpectedExceptionProcessor::ExpectedExceptionProcessor(std::string test_name, ExpectedExceptionAttribute attribute)
    : test_name_(std::move(test_name)), attribute_(std::move(attribute)) {}

ExceptionVerdict ExpectedExceptionProcessor::process_no_exception() const {
    const std::string expected = attribute_.exception_name.empty() ? std::string("An exception") : attribute_.exception_name;
    return ExceptionVerdict{false, with_user_message(fmt::format("{} was expected", expected))};
}

ExceptionVerdict ExpectedExceptionProcessor::process_exception(const std::exception_ptr &thrown) const {
    if (!thrown)
        return process_no_exception();

    const ThrownInfo info = describe_thrown(thrown);
    if (attribute_.matcher && !attribute_.matcher(thrown)) {
        std::string text = fmt::format("An unexpected exception type was thrown\nExpected: {}\n but was: {}", attribute_.exception_name, info.type);
        if (!info.message.empty())
            text += fmt::format(" : {}", info.message);
        return ExceptionVerdict{false, with_user_message(std::move(text))};
    }

    if (attribute_.expected_message && !message_matches(info.message)) {
        return ExceptionVerdict{false, with_user_message(fmt::format("The exception message text was incorrect\n{}{}\n but was: {}",
                                                                     expectation_label(attribute_.match_type),
                                                                     *attribute_.expected_message, info.message))};
    }
    return ExceptionVerdict{true, std::string{}};
}

bool ExpectedExceptionProcessor::message_matches(const std::string &actual) const {
    const std::string &expected = *attribute_.expected_message;
    switch (attribute_.match_type) {
    case MessageMatch::Exact: return actual == expected;
    case MessageMatch::Contains: return actual.find(expected) != std::string::npos;
    case MessageMatch::StartsWith: return actual.rfind(expected, 0) == 0;
    case MessageMatch::Regex:
        try {
            return std::regex_search(actual, std::regex(expected));
        } catch (const std::regex_error &) {
            return false;
        }
    }
    return false;
}

std::string ExpectedExceptionProcessor::with_user_message(std::string text) const {
    if (attribute_.user_message.empty())
        return text;
    return attribute_.user_message + "\n" + text;
}

} // namespace caseforge
