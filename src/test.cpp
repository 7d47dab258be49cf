#include "caseforge/test.h"

#include <fmt/core.h>

namespace caseforge {

namespace {

std::string case_name(const MethodInfo &method, const std::optional<ArgumentList> &arguments) {
    if (!arguments || arguments->empty())
        return method.name;
    return fmt::format("{}({})", method.name, format_arguments(*arguments));
}

std::string qualify(const MethodInfo &method, const std::string &name) {
    const std::string fixture = method.fixture_name();
    return fixture.empty() ? name : fixture + "/" + name;
}

std::string join(const std::vector<std::string> &values, char sep) {
    std::string out;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i)
            out.push_back(sep);
        out += values[i];
    }
    return out;
}

void append_case_line(std::string &out, const TestMethod &test, std::string_view indent) {
    std::vector<std::string> sections;
    if (!test.metadata().categories.empty())
        sections.push_back("categories=" + join(test.metadata().categories, ','));
    if (test.run_state() != RunState::Runnable) {
        std::string state(to_string(test.run_state()));
        if (!test.reason().empty()) {
            state.push_back('=');
            state.append(test.reason());
        }
        sections.push_back(std::move(state));
    }
    if (const auto *processor = test.exception_processor()) {
        const auto &name = processor->attribute().exception_name;
        sections.push_back("expects=" + (name.empty() ? std::string("any") : name));
    }
    if (test.metadata().timeout)
        sections.push_back(fmt::format("timeout={}ms", test.metadata().timeout->count()));

    out.append(indent);
    out.append(test.full_name());
    if (!sections.empty()) {
        out.append(" [");
        out.append(join(sections, ';'));
        out.push_back(']');
    }
    out.push_back('\n');
}

} // namespace

std::string_view to_string(RunState state) {
    switch (state) {
    case RunState::Runnable: return "runnable";
    case RunState::NotRunnable: return "not-runnable";
    case RunState::Ignored: return "ignored";
    }
    return "runnable";
}

TestMethod::TestMethod(const MethodInfo &method, std::optional<ArgumentList> arguments)
    : method_(&method), arguments_(std::move(arguments)) {
    name_      = case_name(method, arguments_);
    full_name_ = qualify(method, name_);
}

void TestMethod::mark_not_runnable(std::string reason) {
    if (run_state_ != RunState::Runnable)
        return;
    run_state_ = RunState::NotRunnable;
    reason_    = std::move(reason);
}

void TestMethod::mark_ignored(std::string reason) {
    if (run_state_ != RunState::Runnable)
        return;
    run_state_ = RunState::Ignored;
    reason_    = std::move(reason);
}

ParameterizedMethodSuite::ParameterizedMethodSuite(const MethodInfo &method) : method_(&method), full_name_(qualify(method, method.name)) {}

const std::string &test_name(const Test &test) {
    return std::visit([](const auto &t) -> const std::string & { return t.name(); }, test);
}

const std::string &test_full_name(const Test &test) {
    return std::visit([](const auto &t) -> const std::string & { return t.full_name(); }, test);
}

std::size_t test_case_count(const Test &test) {
    if (const auto *suite = std::get_if<ParameterizedMethodSuite>(&test))
        return suite->size();
    return 1;
}

std::vector<const TestMethod *> leaves(const Test &test) {
    std::vector<const TestMethod *> out;
    if (const auto *single = std::get_if<TestMethod>(&test)) {
        out.push_back(single);
        return out;
    }
    const auto &suite = std::get<ParameterizedMethodSuite>(test);
    out.reserve(suite.size());
    for (const auto &t : suite.tests())
        out.push_back(&t);
    return out;
}

std::string describe(const Test &test) {
    std::string out;
    if (const auto *single = std::get_if<TestMethod>(&test)) {
        append_case_line(out, *single, "");
        return out;
    }
    const auto &suite = std::get<ParameterizedMethodSuite>(test);
    out.append(fmt::format("{} ({} cases)\n", suite.full_name(), suite.size()));
    for (const auto &t : suite.tests())
        append_case_line(out, t, "  ");
    return out;
}

} // namespace caseforge
