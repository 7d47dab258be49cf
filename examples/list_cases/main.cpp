// Registers a small fixture, lists the cases built from it and, with --run,
// executes the runnable ones.
//
//   caseforge_list_cases [--run]
//   CASEFORGE_LOG=debug caseforge_list_cases

#include "caseforge/builder.h"
#include "caseforge/config.h"

#include <cstdlib>
#include <exception>
#include <fmt/core.h>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct Parser {
    static std::vector<std::string> inputs() { return {"1", "42", "-7"}; }

    std::vector<caseforge::TestCaseData> bad_inputs() const {
        return {caseforge::case_data(std::string("")), caseforge::case_data(std::string("x1"))};
    }

    void parses(std::string text) { (void)std::stoi(text); }
    void rejects(std::string text) {
        if (text.empty() || text.find_first_not_of("-0123456789") != std::string::npos)
            throw std::invalid_argument("not a number: '" + text + "'");
    }
    void sums(int a, int b) {
        if (a + b < a)
            throw std::overflow_error("overflow");
    }
    void trims() {}
    int  length(std::string text) { return static_cast<int>(text.size()); }
};

caseforge::Fixture make_parser_fixture() {
    using namespace caseforge;
    return TypeBuilder<Parser>("Parser")
        .static_method("inputs", &Parser::inputs)
        .method("bad_inputs", &Parser::bad_inputs)
        .test("parses", &Parser::parses, {TestCaseSourceAttribute{"inputs", nullptr}, CategoryAttribute{"fast"}}, {"text"})
        .test("rejects", &Parser::rejects,
              {TestCaseSourceAttribute{"bad_inputs", nullptr}, expected_exception<std::invalid_argument>("not a number", MessageMatch::StartsWith)},
              {"text"})
        .test("sums", &Parser::sums, {TestCaseAttribute{args(1, 2)}, TestCaseAttribute{args(3)}}, {"a", "b"})
        .test("trims", &Parser::trims, {TestAttribute{}, IgnoreAttribute{"whitespace rules pending"}})
        .test("length", &Parser::length, {TestCaseAttribute{args(std::string("abc"))}}, {"text"})
        .build();
}

struct RunCounts {
    std::size_t passed  = 0;
    std::size_t failed  = 0;
    std::size_t skipped = 0;
};

void run_case(const caseforge::TestMethod &test, RunCounts &counts) {
    if (!test.is_runnable()) {
        ++counts.skipped;
        return;
    }

    const caseforge::MethodInfo &method = test.method();
    std::shared_ptr<void>        instance;
    if (!method.is_static)
        instance = caseforge::construct_instance(*method.reflected_type);

    std::exception_ptr thrown;
    try {
        method.invoke(instance.get(), test.arguments() ? *test.arguments() : caseforge::ArgumentList{});
    } catch (...) {
        thrown = std::current_exception();
    }

    caseforge::ExceptionVerdict verdict{true, {}};
    if (const auto *processor = test.exception_processor()) {
        verdict = thrown ? processor->process_exception(thrown) : processor->process_no_exception();
    } else if (thrown) {
        try {
            std::rethrow_exception(thrown);
        } catch (const std::exception &e) {
            verdict = caseforge::ExceptionVerdict{false, std::string("unexpected std::exception: ") + e.what()};
        } catch (...) {
            verdict = caseforge::ExceptionVerdict{false, "unknown exception"};
        }
    }

    if (verdict.passed) {
        ++counts.passed;
        fmt::print("[ PASS ] {}\n", test.full_name());
    } else {
        ++counts.failed;
        fmt::print("[ FAIL ] {}\n{}\n", test.full_name(), verdict.message);
    }
}

} // namespace

auto main(int argc, char *argv[]) -> int {
    caseforge::apply_config(caseforge::config_from_env());

    bool run = false;
    for (std::string_view arg : std::span<char *>(argv + 1, static_cast<std::size_t>(argc > 0 ? argc - 1 : 0))) {
        if (arg == "--run") {
            run = true;
        } else {
            fmt::print(stderr, "unknown argument: {}\nusage: caseforge_list_cases [--run]\n", arg);
            return EXIT_FAILURE;
        }
    }

    try {
        const caseforge::Fixture fixture = make_parser_fixture();
        const auto               tests   = caseforge::build_fixture(fixture);

        for (const auto &test : tests)
            fmt::print("{}", caseforge::describe(test));
        if (!run)
            return EXIT_SUCCESS;

        fmt::print("\n");
        RunCounts counts;
        for (const auto &test : tests) {
            for (const auto *leaf : caseforge::leaves(test))
                run_case(*leaf, counts);
        }
        fmt::print("\n{} passed, {} failed, {} skipped\n", counts.passed, counts.failed, counts.skipped);
        return counts.failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const std::exception &e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
