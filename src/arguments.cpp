#include "caseforge/arguments.h"

#include <cstdint>
#include <cstdlib>
#include <fmt/format.h>
#include <memory>
#include <string>
#include <string_view>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace caseforge {

namespace {

std::string quote(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char ch : s) {
        switch (ch) {
        case '\\': out += "\\\\"; break;
        case '"': out += "\\\""; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default: out.push_back(ch); break;
        }
    }
    out.push_back('"');
    return out;
}

template <typename T> const T *as(const Argument &value) { return std::any_cast<T>(&value); }

} // namespace

std::string type_name(const std::type_info &type) {
#if defined(__GNUG__)
    int                                    status = 0;
    std::unique_ptr<char, void (*)(void *)> demangled(abi::__cxa_demangle(type.name(), nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled)
        return std::string(demangled.get());
#endif
    return std::string(type.name());
}

std::string format_argument(const Argument &value) {
    if (!value.has_value())
        return "null";
    if (const auto *v = as<bool>(value))
        return *v ? "true" : "false";
    if (const auto *v = as<char>(value))
        return fmt::format("'{}'", *v);
    if (const auto *v = as<int>(value))
        return fmt::format("{}", *v);
    if (const auto *v = as<unsigned>(value))
        return fmt::format("{}", *v);
    if (const auto *v = as<long>(value))
        return fmt::format("{}", *v);
    if (const auto *v = as<unsigned long>(value))
        return fmt::format("{}", *v);
    if (const auto *v = as<long long>(value))
        return fmt::format("{}", *v);
    if (const auto *v = as<unsigned long long>(value))
        return fmt::format("{}", *v);
    if (const auto *v = as<float>(value))
        return fmt::format("{}", *v);
    if (const auto *v = as<double>(value))
        return fmt::format("{}", *v);
    if (const auto *v = as<std::string>(value))
        return quote(*v);
    if (const auto *v = as<std::string_view>(value))
        return quote(*v);
    if (const auto *v = as<const char *>(value))
        return *v != nullptr ? quote(*v) : std::string("null");
    if (const auto *v = as<ArgumentList>(value))
        return "[" + format_arguments(*v) + "]";
    if (const auto *v = as<TestCaseData>(value))
        return "TestCaseData(" + format_arguments(v->arguments) + ")";
    return "<" + type_name(value.type()) + ">";
}

std::string format_arguments(const ArgumentList &values) {
    std::string out;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i)
            out += ", ";
        out += format_argument(values[i]);
    }
    return out;
}

} // namespace caseforge
