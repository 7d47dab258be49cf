#include "case_expander.h"

#include "caseforge/builder.h"
#include "log.h"

#include <iterator>
#include <memory>

namespace caseforge {

namespace detail {

std::vector<ArgumentList> collect_inline_cases(const MethodInfo &method) {
    std::vector<ArgumentList> data;
    for (const auto *attr : get_attributes<TestCaseAttribute>(method, Inherit::No))
        data.push_back(attr->arguments);
    return data;
}

std::vector<ArgumentList> collect_source_cases(const MethodInfo &method, const TestCaseSourceAttribute &source) {
    const TypeInfo *source_type = source.source_type ? source.source_type.get() : method.reflected_type.get();
    if (source_type == nullptr) {
        log_debug("case source '{}' on '{}' has no source type; contributing no cases", source.source_name, method.name);
        return {};
    }

    const auto members = find_members(*source_type, source.source_name);
    if (members.size() != 1) {
        log_debug("case source '{}' on '{}' matched {} members of '{}'; contributing no cases", source.source_name, method.name,
                  members.size(), source_type->name);
        return {};
    }

    const MemberInfo &member = *members.front();
    if (!member.read)
        throw reflection_error("case source '" + source_type->name + "::" + member.name + "' has no reader");

    std::shared_ptr<void> instance;
    if (!member.is_static)
        instance = construct_instance(*source_type);
    const CaseSequence sequence = member.read(instance.get());

    const std::size_t         nparams = method.parameters.size();
    std::vector<ArgumentList> data;
    data.reserve(sequence.size());
    for (const auto &element : sequence)
        data.push_back(to_argument_list(element, nparams));
    return data;
}

ArgumentList to_argument_list(const std::any &element, std::size_t parameter_count) {
    if (const auto *explicit_case = std::any_cast<TestCaseData>(&element))
        return explicit_case->arguments;
    if (const auto *list = std::any_cast<ArgumentList>(&element); list != nullptr && list->size() == parameter_count)
        return *list;
    ArgumentList wrapped;
    wrapped.push_back(element);
    return wrapped;
}

} // namespace detail

std::vector<ArgumentList> expand_test_cases(const MethodInfo &method) {
    std::vector<ArgumentList> data = detail::collect_inline_cases(method);
    for (const auto *source : get_attributes<TestCaseSourceAttribute>(method, Inherit::No)) {
        auto more = detail::collect_source_cases(method, *source);
        data.insert(data.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
    }
    return data;
}

} // namespace caseforge
