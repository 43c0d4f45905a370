#include "hqa/principles/dip_checker.hpp"
#include "hqa/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <regex>

namespace hqa::principles
{
    namespace {

        constexpr std::array<std::string_view, 24> kBuiltinClasses = {
            "Array", "ArrayBuffer", "Date", "Error", "EvalError", "Map", "Object", "Promise",
            "Proxy", "RangeError", "ReferenceError", "RegExp", "Set", "SyntaxError", "TypeError",
            "URL", "URLSearchParams", "Uint8Array", "WeakMap", "WeakRef", "WeakSet",
            "AbortController", "TextDecoder", "TextEncoder"
        };

        const std::regex& instantiation_pattern() {
            static const std::regex rx(R"(\bnew\s+([A-Z][\w$]*)\s*\()");
            return rx;
        }

    }  // namespace

    std::vector<std::string> DIPChecker::concrete_instantiations(std::string_view code) {
        std::vector<std::string> names;
        const std::string text(code);

        for (auto it = std::sregex_iterator(text.begin(), text.end(), instantiation_pattern());
             it != std::sregex_iterator(); ++it) {
            std::string name = (*it)[1].str();
            if (std::ranges::find(kBuiltinClasses, name) != kBuiltinClasses.end()) {
                continue;
            }
            if (std::ranges::find(names, name) == names.end()) {
                names.push_back(std::move(name));
            }
        }

        return names;
    }

    std::vector<Violation> DIPChecker::check(const FileStructure& structure) const {
        std::vector<Violation> violations;
        const auto& thresholds = config().dip.instantiations;

        for (const auto& cls : structure.classes) {
            const auto dependencies = concrete_instantiations(cls.code);
            const auto count = static_cast<double>(dependencies.size());
            if (count < thresholds.low) {
                continue;
            }

            auto draft = draft_from_catalog("violations.dip.instantiation", {
                {"name", cls.name},
                {"count", std::to_string(dependencies.size())},
                {"dependencies", string_utils::join(dependencies, ", ")}
            });
            draft.line = cls.line;
            draft.class_name = cls.name;

            ViolationMetrics m;
            m.dependencies = dependencies.size();
            m.method_count = cls.methods.size();
            m.lines_of_code = cls.line_count();
            draft.metrics = std::move(m);

            violations.push_back(make_violation(severity_from_thresholds(count, thresholds), structure,
                                                std::move(draft)));
        }

        return violations;
    }

}  // namespace hqa::principles
