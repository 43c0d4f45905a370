#include "hqa/principles/srp_checker.hpp"
#include "hqa/metrics/complexity.hpp"
#include "hqa/utils/string_utils.hpp"

#include <algorithm>
#include <optional>

namespace hqa::principles
{
    namespace {

        /**
         * A class, or the module itself when the file declares no class.
         */
        struct ResponsibilityTarget {
            std::string name;
            std::optional<std::string> class_name;
            std::optional<std::size_t> line;
            std::size_t method_count = 0;
            std::size_t complexity = 0;
            std::size_t lines_of_code = 0;
        };

        void raise(std::optional<ViolationSeverity>& worst, ViolationSeverity severity) {
            if (!worst || severity > *worst) {
                worst = severity;
            }
        }

    }  // namespace

    std::vector<Violation> SRPChecker::check(const FileStructure& structure) const {
        std::vector<Violation> violations;
        check_responsibilities(structure, violations);
        check_class_sizes(structure, violations);
        check_parameter_lists(structure, violations);
        check_class_count(structure, violations);
        return violations;
    }

    void SRPChecker::check_responsibilities(const FileStructure& structure, std::vector<Violation>& out) const {
        const auto& srp = config().srp;
        const auto concerns = classify_import_concerns(structure.imports);

        std::vector<std::string> concern_names;
        for (const auto concern : concerns) {
            concern_names.emplace_back(to_string(concern));
        }

        std::vector<ResponsibilityTarget> targets;
        if (structure.classes.empty()) {
            ResponsibilityTarget module;
            module.name = structure.module_name.empty() ? "module" : structure.module_name;
            module.lines_of_code = structure.line_count;
            for (const auto& unit : top_level_units(structure.units)) {
                ++module.method_count;
                module.complexity += metrics::cyclomatic_complexity(unit.code, config().thresholds.complexity_ceiling);
            }
            targets.push_back(std::move(module));
        } else {
            for (const auto& cls : structure.classes) {
                targets.push_back({cls.name, cls.name, cls.line, cls.methods.size(), cls.complexity, cls.line_count()});
            }
        }

        for (const auto& target : targets) {
            std::optional<ViolationSeverity> worst;
            const auto method_count = static_cast<double>(target.method_count);
            const auto complexity = static_cast<double>(target.complexity);
            const auto concern_count = static_cast<double>(concerns.size());

            if (method_count >= srp.method_count.low) {
                raise(worst, severity_from_thresholds(method_count, srp.method_count));
            }
            if (complexity >= srp.complexity.low) {
                raise(worst, severity_from_thresholds(complexity, srp.complexity));
            }
            if (concern_count >= srp.concerns.low) {
                raise(worst, severity_from_thresholds(concern_count, srp.concerns));
            }
            if (!worst) {
                continue;
            }

            auto draft = draft_from_catalog("violations.srp.responsibility", {
                {"name", target.name},
                {"methods", std::to_string(target.method_count)},
                {"complexity", std::to_string(target.complexity)},
                {"concerns", std::to_string(concerns.size())},
                {"concern_list", concern_names.empty() ? "none" : string_utils::join(concern_names, ", ")}
            });
            draft.line = target.line;
            draft.class_name = target.class_name;

            ViolationMetrics m;
            m.complexity = target.complexity;
            m.method_count = target.method_count;
            m.dependencies = structure.imports.size();
            m.lines_of_code = target.lines_of_code;
            m.import_concerns = concern_names;
            draft.metrics = std::move(m);

            out.push_back(make_violation(*worst, structure, std::move(draft)));
        }
    }

    void SRPChecker::check_class_sizes(const FileStructure& structure, std::vector<Violation>& out) const {
        const auto& thresholds = config().srp.class_lines;

        for (const auto& cls : structure.classes) {
            const auto lines = static_cast<double>(cls.line_count());
            if (lines < thresholds.low) {
                continue;
            }

            auto draft = draft_from_catalog("violations.srp.class_size", {
                {"name", cls.name},
                {"lines", std::to_string(cls.line_count())}
            });
            draft.line = cls.line;
            draft.class_name = cls.name;

            ViolationMetrics m;
            m.method_count = cls.methods.size();
            m.lines_of_code = cls.line_count();
            m.complexity = cls.complexity;
            draft.metrics = std::move(m);

            out.push_back(make_violation(severity_from_thresholds(lines, thresholds), structure, std::move(draft)));
        }
    }

    void SRPChecker::check_parameter_lists(const FileStructure& structure, std::vector<Violation>& out) const {
        const auto& thresholds = config().srp.parameters;

        for (const auto& unit : structure.units) {
            const auto count = static_cast<double>(unit.parameters.size());
            if (count < thresholds.low) {
                continue;
            }

            auto draft = draft_from_catalog("violations.srp.parameters", {
                {"name", unit.name},
                {"count", std::to_string(unit.parameters.size())}
            });
            draft.line = unit.start_line;
            draft.method_name = unit.name;

            const auto owner = std::ranges::find_if(structure.classes, [&](const ClassUnit& cls) {
                return unit.start_line >= cls.line && unit.start_line <= cls.end_line;
            });
            if (owner != structure.classes.end()) {
                draft.class_name = owner->name;
            }

            ViolationMetrics m;
            m.parameters = unit.parameters.size();
            m.lines_of_code = unit.line_count();
            draft.metrics = std::move(m);

            out.push_back(make_violation(severity_from_thresholds(count, thresholds), structure, std::move(draft)));
        }
    }

    void SRPChecker::check_class_count(const FileStructure& structure, std::vector<Violation>& out) const {
        const auto& thresholds = config().srp.classes_per_file;
        const auto count = static_cast<double>(structure.classes.size());
        if (count < thresholds.low) {
            return;
        }

        auto draft = draft_from_catalog("violations.srp.class_count", {
            {"count", std::to_string(structure.classes.size())}
        });

        ViolationMetrics m;
        m.class_count = structure.classes.size();
        m.lines_of_code = structure.line_count;
        draft.metrics = std::move(m);

        out.push_back(make_violation(severity_from_thresholds(count, thresholds), structure, std::move(draft)));
    }

}  // namespace hqa::principles
