#include "hqa/i18n/translator.hpp"
#include "hqa/utils/string_utils.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <fstream>

namespace hqa::i18n {

    using json = nlohmann::json;

    namespace {

        struct CatalogEntry {
            std::string_view key;
            std::string_view text;
        };

        constexpr std::array kEnglishCatalog = {
            CatalogEntry{"findings.no_var.message", "Unexpected 'var' declaration"},
            CatalogEntry{"findings.no_var.suggestion",
                         "Use 'const' for bindings that are never reassigned, 'let' otherwise"},
            CatalogEntry{"findings.eqeqeq.message", "Expected '{{strict}}' and instead saw '{{operator}}'"},
            CatalogEntry{"findings.eqeqeq.suggestion",
                         "Replace '{{operator}}' with '{{strict}}' to avoid implicit type coercion"},
            CatalogEntry{"findings.no_console.message", "Unexpected console.{{method}} statement"},
            CatalogEntry{"findings.no_console.suggestion",
                         "Remove the debug statement or route the output through a logger"},
            CatalogEntry{"findings.no_magic_numbers.message", "Unnamed numeric constant {{value}}"},
            CatalogEntry{"findings.no_magic_numbers.suggestion", "Extract {{value}} into a named constant"},
            CatalogEntry{"findings.complexity.message",
                         "Function '{{name}}' has a complexity of {{value}} (threshold {{threshold}})"},
            CatalogEntry{"findings.complexity.suggestion",
                         "Split '{{name}}' into smaller functions or simplify its branching"},
            CatalogEntry{"findings.function_length.message",
                         "Function '{{name}}' has {{value}} lines (threshold {{threshold}})"},
            CatalogEntry{"findings.function_length.suggestion",
                         "Extract parts of '{{name}}' into helper functions"},
            CatalogEntry{"findings.parameter_count.message",
                         "Function '{{name}}' has {{value}} parameters (threshold {{threshold}})"},
            CatalogEntry{"findings.parameter_count.suggestion",
                         "Group the parameters of '{{name}}' into a single options object"},
            CatalogEntry{"findings.nesting_depth.message",
                         "Blocks are nested {{value}} levels deep (threshold {{threshold}})"},
            CatalogEntry{"findings.nesting_depth.suggestion",
                         "Use early returns or extract the nested blocks into functions"},

            CatalogEntry{"violations.srp.responsibility.description", "'{{name}}' has too many responsibilities"},
            CatalogEntry{"violations.srp.responsibility.explanation",
                         "'{{name}}' has {{methods}} methods, a combined complexity of {{complexity}} "
                         "and touches {{concerns}} concerns ({{concern_list}})"},
            CatalogEntry{"violations.srp.responsibility.impact",
                         "Changes made for unrelated reasons land in the same unit, "
                         "which makes it harder to test and riskier to modify"},
            CatalogEntry{"violations.srp.responsibility.suggestion",
                         "Split '{{name}}' into smaller units with one responsibility each"},
            CatalogEntry{"violations.srp.class_size.description", "Class '{{name}}' spans {{lines}} lines"},
            CatalogEntry{"violations.srp.class_size.explanation",
                         "Large classes tend to accumulate several responsibilities over time"},
            CatalogEntry{"violations.srp.class_size.impact",
                         "Large classes are hard to understand and to change safely"},
            CatalogEntry{"violations.srp.class_size.suggestion",
                         "Extract cohesive groups of methods from '{{name}}' into separate classes"},
            CatalogEntry{"violations.srp.parameters.description",
                         "Function '{{name}}' takes {{count}} parameters"},
            CatalogEntry{"violations.srp.parameters.explanation",
                         "A long parameter list often means the function coordinates several concerns"},
            CatalogEntry{"violations.srp.parameters.impact",
                         "Callers need to know too much, and every new option touches every call site"},
            CatalogEntry{"violations.srp.parameters.suggestion",
                         "Group the parameters of '{{name}}' into an options object or split the function"},
            CatalogEntry{"violations.srp.class_count.description", "Module defines {{count}} classes"},
            CatalogEntry{"violations.srp.class_count.explanation",
                         "Several classes in one module usually serve different purposes"},
            CatalogEntry{"violations.srp.class_count.impact",
                         "Unrelated changes collide in the same file and imports become coarse"},
            CatalogEntry{"violations.srp.class_count.suggestion", "Move each class into its own module"},
            CatalogEntry{"violations.dip.instantiation.description",
                         "Class '{{name}}' instantiates {{count}} concrete dependencies"},
            CatalogEntry{"violations.dip.instantiation.explanation",
                         "'{{name}}' creates {{dependencies}} itself instead of receiving them"},
            CatalogEntry{"violations.dip.instantiation.impact",
                         "High-level logic is bound to concrete implementations, "
                         "which blocks substitution and isolated testing"},
            CatalogEntry{"violations.dip.instantiation.suggestion",
                         "Inject {{dependencies}} through the constructor and depend on abstractions"},
            CatalogEntry{"violations.default_suggestion", "Review this code against the {{principle}} principle"},
        };

        void flatten(const json& node, const std::string& prefix,
                     std::unordered_map<std::string, std::string>& out) {
            if (node.is_object()) {
                for (const auto& [key, value] : node.items()) {
                    flatten(value, prefix.empty() ? key : prefix + "." + key, out);
                }
            } else if (node.is_string()) {
                out[prefix] = node.get<std::string>();
            }
        }

    }  // namespace

    void Translator::initialize() {
        for (const auto& entry : kEnglishCatalog) {
            messages_.try_emplace(std::string(entry.key), std::string(entry.text));
        }
        initialized_ = true;
    }

    Result<void, Error> Translator::load_catalog(const fs::path& path) {
        std::ifstream file(path);
        if (!file) {
            return Result<void, Error>::failure(
                Error::not_found("Catalog file not found", path.filename().string())
            );
        }

        try {
            json data = json::parse(file);
            if (!data.is_object()) {
                return Result<void, Error>::failure(
                    Error::parse_error("Catalog root must be an object", path.filename().string())
                );
            }
            flatten(data, "", messages_);
        } catch (const json::parse_error& e) {
            return Result<void, Error>::failure(
                Error::parse_error("Catalog parse error", path.filename().string() + ": " + e.what())
            );
        }

        initialized_ = true;
        return Result<void, Error>::success();
    }

    Result<void, Error> Translator::load_catalog_string(std::string_view json_text) {
        try {
            json data = json::parse(json_text);
            if (!data.is_object()) {
                return Result<void, Error>::failure(
                    Error::parse_error("Catalog root must be an object", "inline")
                );
            }
            flatten(data, "", messages_);
        } catch (const json::parse_error& e) {
            return Result<void, Error>::failure(Error::parse_error("Catalog parse error", e.what()));
        }

        initialized_ = true;
        return Result<void, Error>::success();
    }

    std::string Translator::translate(std::string_view key, const Params& params) const {
        if (!initialized_) {
            return std::string(key);
        }

        const auto it = messages_.find(std::string(key));
        if (it == messages_.end()) {
            return std::string(key);
        }

        std::string text = it->second;
        for (const auto& [name, value] : params) {
            text = string_utils::replace_all(text, "{{" + name + "}}", value);
        }
        return text;
    }

}  // namespace hqa::i18n
