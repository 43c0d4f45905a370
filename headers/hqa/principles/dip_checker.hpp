#ifndef HQA_DIP_CHECKER_HPP
#define HQA_DIP_CHECKER_HPP

#include "hqa/principles/principle_checker.hpp"

namespace hqa::principles {

    /**
     * Dependency-inversion checker.
     *
     * Counts the distinct concrete classes a class instantiates with `new`
     * inside its own body. Language built-ins (Date, Map, Error, ...) are
     * not counted.
     */
    class DIPChecker final : public PrincipleChecker {
    public:
        using PrincipleChecker::PrincipleChecker;
        using PrincipleChecker::check;

        [[nodiscard]] Principle principle() const noexcept override { return Principle::DIP; }

        [[nodiscard]] std::string_view name() const noexcept override { return "dependency-inversion"; }

        [[nodiscard]] std::vector<Violation> check(const FileStructure& structure) const override;

        /**
         * Distinct non-built-in class names instantiated in code, in order
         * of first appearance.
         */
        [[nodiscard]] static std::vector<std::string> concrete_instantiations(std::string_view code);
    };

}  // namespace hqa::principles

#endif // HQA_DIP_CHECKER_HPP
