#ifndef HQA_SRP_CHECKER_HPP
#define HQA_SRP_CHECKER_HPP

#include "hqa/principles/principle_checker.hpp"

namespace hqa::principles {

    /**
     * Single-responsibility checker.
     *
     * Per class, or per module when the file declares no class, one
     * responsibility violation is emitted when the method count, the
     * combined complexity or the number of distinct import concerns reaches
     * its low threshold; the severity is the worst of the three. The
     * checker also reports oversized classes, units with long parameter
     * lists and modules declaring many classes.
     */
    class SRPChecker final : public PrincipleChecker {
    public:
        using PrincipleChecker::PrincipleChecker;
        using PrincipleChecker::check;

        [[nodiscard]] Principle principle() const noexcept override { return Principle::SRP; }

        [[nodiscard]] std::string_view name() const noexcept override { return "single-responsibility"; }

        [[nodiscard]] std::vector<Violation> check(const FileStructure& structure) const override;

    private:
        void check_responsibilities(const FileStructure& structure, std::vector<Violation>& out) const;
        void check_class_sizes(const FileStructure& structure, std::vector<Violation>& out) const;
        void check_parameter_lists(const FileStructure& structure, std::vector<Violation>& out) const;
        void check_class_count(const FileStructure& structure, std::vector<Violation>& out) const;
    };

}  // namespace hqa::principles

#endif // HQA_SRP_CHECKER_HPP
