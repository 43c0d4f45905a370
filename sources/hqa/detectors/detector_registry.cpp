#include "hqa/detectors/pattern_detectors.hpp"

namespace hqa::detectors
{
    std::vector<std::unique_ptr<IDetector>> make_default_detectors() {
        std::vector<std::unique_ptr<IDetector>> detectors;
        detectors.push_back(std::make_unique<DeprecatedDeclarationDetector>());
        detectors.push_back(std::make_unique<WeakEqualityDetector>());
        detectors.push_back(std::make_unique<DebugStatementDetector>());
        detectors.push_back(std::make_unique<MagicNumberDetector>());
        return detectors;
    }
}  // namespace hqa::detectors
