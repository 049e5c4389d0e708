#ifndef ANTISPOOF_SPOOF_BATTERY_HPP
#define ANTISPOOF_SPOOF_BATTERY_HPP

#include "antispoof/spoof_techniques.hpp"
#include "verification_config.hpp"
#include "verification_types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace antispoof {

struct SpoofTechnique {
    std::string id;
    std::function<SpoofSignal(const SpoofFrame&)> evaluate;
};

struct BatteryResult {
    bool passed = true;
    std::vector<SpoofSignal> signals;         // evaluation order
    std::optional<size_t> first_failure;      // index into signals

    const SpoofSignal* firstFailure() const {
        return first_failure ? &signals[*first_failure] : nullptr;
    }
};

// Ordered, fail-closed set of presentation-attack heuristics.
// Techniques always run in insertion order, so the first failing reason is reproducible.
class SpoofBattery {
public:
    SpoofBattery(std::vector<SpoofTechnique> techniques, bool evaluate_all);

    // The six standard techniques in their documented order
    static SpoofBattery standard(const SpoofConfig& config);

    void append(SpoofTechnique technique);

    // Runs every technique (or stops at the first failure when evaluate_all is off)
    BatteryResult run(const cv::Mat& frame, const FaceRegion& face) const;

    std::vector<std::string> techniqueIds() const;
    size_t size() const { return techniques.size(); }

private:
    std::vector<SpoofTechnique> techniques;
    bool evaluate_all;
};

} // namespace antispoof

#endif // ANTISPOOF_SPOOF_BATTERY_HPP
