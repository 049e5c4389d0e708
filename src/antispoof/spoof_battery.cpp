#include "antispoof/spoof_battery.hpp"
#include <iostream>
#include <utility>

namespace antispoof {

SpoofBattery::SpoofBattery(std::vector<SpoofTechnique> techniques, bool evaluate_all)
    : techniques(std::move(techniques)), evaluate_all(evaluate_all) {
}

SpoofBattery SpoofBattery::standard(const SpoofConfig& config) {
    std::vector<SpoofTechnique> techniques = {
        {FACE_SHARPNESS, [config](const SpoofFrame& f) { return checkFaceSharpness(f, config); }},
        {MOIRE_PATTERN, [config](const SpoofFrame& f) { return checkMoirePattern(f, config); }},
        {COLOR_DISTRIBUTION, [config](const SpoofFrame& f) { return checkColorDistribution(f, config); }},
        {SCREEN_BORDER, [config](const SpoofFrame& f) { return checkScreenBorder(f, config); }},
        {LIGHTING_UNIFORMITY, [config](const SpoofFrame& f) { return checkLightingUniformity(f, config); }},
        {COMPRESSION_ARTIFACTS, [config](const SpoofFrame& f) { return checkCompressionArtifacts(f, config); }}
    };
    return SpoofBattery(std::move(techniques), config.evaluate_all_techniques);
}

void SpoofBattery::append(SpoofTechnique technique) {
    techniques.push_back(std::move(technique));
}

BatteryResult SpoofBattery::run(const cv::Mat& frame, const FaceRegion& face) const {
    BatteryResult result;
    if (frame.empty()) {
        throw VerificationError("Spoof battery received an empty frame");
    }

    SpoofFrame prepared = prepareFrame(frame, face.bounds);

    for (const auto& technique : techniques) {
        SpoofSignal signal;
        try {
            signal = technique.evaluate(prepared);
        } catch (const cv::Exception& e) {
            throw VerificationError("Spoof technique " + technique.id + " failed: " + e.what());
        }
        signal.technique = technique.id;
        result.signals.push_back(signal);

        if (!signal.passed && !result.first_failure) {
            result.passed = false;
            result.first_failure = result.signals.size() - 1;
            std::cout << "Spoof technique " << technique.id << " failed: " << signal.reason << std::endl;
            if (!evaluate_all) {
                break;
            }
        }
    }

    return result;
}

std::vector<std::string> SpoofBattery::techniqueIds() const {
    std::vector<std::string> ids;
    ids.reserve(techniques.size());
    for (const auto& technique : techniques) {
        ids.push_back(technique.id);
    }
    return ids;
}

} // namespace antispoof
