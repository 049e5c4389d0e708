#ifndef ANTISPOOF_SPOOF_TECHNIQUES_HPP
#define ANTISPOOF_SPOOF_TECHNIQUES_HPP

#include "verification_config.hpp"
#include "verification_types.hpp"
#include <opencv2/core.hpp>

namespace antispoof {

// Stable technique identifiers, reported in audit events and failed_technique
constexpr const char* FACE_SHARPNESS = "face_sharpness";
constexpr const char* MOIRE_PATTERN = "moire_pattern";
constexpr const char* COLOR_DISTRIBUTION = "color_distribution";
constexpr const char* SCREEN_BORDER = "screen_border";
constexpr const char* LIGHTING_UNIFORMITY = "lighting_uniformity";
constexpr const char* COMPRESSION_ARTIFACTS = "compression_artifacts";

// Frame prepared once per battery run and shared read-only by every technique
struct SpoofFrame {
    cv::Mat color;  // BGR
    cv::Mat gray;
    cv::Rect face;  // clipped to the frame
};

SpoofFrame prepareFrame(const cv::Mat& frame, const cv::Rect& face);

// 1. Laplacian variance of the face crop; double-compressed photos of photos are soft
SpoofSignal checkFaceSharpness(const SpoofFrame& frame, const SpoofConfig& config);

// 2. Variance of an 8-neighbour high-pass response; screens under a camera alias into moire
SpoofSignal checkMoirePattern(const SpoofFrame& frame, const SpoofConfig& config);

// 3. Hue histogram peak count; emissive displays have a narrow, peaky gamut
SpoofSignal checkColorDistribution(const SpoofFrame& frame, const SpoofConfig& config);

// 4. Large four-sided edge contours outside the face, i.e. device bezels
SpoofSignal checkScreenBorder(const SpoofFrame& frame, const SpoofConfig& config);

// 5. Brightness standard deviation; screen emission lights a frame too evenly
SpoofSignal checkLightingUniformity(const SpoofFrame& frame, const SpoofConfig& config);

// 6. Share of spectrum magnitude on the 8x8 JPEG block grid
SpoofSignal checkCompressionArtifacts(const SpoofFrame& frame, const SpoofConfig& config);

// Metric helpers
double highFrequencyVariance(const cv::Mat& gray);
int countHuePeaks(const cv::Mat& color, double multiplier);
double largestScreenBorderRatio(const cv::Mat& gray, const cv::Rect& face, const SpoofConfig& config);
double blockEnergyRatio(const cv::Mat& gray, int block_size);

} // namespace antispoof

#endif // ANTISPOOF_SPOOF_TECHNIQUES_HPP
