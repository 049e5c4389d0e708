#ifndef VERIFICATION_TYPES_HPP
#define VERIFICATION_TYPES_HPP

#include <opencv2/core.hpp>
#include <dlib/matrix.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

// Rejection taxonomy reported through VerificationResult::failure_reason
enum class FailureReason {
    MALFORMED_IMAGE = 0,
    IMAGE_TOO_BLURRY = 1,
    NO_FACE_DETECTED = 2,
    MULTIPLE_FACES_DETECTED = 3,
    EYES_NOT_VISIBLE = 4,
    SPOOFING_DETECTED = 5,
    NO_REFERENCE_IMAGE = 6,
    INVALID_REFERENCE_IMAGE = 7,
    MATCH_BELOW_THRESHOLD = 8
};

enum class MatchStrategy {
    EMBEDDING = 0,
    HISTOGRAM_FALLBACK = 1
};

// Caller-selected decision policy for the embedding distance threshold
enum class MatchPolicy {
    STRICT = 0,
    DEFAULT = 1,
    RELAXED = 2
};

std::string failureReasonToString(FailureReason reason);
std::string failureGuidance(FailureReason reason);
std::string matchStrategyToString(MatchStrategy strategy);
std::string matchPolicyToString(MatchPolicy policy);
std::optional<MatchPolicy> parseMatchPolicy(const std::string& name);

// Fixed-length identity vector produced by the embedding network
using FaceEmbedding = dlib::matrix<float,0,1>;

// Face rectangle plus the sub-image it bounds; pixels is a view into the source frame
struct FaceRegion {
    cv::Rect bounds;
    cv::Mat pixels;

    FaceRegion() = default;
    FaceRegion(const cv::Mat& frame, const cv::Rect& rect) : bounds(rect), pixels(frame(rect)) {}
};

// Eye rectangles relative to the parent FaceRegion
struct EyePair {
    std::vector<cv::Rect> eyes;

    bool bothVisible() const { return eyes.size() >= 2; }
};

struct SpoofSignal {
    std::string technique;
    double metric;
    bool passed;
    std::string reason;

    SpoofSignal() : metric(0.0), passed(false) {}
    SpoofSignal(std::string technique_id, double value, bool ok, std::string message)
        : technique(std::move(technique_id)), metric(value), passed(ok), reason(std::move(message)) {}

    json toJson() const {
        return json{
            {"technique", technique},
            {"metric", metric},
            {"passed", passed},
            {"reason", reason}
        };
    }
};

struct VerifyOptions {
    MatchPolicy policy = MatchPolicy::DEFAULT;
    bool include_match_details = false;
};

struct VerificationResult {
    bool accepted;
    float confidence_score;                     // 0-100
    std::optional<FailureReason> failure_reason;
    std::string failure_message;
    std::string failed_technique;               // set for SPOOFING_DETECTED only
    MatchStrategy match_strategy_used;
    bool model_unavailable;
    std::vector<SpoofSignal> spoof_signals;

    // Only reported when VerifyOptions::include_match_details is set
    std::optional<float> match_distance;
    std::optional<float> match_threshold;

    VerificationResult() : accepted(false), confidence_score(0.0f),
                           match_strategy_used(MatchStrategy::EMBEDDING),
                           model_unavailable(false) {}

    static VerificationResult rejected(FailureReason reason);

    json toJson() const;
};

// Unexpected pipeline fault, distinct from the rejection taxonomy
class VerificationError : public std::runtime_error {
public:
    explicit VerificationError(const std::string& message) : std::runtime_error(message) {}
};

#endif // VERIFICATION_TYPES_HPP
