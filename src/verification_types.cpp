#include "verification_types.hpp"

std::string failureReasonToString(FailureReason reason) {
    switch (reason) {
        case FailureReason::MALFORMED_IMAGE: return "MalformedImage";
        case FailureReason::IMAGE_TOO_BLURRY: return "ImageTooBlurry";
        case FailureReason::NO_FACE_DETECTED: return "NoFaceDetected";
        case FailureReason::MULTIPLE_FACES_DETECTED: return "MultipleFacesDetected";
        case FailureReason::EYES_NOT_VISIBLE: return "EyesNotVisible";
        case FailureReason::SPOOFING_DETECTED: return "SpoofingDetected";
        case FailureReason::NO_REFERENCE_IMAGE: return "NoReferenceImage";
        case FailureReason::INVALID_REFERENCE_IMAGE: return "InvalidReferenceImage";
        case FailureReason::MATCH_BELOW_THRESHOLD: return "MatchBelowThreshold";
        default: return "Unknown";
    }
}

std::string failureGuidance(FailureReason reason) {
    switch (reason) {
        case FailureReason::MALFORMED_IMAGE:
            return "Image could not be decoded. Submit a JPEG or PNG photo.";
        case FailureReason::IMAGE_TOO_BLURRY:
            return "Image is too blurry. Hold the camera steady and retake the photo.";
        case FailureReason::NO_FACE_DETECTED:
            return "No face detected. Please ensure your face is clearly visible.";
        case FailureReason::MULTIPLE_FACES_DETECTED:
            return "Multiple faces detected. Please ensure only your face is in the image.";
        case FailureReason::EYES_NOT_VISIBLE:
            return "Eyes not clearly visible. Please remove sunglasses or any accessories covering your face.";
        case FailureReason::SPOOFING_DETECTED:
            return "Live capture required. Photos of screens or printed pictures are not accepted.";
        case FailureReason::NO_REFERENCE_IMAGE:
            return "No profile face image found. Please upload a profile picture with your face.";
        case FailureReason::INVALID_REFERENCE_IMAGE:
            return "Stored profile image has no usable face. Please upload a new profile picture.";
        case FailureReason::MATCH_BELOW_THRESHOLD:
            return "Face does not match the enrolled profile.";
        default:
            return "Verification failed.";
    }
}

std::string matchStrategyToString(MatchStrategy strategy) {
    switch (strategy) {
        case MatchStrategy::EMBEDDING: return "embedding";
        case MatchStrategy::HISTOGRAM_FALLBACK: return "histogram-fallback";
        default: return "unknown";
    }
}

std::string matchPolicyToString(MatchPolicy policy) {
    switch (policy) {
        case MatchPolicy::STRICT: return "strict";
        case MatchPolicy::DEFAULT: return "default";
        case MatchPolicy::RELAXED: return "relaxed";
        default: return "default";
    }
}

std::optional<MatchPolicy> parseMatchPolicy(const std::string& name) {
    if (name == "strict") return MatchPolicy::STRICT;
    if (name == "default") return MatchPolicy::DEFAULT;
    if (name == "relaxed") return MatchPolicy::RELAXED;
    return std::nullopt;
}

VerificationResult VerificationResult::rejected(FailureReason reason) {
    VerificationResult result;
    result.accepted = false;
    result.failure_reason = reason;
    result.failure_message = failureGuidance(reason);
    return result;
}

json VerificationResult::toJson() const {
    json j;
    j["accepted"] = accepted;
    j["confidenceScore"] = confidence_score;
    j["failureReason"] = failure_reason ? json(failureReasonToString(*failure_reason)) : json(nullptr);
    j["failureMessage"] = failure_reason ? json(failure_message) : json(nullptr);
    if (!failed_technique.empty()) {
        j["failedTechnique"] = failed_technique;
    }
    j["matchStrategyUsed"] = matchStrategyToString(match_strategy_used);
    j["modelUnavailable"] = model_unavailable;

    j["spoofSignals"] = json::array();
    for (const auto& signal : spoof_signals) {
        j["spoofSignals"].push_back(signal.toJson());
    }

    if (match_distance) {
        j["matchDistance"] = *match_distance;
    }
    if (match_threshold) {
        j["matchThreshold"] = *match_threshold;
    }
    return j;
}
