#include "face_verifier.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace {

std::string utcTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);

    char result[40];
    std::snprintf(result, sizeof(result), "%s.%03lldZ", buffer, static_cast<long long>(millis));
    return result;
}

VerificationResult rejectWith(FailureReason reason, MatchStrategy strategy) {
    VerificationResult result = VerificationResult::rejected(reason);
    result.match_strategy_used = strategy;
    result.model_unavailable = strategy == MatchStrategy::HISTOGRAM_FALLBACK;
    return result;
}

} // namespace

FaceVerifier::FaceVerifier(const VerificationConfig& config,
                           std::shared_ptr<const FaceLocator> locator,
                           std::shared_ptr<const FaceEmbedder> embedder,
                           std::shared_ptr<AuditSink> audit_sink)
    : FaceVerifier(config, std::move(locator), std::move(embedder), std::move(audit_sink),
                   antispoof::SpoofBattery::standard(config.spoof)) {
}

FaceVerifier::FaceVerifier(const VerificationConfig& config,
                           std::shared_ptr<const FaceLocator> locator,
                           std::shared_ptr<const FaceEmbedder> embedder,
                           std::shared_ptr<AuditSink> audit_sink,
                           antispoof::SpoofBattery battery)
    : config(config),
      locator(std::move(locator)),
      audit_sink(std::move(audit_sink)),
      image_processor(config.quality),
      battery(std::move(battery)),
      matcher(config.match, std::move(embedder)) {
    if (!this->locator) {
        throw std::invalid_argument("FaceVerifier requires a face locator");
    }
}

VerificationResult FaceVerifier::verify(const std::string& candidate_image,
                                        const std::optional<std::string>& reference_image,
                                        const VerifyOptions& options) const {
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
    };

    VerificationResult result;
    try {
        result = runPipeline(candidate_image, reference_image, options);
    } catch (const VerificationError& e) {
        json event = buildAuditEvent(VerificationResult(), options, elapsed());
        event["outcome"] = "error";
        event["error"] = e.what();
        emitAudit(event);
        throw;
    } catch (const cv::Exception& e) {
        json event = buildAuditEvent(VerificationResult(), options, elapsed());
        event["outcome"] = "error";
        event["error"] = e.what();
        emitAudit(event);
        throw VerificationError(std::string("Image analysis failed: ") + e.what());
    }

    emitAudit(buildAuditEvent(result, options, elapsed()));
    return result;
}

VerificationResult FaceVerifier::rejectUnusableReference(const VerifyOptions& options) const {
    auto start = std::chrono::steady_clock::now();
    VerificationResult result = rejectWith(FailureReason::INVALID_REFERENCE_IMAGE, matcher.selectStrategy());
    int64_t elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    emitAudit(buildAuditEvent(result, options, elapsed_ms));
    return result;
}

VerificationResult FaceVerifier::runPipeline(const std::string& candidate_image,
                                             const std::optional<std::string>& reference_image,
                                             const VerifyOptions& options) const {
    // Precondition checked before any image work
    if (!reference_image || reference_image->empty()) {
        return rejectWith(FailureReason::NO_REFERENCE_IMAGE, matcher.selectStrategy());
    }

    // Bound once per call; a model failure later can still demote it to the fallback
    const MatchStrategy strategy = matcher.selectStrategy();

    // Decoding
    cv::Mat frame = image_processor.decodeImage(candidate_image);
    if (frame.empty() || !image_processor.validateImage(frame)) {
        return rejectWith(FailureReason::MALFORMED_IMAGE, strategy);
    }

    double sharpness = ImageProcessor::assessSharpness(frame);
    if (!image_processor.isSharpEnough(sharpness)) {
        std::cout << "Image rejected as blurry, sharpness " << sharpness << std::endl;
        return rejectWith(FailureReason::IMAGE_TOO_BLURRY, strategy);
    }

    // Located
    std::vector<FaceRegion> faces = locator->locateFaces(frame);
    if (auto count_failure = evaluateFaceCount(faces.size())) {
        return rejectWith(*count_failure, strategy);
    }
    const FaceRegion& face = faces.front();

    // EyesChecked
    EyePair eyes = locator->locateEyes(face);
    if (!eyesVisible(eyes, face)) {
        return rejectWith(FailureReason::EYES_NOT_VISIBLE, strategy);
    }

    // SpoofChecked
    antispoof::BatteryResult spoof = battery.run(frame, face);
    if (!spoof.passed) {
        VerificationResult result = rejectWith(FailureReason::SPOOFING_DETECTED, strategy);
        result.spoof_signals = spoof.signals;
        if (const SpoofSignal* failed = spoof.firstFailure()) {
            result.failed_technique = failed->technique;
            result.failure_message = failureGuidance(FailureReason::SPOOFING_DETECTED) + " (" + failed->reason + ")";
        }
        return result;
    }

    // Reference face
    cv::Mat reference_frame = image_processor.decodeImage(*reference_image);
    if (reference_frame.empty() || !image_processor.validateImage(reference_frame)) {
        std::cerr << "Could not decode stored face image" << std::endl;
        VerificationResult result = rejectWith(FailureReason::INVALID_REFERENCE_IMAGE, strategy);
        result.spoof_signals = spoof.signals;
        return result;
    }

    std::vector<FaceRegion> reference_faces = locator->locateFaces(reference_frame);
    if (reference_faces.size() != 1) {
        std::cerr << (reference_faces.empty() ? "No face detected in stored image"
                                              : "Multiple faces detected in stored image") << std::endl;
        VerificationResult result = rejectWith(FailureReason::INVALID_REFERENCE_IMAGE, strategy);
        result.spoof_signals = spoof.signals;
        return result;
    }

    // Matched
    MatchOutcome outcome = matcher.match(frame, face, reference_frame, reference_faces.front(), options.policy);

    // Decided
    VerificationResult result;
    result.spoof_signals = spoof.signals;
    result.confidence_score = outcome.confidence;
    result.match_strategy_used = outcome.strategy;
    result.model_unavailable = outcome.model_unavailable;
    if (options.include_match_details) {
        result.match_distance = outcome.distance;
        result.match_threshold = outcome.threshold;
    }

    if (outcome.is_match) {
        result.accepted = true;
    } else {
        result.accepted = false;
        result.failure_reason = FailureReason::MATCH_BELOW_THRESHOLD;
        result.failure_message = failureGuidance(FailureReason::MATCH_BELOW_THRESHOLD);
    }

    std::cout << "Verification " << (result.accepted ? "accepted" : "rejected")
              << " with confidence " << result.confidence_score
              << " via " << matchStrategyToString(result.match_strategy_used) << std::endl;
    return result;
}

json FaceVerifier::buildAuditEvent(const VerificationResult& result, const VerifyOptions& options,
                                   int64_t elapsed_ms) const {
    json event;
    event["timestamp"] = utcTimestamp();
    event["outcome"] = result.accepted ? "accepted" : "rejected";
    event["failureReason"] = result.failure_reason ? json(failureReasonToString(*result.failure_reason))
                                                   : json(nullptr);
    if (!result.failed_technique.empty()) {
        event["failedTechnique"] = result.failed_technique;
    }
    event["confidenceScore"] = result.confidence_score;
    event["matchStrategyUsed"] = matchStrategyToString(result.match_strategy_used);
    event["modelUnavailable"] = result.model_unavailable;
    event["processingTimeMs"] = elapsed_ms;

    event["thresholds"] = {
        {"policy", matchPolicyToString(options.policy)},
        {"tolerance", config.match.tolerance(options.policy)},
        {"histogramCorrelationFloor", config.match.histogram_correlation_floor},
        {"sharpnessFloor", config.quality.sharpness_floor}
    };

    event["spoofSignals"] = json::array();
    for (const auto& signal : result.spoof_signals) {
        event["spoofSignals"].push_back(signal.toJson());
    }
    return event;
}

void FaceVerifier::emitAudit(const json& event) const {
    if (!audit_sink) {
        return;
    }
    try {
        audit_sink->record(event);
    } catch (const std::exception& e) {
        std::cerr << "Audit sink failed: " << e.what() << std::endl;
    }
}
