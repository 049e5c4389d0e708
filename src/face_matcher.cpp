#include "face_matcher.hpp"
#include "image_processor.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <iostream>
#include <utility>

FaceMatcher::FaceMatcher(const MatchConfig& config, std::shared_ptr<const FaceEmbedder> embedder)
    : config(config), embedder(std::move(embedder)) {
}

MatchStrategy FaceMatcher::selectStrategy() const {
    if (embedder && embedder->isAvailable()) {
        return MatchStrategy::EMBEDDING;
    }
    return MatchStrategy::HISTOGRAM_FALLBACK;
}

MatchOutcome FaceMatcher::match(const cv::Mat& candidate_frame, const FaceRegion& candidate,
                                const cv::Mat& reference_frame, const FaceRegion& reference,
                                MatchPolicy policy) const {
    if (selectStrategy() == MatchStrategy::EMBEDDING) {
        try {
            auto outcome = matchByEmbedding(candidate_frame, candidate, reference_frame, reference, policy);
            if (outcome.strategy == MatchStrategy::EMBEDDING) {
                return outcome;
            }
        } catch (const std::exception& e) {
            std::cerr << "Embedding model invocation failed: " << e.what() << std::endl;
        }
    }

    std::cout << "Using histogram fallback for face comparison" << std::endl;
    MatchOutcome outcome = matchByHistogram(candidate, reference);
    outcome.model_unavailable = true;
    return outcome;
}

float FaceMatcher::compareFaces(const FaceEmbedding& encoding1, const FaceEmbedding& encoding2) {
    if (encoding1.size() == 0 || encoding2.size() == 0 || encoding1.size() != encoding2.size()) {
        return 1.0f; // Maximum distance for invalid encodings
    }

    return dlib::length(encoding1 - encoding2);
}

float FaceMatcher::confidenceFromDistance(float distance) {
    float confidence = (1.0f - distance) * 100.0f;
    return std::max(0.0f, std::min(100.0f, confidence));
}

double FaceMatcher::histogramCorrelation(const cv::Mat& face1, const cv::Mat& face2) const {
    if (face1.empty() || face2.empty()) {
        return 0.0;
    }

    const cv::Size common_size(config.histogram_crop_size, config.histogram_crop_size);

    cv::Mat gray1, gray2;
    cv::resize(ImageProcessor::toGrayscale(face1), gray1, common_size);
    cv::resize(ImageProcessor::toGrayscale(face2), gray2, common_size);

    int hist_size = 256;
    float range[] = {0, 256};
    const float* hist_range = {range};
    int channel = 0;

    cv::Mat hist1, hist2;
    cv::calcHist(&gray1, 1, &channel, cv::Mat(), hist1, 1, &hist_size, &hist_range);
    cv::calcHist(&gray2, 1, &channel, cv::Mat(), hist2, 1, &hist_size, &hist_range);

    return cv::compareHist(hist1, hist2, cv::HISTCMP_CORREL);
}

MatchOutcome FaceMatcher::matchByEmbedding(const cv::Mat& candidate_frame, const FaceRegion& candidate,
                                           const cv::Mat& reference_frame, const FaceRegion& reference,
                                           MatchPolicy policy) const {
    MatchOutcome outcome;
    outcome.strategy = MatchStrategy::HISTOGRAM_FALLBACK;

    auto candidate_encoding = embedder->encode(candidate_frame, candidate);
    auto reference_encoding = embedder->encode(reference_frame, reference);
    if (!candidate_encoding || !reference_encoding) {
        std::cerr << "Embedding model returned no encoding" << std::endl;
        return outcome;
    }

    outcome.strategy = MatchStrategy::EMBEDDING;
    outcome.distance = compareFaces(*candidate_encoding, *reference_encoding);
    outcome.threshold = static_cast<float>(config.tolerance(policy));
    outcome.is_match = outcome.distance <= outcome.threshold;
    outcome.confidence = confidenceFromDistance(outcome.distance);

    std::cout << "Embedding comparison: distance " << outcome.distance
              << ", tolerance " << outcome.threshold
              << " (" << matchPolicyToString(policy) << ")" << std::endl;
    return outcome;
}

MatchOutcome FaceMatcher::matchByHistogram(const FaceRegion& candidate, const FaceRegion& reference) const {
    double correlation = histogramCorrelation(candidate.pixels, reference.pixels);

    MatchOutcome outcome;
    outcome.strategy = MatchStrategy::HISTOGRAM_FALLBACK;
    outcome.distance = static_cast<float>(1.0 - correlation);
    outcome.threshold = static_cast<float>(config.histogram_correlation_floor);
    outcome.is_match = correlation >= config.histogram_correlation_floor;
    outcome.confidence = confidenceFromDistance(outcome.distance);

    std::cout << "Histogram comparison: correlation " << correlation
              << ", floor " << config.histogram_correlation_floor << std::endl;
    return outcome;
}
