#ifndef FACE_MATCHER_HPP
#define FACE_MATCHER_HPP

#include "face_recognizer.hpp"
#include "verification_config.hpp"
#include "verification_types.hpp"
#include <opencv2/core.hpp>
#include <memory>

struct MatchOutcome {
    bool is_match;
    float confidence;           // 0-100
    float distance;             // embedding distance, or 1 - correlation on the fallback path
    float threshold;            // distance tolerance or correlation floor in force
    MatchStrategy strategy;
    bool model_unavailable;

    MatchOutcome() : is_match(false), confidence(0.0f), distance(1.0f), threshold(0.0f),
                     strategy(MatchStrategy::EMBEDDING), model_unavailable(false) {}
};

class FaceMatcher {
public:
    FaceMatcher(const MatchConfig& config, std::shared_ptr<const FaceEmbedder> embedder);
    ~FaceMatcher() = default;

    // Embedding when the model is present, otherwise the histogram fallback.
    // Chosen once per call; callers record the result for auditing.
    MatchStrategy selectStrategy() const;

    // Compare the candidate face with the reference face under the given policy
    MatchOutcome match(const cv::Mat& candidate_frame, const FaceRegion& candidate,
                       const cv::Mat& reference_frame, const FaceRegion& reference,
                       MatchPolicy policy) const;

    // Euclidean distance between two embeddings
    static float compareFaces(const FaceEmbedding& encoding1, const FaceEmbedding& encoding2);

    // (1 - distance) * 100, clamped to [0, 100]
    static float confidenceFromDistance(float distance);

    // Correlation of 256-bin grayscale histograms of two face crops resized to a common size
    double histogramCorrelation(const cv::Mat& face1, const cv::Mat& face2) const;

private:
    MatchConfig config;
    std::shared_ptr<const FaceEmbedder> embedder;

    MatchOutcome matchByEmbedding(const cv::Mat& candidate_frame, const FaceRegion& candidate,
                                  const cv::Mat& reference_frame, const FaceRegion& reference,
                                  MatchPolicy policy) const;
    MatchOutcome matchByHistogram(const FaceRegion& candidate, const FaceRegion& reference) const;
};

#endif // FACE_MATCHER_HPP
