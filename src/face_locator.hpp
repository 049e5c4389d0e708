#ifndef FACE_LOCATOR_HPP
#define FACE_LOCATOR_HPP

#include "thread_cache.hpp"
#include "verification_config.hpp"
#include "verification_types.hpp"
#include <opencv2/core.hpp>
#include <opencv2/objdetect.hpp>
#include <optional>
#include <string>
#include <vector>

// Detection seam used by the verifier; implementations must be safe for concurrent calls
class FaceLocator {
public:
    virtual ~FaceLocator() = default;

    // All face regions found in the frame, each fully contained within it
    virtual std::vector<FaceRegion> locateFaces(const cv::Mat& frame) const = 0;

    // Eye regions inside the face, relative to the face sub-image
    virtual EyePair locateEyes(const FaceRegion& face) const = 0;
};

// Exactly one face is accepted; the largest face is never picked among several
std::optional<FailureReason> evaluateFaceCount(size_t face_count);

// Both eyes must be found, each smaller than and inside the parent face
bool eyesVisible(const EyePair& eyes, const FaceRegion& face);

bool meetsMinimumSize(const cv::Rect& region, int min_size);

// Factor that brings the largest side down to max_dimension; 1.0 when the frame already fits
double detectionScale(const cv::Size& frame_size, int max_dimension);

// Smallest detector window at this scale whose mapped-back size is still at least min_size
int scaledMinimumSize(int min_size, double scale);

// Detection from the scaled frame in full-frame coordinates, clipped to the frame
cv::Rect mapToFrame(const cv::Rect& detection, double scale, const cv::Size& frame_size);

class CascadeFaceLocator : public FaceLocator {
public:
    explicit CascadeFaceLocator(const LocatorConfig& config);
    ~CascadeFaceLocator() override = default;

    // Resolve and test-load both cascade files
    bool initialize(const std::string& models_path);

    std::vector<FaceRegion> locateFaces(const cv::Mat& frame) const override;
    EyePair locateEyes(const FaceRegion& face) const override;

    bool isInitialized() const { return initialized; }

    const std::string& faceCascadeFile() const { return face_cascade_file; }
    const std::string& eyeCascadeFile() const { return eye_cascade_file; }

private:
    struct Classifiers {
        cv::CascadeClassifier face;
        cv::CascadeClassifier eyes;
    };

    LocatorConfig config;
    std::string face_cascade_file;
    std::string eye_cascade_file;
    bool initialized;

    // cv::CascadeClassifier keeps per-call scratch state, so each worker thread gets its own
    ThreadCache<Classifiers> classifiers;
    Classifiers& threadClassifiers() const;

    static std::optional<std::string> findCascadeFile(const std::string& name, const std::string& models_path);
};

#endif // FACE_LOCATOR_HPP
