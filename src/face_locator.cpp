#include "face_locator.hpp"
#include "image_processor.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>

namespace {

const char* const CASCADE_SEARCH_DIRS[] = {
    "/usr/share/opencv4/haarcascades",
    "/usr/local/share/opencv4/haarcascades",
    "/opt/homebrew/share/opencv4/haarcascades",
    "/usr/share/opencv/haarcascades"
};

} // namespace

std::optional<FailureReason> evaluateFaceCount(size_t face_count) {
    if (face_count == 0) {
        return FailureReason::NO_FACE_DETECTED;
    }
    if (face_count > 1) {
        return FailureReason::MULTIPLE_FACES_DETECTED;
    }
    return std::nullopt;
}

bool eyesVisible(const EyePair& eyes, const FaceRegion& face) {
    if (!eyes.bothVisible()) {
        return false;
    }

    const cv::Rect face_local(0, 0, face.bounds.width, face.bounds.height);
    int contained = 0;
    for (const auto& eye : eyes.eyes) {
        bool inside = (eye & face_local) == eye;
        bool smaller = eye.width < face.bounds.width && eye.height < face.bounds.height;
        if (inside && smaller) {
            contained++;
        }
    }
    return contained >= 2;
}

bool meetsMinimumSize(const cv::Rect& region, int min_size) {
    return region.width >= min_size && region.height >= min_size;
}

double detectionScale(const cv::Size& frame_size, int max_dimension) {
    int largest_side = std::max(frame_size.width, frame_size.height);
    if (max_dimension <= 0 || largest_side <= max_dimension) {
        return 1.0;
    }
    return static_cast<double>(max_dimension) / largest_side;
}

int scaledMinimumSize(int min_size, double scale) {
    return std::max(1, static_cast<int>(std::ceil(min_size * scale)));
}

cv::Rect mapToFrame(const cv::Rect& detection, double scale, const cv::Size& frame_size) {
    cv::Rect rect(static_cast<int>(std::lround(detection.x / scale)),
                  static_cast<int>(std::lround(detection.y / scale)),
                  static_cast<int>(std::lround(detection.width / scale)),
                  static_cast<int>(std::lround(detection.height / scale)));
    return rect & cv::Rect(0, 0, frame_size.width, frame_size.height);
}

CascadeFaceLocator::CascadeFaceLocator(const LocatorConfig& config)
    : config(config), initialized(false) {
}

bool CascadeFaceLocator::initialize(const std::string& models_path) {
    auto face_file = findCascadeFile(config.face_cascade_path, models_path);
    auto eye_file = findCascadeFile(config.eye_cascade_path, models_path);

    if (!face_file || !eye_file) {
        std::cerr << "Cascade files not found. Required:" << std::endl;
        std::cerr << "  - " << config.face_cascade_path << std::endl;
        std::cerr << "  - " << config.eye_cascade_path << std::endl;
        initialized = false;
        return false;
    }

    // Test-load once so corrupt artifacts are reported at startup
    cv::CascadeClassifier test_face;
    cv::CascadeClassifier test_eyes;
    if (!test_face.load(*face_file) || !test_eyes.load(*eye_file)) {
        std::cerr << "Failed to load cascade classifiers from " << *face_file
                  << " and " << *eye_file << std::endl;
        initialized = false;
        return false;
    }

    face_cascade_file = *face_file;
    eye_cascade_file = *eye_file;
    initialized = true;

    std::cout << "Face cascade loaded: " << face_cascade_file << std::endl;
    std::cout << "Eye cascade loaded: " << eye_cascade_file << std::endl;
    return true;
}

std::vector<FaceRegion> CascadeFaceLocator::locateFaces(const cv::Mat& frame) const {
    if (!initialized) {
        throw VerificationError("Face locator used before cascades were loaded");
    }

    std::vector<FaceRegion> regions;
    if (frame.empty()) {
        return regions;
    }

    cv::Mat gray = ImageProcessor::toGrayscale(frame);

    // Large frames are shrunk first so the pyramid depth stays bounded
    double scale = detectionScale(gray.size(), config.max_detection_dimension);
    if (scale < 1.0) {
        cv::resize(gray, gray, cv::Size(), scale, scale, cv::INTER_AREA);
    }

    int scaled_min_size = scaledMinimumSize(config.min_face_size, scale);

    std::vector<cv::Rect> detections;
    threadClassifiers().face.detectMultiScale(gray, detections, config.scale_factor, config.min_neighbors,
                                              0, cv::Size(scaled_min_size, scaled_min_size));

    for (const auto& detection : detections) {
        cv::Rect rect = mapToFrame(detection, scale, frame.size());

        if (!meetsMinimumSize(rect, config.min_face_size)) {
            continue;
        }
        regions.emplace_back(frame, rect);
    }

    return regions;
}

EyePair CascadeFaceLocator::locateEyes(const FaceRegion& face) const {
    if (!initialized) {
        throw VerificationError("Face locator used before cascades were loaded");
    }

    EyePair pair;
    if (face.pixels.empty()) {
        return pair;
    }

    cv::Mat roi_gray = ImageProcessor::toGrayscale(face.pixels);

    std::vector<cv::Rect> detections;
    threadClassifiers().eyes.detectMultiScale(roi_gray, detections, config.scale_factor, config.min_neighbors,
                                              0, cv::Size(config.min_eye_size, config.min_eye_size));

    const cv::Rect face_local(0, 0, face.bounds.width, face.bounds.height);
    for (const auto& eye : detections) {
        if ((eye & face_local) == eye) {
            pair.eyes.push_back(eye);
        }
    }

    return pair;
}

CascadeFaceLocator::Classifiers& CascadeFaceLocator::threadClassifiers() const {
    return classifiers.get([this]() {
        auto loaded = std::make_unique<Classifiers>();
        if (!loaded->face.load(face_cascade_file) || !loaded->eyes.load(eye_cascade_file)) {
            throw VerificationError("Cascade classifiers could not be materialized from " + face_cascade_file);
        }
        return loaded;
    });
}

std::optional<std::string> CascadeFaceLocator::findCascadeFile(const std::string& name,
                                                               const std::string& models_path) {
    namespace fs = std::filesystem;

    std::vector<fs::path> candidates;
    candidates.emplace_back(name);
    if (!fs::path(name).is_absolute()) {
        candidates.push_back(fs::path(models_path) / name);
        for (const char* dir : CASCADE_SEARCH_DIRS) {
            candidates.push_back(fs::path(dir) / name);
        }
    }

    std::error_code ec;
    for (const auto& candidate : candidates) {
        if (fs::is_regular_file(candidate, ec)) {
            return candidate.string();
        }
    }
    return std::nullopt;
}
