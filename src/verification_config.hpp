#ifndef VERIFICATION_CONFIG_HPP
#define VERIFICATION_CONFIG_HPP

#include "verification_types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

using json = nlohmann::json;

// All gates are empirically tuned defaults, retunable per deployment and camera hardware.

struct QualityConfig {
    int min_image_width = 100;
    int min_image_height = 100;
    int max_image_dimension = 4096;                   // bounds worst-case pipeline time
    std::size_t max_encoded_bytes = 10 * 1024 * 1024;
    double sharpness_floor = 100.0;                   // Laplacian variance, 8-bit grayscale
};

struct LocatorConfig {
    double scale_factor = 1.1;                        // pyramid shrinks 10% per step
    int min_neighbors = 5;
    int min_face_size = 30;
    int min_eye_size = 30;
    int max_detection_dimension = 1280;
    std::string face_cascade_path = "haarcascade_frontalface_default.xml";
    std::string eye_cascade_path = "haarcascade_eye.xml";
};

struct SpoofConfig {
    double face_sharpness_floor = 100.0;
    double moire_variance_ceiling = 2000.0;
    double hue_peak_multiplier = 3.0;
    int hue_peak_floor = 5;
    int hue_peak_ceiling = 40;
    double border_area_ratio = 0.3;
    double canny_low = 50.0;
    double canny_high = 150.0;
    double brightness_stddev_floor = 20.0;
    int block_size = 8;
    double block_energy_ratio_ceiling = 0.1;
    bool evaluate_all_techniques = true;
};

struct MatchConfig {
    double strict_tolerance = 0.3;
    double default_tolerance = 0.4;
    double relaxed_tolerance = 0.5;
    double histogram_correlation_floor = 0.7;
    int histogram_crop_size = 100;

    double tolerance(MatchPolicy policy) const;
};

struct ModelConfig {
    std::string models_path = "./models";
    std::string face_recognition_model = "dlib_face_recognition_resnet_model_v1.dat";
    std::string shape_predictor = "shape_predictor_68_face_landmarks.dat";

    std::string resolve(const std::string& file_name) const;
};

struct VerificationConfig {
    QualityConfig quality;
    LocatorConfig locator;
    SpoofConfig spoof;
    MatchConfig match;
    ModelConfig models;

    // Absent keys keep their defaults; type mismatches throw std::runtime_error
    static VerificationConfig fromJson(const json& j);
    static VerificationConfig loadFromFile(const std::string& path);

    json toJson() const;
};

#endif // VERIFICATION_CONFIG_HPP
