#include "verification_config.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace {

template <typename T>
void readValue(const json& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = section.at(key).get<T>();
    }
}

const json& sectionOf(const json& j, const char* name) {
    static const json empty = json::object();
    if (!j.contains(name)) {
        return empty;
    }
    const json& section = j.at(name);
    if (!section.is_object()) {
        throw std::runtime_error(std::string("Config section '") + name + "' must be an object");
    }
    return section;
}

} // namespace

double MatchConfig::tolerance(MatchPolicy policy) const {
    switch (policy) {
        case MatchPolicy::STRICT: return strict_tolerance;
        case MatchPolicy::RELAXED: return relaxed_tolerance;
        case MatchPolicy::DEFAULT:
        default: return default_tolerance;
    }
}

std::string ModelConfig::resolve(const std::string& file_name) const {
    if (file_name.empty() || file_name[0] == '/') {
        return file_name;
    }
    return models_path + "/" + file_name;
}

VerificationConfig VerificationConfig::fromJson(const json& j) {
    VerificationConfig config;
    if (j.is_null()) {
        return config;
    }
    if (!j.is_object()) {
        throw std::runtime_error("Verification config must be a JSON object");
    }

    try {
        const json& quality = sectionOf(j, "quality");
        readValue(quality, "min_image_width", config.quality.min_image_width);
        readValue(quality, "min_image_height", config.quality.min_image_height);
        readValue(quality, "max_image_dimension", config.quality.max_image_dimension);
        readValue(quality, "max_encoded_bytes", config.quality.max_encoded_bytes);
        readValue(quality, "sharpness_floor", config.quality.sharpness_floor);

        const json& locator = sectionOf(j, "locator");
        readValue(locator, "scale_factor", config.locator.scale_factor);
        readValue(locator, "min_neighbors", config.locator.min_neighbors);
        readValue(locator, "min_face_size", config.locator.min_face_size);
        readValue(locator, "min_eye_size", config.locator.min_eye_size);
        readValue(locator, "max_detection_dimension", config.locator.max_detection_dimension);
        readValue(locator, "face_cascade_path", config.locator.face_cascade_path);
        readValue(locator, "eye_cascade_path", config.locator.eye_cascade_path);

        const json& spoof = sectionOf(j, "spoof");
        readValue(spoof, "face_sharpness_floor", config.spoof.face_sharpness_floor);
        readValue(spoof, "moire_variance_ceiling", config.spoof.moire_variance_ceiling);
        readValue(spoof, "hue_peak_multiplier", config.spoof.hue_peak_multiplier);
        readValue(spoof, "hue_peak_floor", config.spoof.hue_peak_floor);
        readValue(spoof, "hue_peak_ceiling", config.spoof.hue_peak_ceiling);
        readValue(spoof, "border_area_ratio", config.spoof.border_area_ratio);
        readValue(spoof, "canny_low", config.spoof.canny_low);
        readValue(spoof, "canny_high", config.spoof.canny_high);
        readValue(spoof, "brightness_stddev_floor", config.spoof.brightness_stddev_floor);
        readValue(spoof, "block_size", config.spoof.block_size);
        readValue(spoof, "block_energy_ratio_ceiling", config.spoof.block_energy_ratio_ceiling);
        readValue(spoof, "evaluate_all_techniques", config.spoof.evaluate_all_techniques);

        const json& match = sectionOf(j, "match");
        readValue(match, "strict_tolerance", config.match.strict_tolerance);
        readValue(match, "default_tolerance", config.match.default_tolerance);
        readValue(match, "relaxed_tolerance", config.match.relaxed_tolerance);
        readValue(match, "histogram_correlation_floor", config.match.histogram_correlation_floor);
        readValue(match, "histogram_crop_size", config.match.histogram_crop_size);

        const json& models = sectionOf(j, "models");
        readValue(models, "models_path", config.models.models_path);
        readValue(models, "face_recognition_model", config.models.face_recognition_model);
        readValue(models, "shape_predictor", config.models.shape_predictor);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid verification config: ") + e.what());
    }

    if (config.locator.scale_factor <= 1.0) {
        throw std::runtime_error("locator.scale_factor must be greater than 1.0");
    }
    if (config.spoof.block_size <= 0 || config.match.histogram_crop_size <= 0) {
        throw std::runtime_error("spoof.block_size and match.histogram_crop_size must be positive");
    }
    if (!(config.match.strict_tolerance <= config.match.default_tolerance &&
          config.match.default_tolerance <= config.match.relaxed_tolerance)) {
        throw std::runtime_error("match tolerances must satisfy strict <= default <= relaxed");
    }

    return config;
}

VerificationConfig VerificationConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.good()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Config file " + path + " is not valid JSON: " + e.what());
    }

    std::cout << "Loaded verification config from " << path << std::endl;
    return fromJson(j);
}

json VerificationConfig::toJson() const {
    return json{
        {"quality", {
            {"min_image_width", quality.min_image_width},
            {"min_image_height", quality.min_image_height},
            {"max_image_dimension", quality.max_image_dimension},
            {"max_encoded_bytes", quality.max_encoded_bytes},
            {"sharpness_floor", quality.sharpness_floor}
        }},
        {"locator", {
            {"scale_factor", locator.scale_factor},
            {"min_neighbors", locator.min_neighbors},
            {"min_face_size", locator.min_face_size},
            {"min_eye_size", locator.min_eye_size},
            {"max_detection_dimension", locator.max_detection_dimension},
            {"face_cascade_path", locator.face_cascade_path},
            {"eye_cascade_path", locator.eye_cascade_path}
        }},
        {"spoof", {
            {"face_sharpness_floor", spoof.face_sharpness_floor},
            {"moire_variance_ceiling", spoof.moire_variance_ceiling},
            {"hue_peak_multiplier", spoof.hue_peak_multiplier},
            {"hue_peak_floor", spoof.hue_peak_floor},
            {"hue_peak_ceiling", spoof.hue_peak_ceiling},
            {"border_area_ratio", spoof.border_area_ratio},
            {"canny_low", spoof.canny_low},
            {"canny_high", spoof.canny_high},
            {"brightness_stddev_floor", spoof.brightness_stddev_floor},
            {"block_size", spoof.block_size},
            {"block_energy_ratio_ceiling", spoof.block_energy_ratio_ceiling},
            {"evaluate_all_techniques", spoof.evaluate_all_techniques}
        }},
        {"match", {
            {"strict_tolerance", match.strict_tolerance},
            {"default_tolerance", match.default_tolerance},
            {"relaxed_tolerance", match.relaxed_tolerance},
            {"histogram_correlation_floor", match.histogram_correlation_floor},
            {"histogram_crop_size", match.histogram_crop_size}
        }},
        {"models", {
            {"models_path", models.models_path},
            {"face_recognition_model", models.face_recognition_model},
            {"shape_predictor", models.shape_predictor}
        }}
    };
}
