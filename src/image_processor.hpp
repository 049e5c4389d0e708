#ifndef IMAGE_PROCESSOR_HPP
#define IMAGE_PROCESSOR_HPP

#include "verification_config.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

class ImageProcessor {
public:
    explicit ImageProcessor(const QualityConfig& config);
    ~ImageProcessor() = default;

    // Decode raw image bytes, bare Base64 or a data URI into a BGR frame.
    // Returns an empty Mat when the payload is not a decodable image.
    cv::Mat decodeImage(const std::string& payload) const;

    // Validate frame size against the configured minimum and maximum dimensions
    bool validateImage(const cv::Mat& image) const;

    // Variance of the Laplacian over the grayscale image
    static double assessSharpness(const cv::Mat& image);

    bool isSharpEnough(double sharpness) const { return sharpness >= config.sharpness_floor; }

    static cv::Mat toGrayscale(const cv::Mat& image);

private:
    QualityConfig config;

    // Check for a data:image/...;base64, prefix
    static bool isDataUri(const std::string& payload);

    // Check for JPEG, PNG, BMP or WEBP magic bytes
    static bool hasImageSignature(const std::string& payload);

    // Decode Base64 text, repairing missing padding. Empty on malformed input.
    std::vector<unsigned char> decodeBase64(const std::string& base64_string) const;

    cv::Mat decodeBytes(const std::vector<unsigned char>& data) const;
};

#endif // IMAGE_PROCESSOR_HPP
