#include "image_processor.hpp"
#include <dlib/base64.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

ImageProcessor::ImageProcessor(const QualityConfig& config) : config(config) {
}

cv::Mat ImageProcessor::decodeImage(const std::string& payload) const {
    if (payload.empty()) {
        return cv::Mat();
    }

    if (hasImageSignature(payload)) {
        if (payload.size() > config.max_encoded_bytes) {
            std::cerr << "Image size exceeds limit: " << payload.size() << " bytes" << std::endl;
            return cv::Mat();
        }
        return decodeBytes(std::vector<unsigned char>(payload.begin(), payload.end()));
    }

    std::string base64_data = payload;
    if (isDataUri(payload)) {
        size_t comma_pos = payload.find(',');
        if (comma_pos == std::string::npos) {
            return cv::Mat();
        }
        base64_data = payload.substr(comma_pos + 1);
    }

    std::vector<unsigned char> decoded = decodeBase64(base64_data);
    if (decoded.empty()) {
        return cv::Mat();
    }

    if (decoded.size() > config.max_encoded_bytes) {
        std::cerr << "Image size exceeds limit: " << decoded.size() << " bytes" << std::endl;
        return cv::Mat();
    }

    return decodeBytes(decoded);
}

bool ImageProcessor::validateImage(const cv::Mat& image) const {
    if (image.empty()) {
        return false;
    }

    // Check minimum dimensions
    if (image.rows < config.min_image_height || image.cols < config.min_image_width) {
        return false;
    }

    // Check maximum dimensions (caps the cost of every later stage)
    if (image.rows > config.max_image_dimension || image.cols > config.max_image_dimension) {
        return false;
    }

    return true;
}

double ImageProcessor::assessSharpness(const cv::Mat& image) {
    if (image.empty()) {
        return 0.0;
    }

    cv::Mat gray = toGrayscale(image);

    cv::Mat laplacian;
    cv::Laplacian(gray, laplacian, CV_64F);

    cv::Scalar mean, stddev;
    cv::meanStdDev(laplacian, mean, stddev);

    return stddev.val[0] * stddev.val[0];
}

cv::Mat ImageProcessor::toGrayscale(const cv::Mat& image) {
    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = image.clone();
    }
    return gray;
}

bool ImageProcessor::isDataUri(const std::string& payload) {
    return payload.rfind("data:image", 0) == 0;
}

bool ImageProcessor::hasImageSignature(const std::string& payload) {
    auto starts_with = [&payload](const unsigned char* magic, size_t length) {
        if (payload.size() < length) {
            return false;
        }
        return std::equal(magic, magic + length, payload.begin(),
                          [](unsigned char m, char c) { return m == static_cast<unsigned char>(c); });
    };

    static const unsigned char jpeg[] = {0xFF, 0xD8, 0xFF};
    static const unsigned char png[] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    static const unsigned char bmp[] = {'B', 'M'};
    static const unsigned char riff[] = {'R', 'I', 'F', 'F'};

    if (starts_with(jpeg, sizeof(jpeg)) || starts_with(png, sizeof(png)) || starts_with(bmp, sizeof(bmp))) {
        return true;
    }
    return starts_with(riff, sizeof(riff)) && payload.size() >= 12 && payload.compare(8, 4, "WEBP") == 0;
}

std::vector<unsigned char> ImageProcessor::decodeBase64(const std::string& base64_string) const {
    std::string cleaned;
    cleaned.reserve(base64_string.size() + 3);
    for (char c : base64_string) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            cleaned.push_back(c);
        }
    }

    if (cleaned.empty()) {
        return {};
    }

    // Base64 length must be a multiple of 4
    size_t padding = cleaned.size() % 4;
    if (padding == 1) {
        return {};
    }
    if (padding > 0) {
        cleaned.append(4 - padding, '=');
    }

    try {
        dlib::base64 codec;
        std::istringstream in(cleaned);
        std::ostringstream out;
        codec.decode(in, out);
        const std::string bytes = out.str();
        return std::vector<unsigned char>(bytes.begin(), bytes.end());
    } catch (const dlib::base64::decode_error& e) {
        std::cerr << "Error decoding base64 image: " << e.what() << std::endl;
        return {};
    }
}

cv::Mat ImageProcessor::decodeBytes(const std::vector<unsigned char>& data) const {
    try {
        return cv::imdecode(data, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        std::cerr << "Error decoding image bytes: " << e.what() << std::endl;
        return cv::Mat();
    }
}
