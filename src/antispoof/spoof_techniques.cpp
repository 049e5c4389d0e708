#include "antispoof/spoof_techniques.hpp"
#include "image_processor.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <sstream>
#include <vector>

namespace antispoof {

namespace {

std::string describe(const char* label, double metric, const char* relation, double limit) {
    std::ostringstream ss;
    ss << label << " (" << metric << " " << relation << " " << limit << ")";
    return ss.str();
}

} // namespace

SpoofFrame prepareFrame(const cv::Mat& frame, const cv::Rect& face) {
    SpoofFrame prepared;
    if (frame.channels() == 1) {
        cv::cvtColor(frame, prepared.color, cv::COLOR_GRAY2BGR);
    } else if (frame.channels() == 4) {
        cv::cvtColor(frame, prepared.color, cv::COLOR_BGRA2BGR);
    } else {
        prepared.color = frame;
    }
    prepared.gray = ImageProcessor::toGrayscale(prepared.color);
    prepared.face = face & cv::Rect(0, 0, frame.cols, frame.rows);
    return prepared;
}

SpoofSignal checkFaceSharpness(const SpoofFrame& frame, const SpoofConfig& config) {
    if (frame.face.area() == 0) {
        return SpoofSignal(FACE_SHARPNESS, 0.0, false, "Face region is empty");
    }

    double sharpness = ImageProcessor::assessSharpness(frame.gray(frame.face));
    if (sharpness < config.face_sharpness_floor) {
        return SpoofSignal(FACE_SHARPNESS, sharpness, false,
                           describe("Image too blurry", sharpness, "<", config.face_sharpness_floor));
    }
    return SpoofSignal(FACE_SHARPNESS, sharpness, true, "Face region sharpness within range");
}

double highFrequencyVariance(const cv::Mat& gray) {
    if (gray.empty()) {
        return 0.0;
    }

    cv::Mat kernel = (cv::Mat_<float>(3, 3) << -1, -1, -1,
                                               -1,  8, -1,
                                               -1, -1, -1);

    // Output keeps the 8-bit input depth, so negative responses clip to zero
    cv::Mat high_freq;
    cv::filter2D(gray, high_freq, -1, kernel);

    cv::Scalar mean, stddev;
    cv::meanStdDev(high_freq, mean, stddev);
    return stddev.val[0] * stddev.val[0];
}

SpoofSignal checkMoirePattern(const SpoofFrame& frame, const SpoofConfig& config) {
    double variance = highFrequencyVariance(frame.gray);
    if (variance > config.moire_variance_ceiling) {
        return SpoofSignal(MOIRE_PATTERN, variance, false,
                           describe("Screen display detected", variance, ">", config.moire_variance_ceiling));
    }
    return SpoofSignal(MOIRE_PATTERN, variance, true, "No high-frequency interference");
}

int countHuePeaks(const cv::Mat& color, double multiplier) {
    if (color.empty()) {
        return 0;
    }

    cv::Mat hsv;
    cv::cvtColor(color, hsv, cv::COLOR_BGR2HSV);

    int hist_size = 180;
    float range[] = {0, 180};
    const float* hist_range = {range};
    int channel = 0;

    cv::Mat hue_hist;
    cv::calcHist(&hsv, 1, &channel, cv::Mat(), hue_hist, 1, &hist_size, &hist_range);

    double mean_height = cv::mean(hue_hist).val[0];
    double limit = mean_height * multiplier;

    int peaks = 0;
    for (int i = 0; i < hue_hist.rows; i++) {
        if (hue_hist.at<float>(i) > limit) {
            peaks++;
        }
    }
    return peaks;
}

SpoofSignal checkColorDistribution(const SpoofFrame& frame, const SpoofConfig& config) {
    int peaks = countHuePeaks(frame.color, config.hue_peak_multiplier);

    if (peaks > config.hue_peak_ceiling) {
        return SpoofSignal(COLOR_DISTRIBUTION, peaks, false,
                           describe("Digital display detected: peaky color gamut", peaks, ">",
                                    config.hue_peak_ceiling));
    }
    if (peaks < config.hue_peak_floor) {
        return SpoofSignal(COLOR_DISTRIBUTION, peaks, false,
                           describe("Digital display detected: too few color peaks", peaks, "<",
                                    config.hue_peak_floor));
    }
    return SpoofSignal(COLOR_DISTRIBUTION, peaks, true, "Natural hue distribution");
}

double largestScreenBorderRatio(const cv::Mat& gray, const cv::Rect& face, const SpoofConfig& config) {
    if (gray.empty()) {
        return 0.0;
    }

    cv::Mat edges;
    cv::Canny(gray, edges, config.canny_low, config.canny_high);

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(edges, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    const double frame_area = static_cast<double>(gray.rows) * gray.cols;
    double largest_ratio = 0.0;

    for (const auto& contour : contours) {
        double area = cv::contourArea(contour);
        if (area <= frame_area * config.border_area_ratio) {
            continue;
        }

        std::vector<cv::Point> approx;
        cv::approxPolyDP(contour, approx, 0.02 * cv::arcLength(contour, true), true);
        if (approx.size() != 4) {
            continue;
        }

        // A rectangle inside the face box is part of the face, not a bezel
        cv::Rect bounds = cv::boundingRect(contour);
        if (face.area() > 0 && (bounds & face) == bounds) {
            continue;
        }

        largest_ratio = std::max(largest_ratio, area / frame_area);
    }

    return largest_ratio;
}

SpoofSignal checkScreenBorder(const SpoofFrame& frame, const SpoofConfig& config) {
    double ratio = largestScreenBorderRatio(frame.gray, frame.face, config);
    if (ratio > 0.0) {
        return SpoofSignal(SCREEN_BORDER, ratio, false,
                           describe("Screen border detected", ratio, ">", config.border_area_ratio));
    }
    return SpoofSignal(SCREEN_BORDER, ratio, true, "No rectangular border around the face");
}

SpoofSignal checkLightingUniformity(const SpoofFrame& frame, const SpoofConfig& config) {
    cv::Scalar mean, stddev;
    cv::meanStdDev(frame.gray, mean, stddev);
    double brightness_std = stddev.val[0];

    if (brightness_std < config.brightness_stddev_floor) {
        return SpoofSignal(LIGHTING_UNIFORMITY, brightness_std, false,
                           describe("Artificial lighting detected", brightness_std, "<",
                                    config.brightness_stddev_floor));
    }
    return SpoofSignal(LIGHTING_UNIFORMITY, brightness_std, true, "Natural lighting variation");
}

double blockEnergyRatio(const cv::Mat& gray, int block_size) {
    if (gray.empty() || block_size <= 0) {
        return 0.0;
    }

    cv::Mat float_gray;
    gray.convertTo(float_gray, CV_32F);

    cv::Mat spectrum;
    cv::dft(float_gray, spectrum, cv::DFT_COMPLEX_OUTPUT);

    std::vector<cv::Mat> planes;
    cv::split(spectrum, planes);
    cv::Mat magnitude;
    cv::magnitude(planes[0], planes[1], magnitude);

    double total = cv::sum(magnitude).val[0];
    if (total <= 0.0) {
        return 0.0;
    }

    // Sample the zero-centred spectrum: centred index i maps to raw index (i - n/2) mod n
    const int rows = magnitude.rows;
    const int cols = magnitude.cols;
    double sampled = 0.0;
    for (int i = 0; i < rows; i += block_size) {
        const float* row = magnitude.ptr<float>((i + rows - rows / 2) % rows);
        for (int j = 0; j < cols; j += block_size) {
            sampled += row[(j + cols - cols / 2) % cols];
        }
    }

    return sampled / total;
}

SpoofSignal checkCompressionArtifacts(const SpoofFrame& frame, const SpoofConfig& config) {
    double ratio = blockEnergyRatio(frame.gray, config.block_size);
    if (ratio > config.block_energy_ratio_ceiling) {
        return SpoofSignal(COMPRESSION_ARTIFACTS, ratio, false,
                           describe("Digital photo detected", ratio, ">", config.block_energy_ratio_ceiling));
    }
    return SpoofSignal(COMPRESSION_ARTIFACTS, ratio, true, "No block compression structure");
}

} // namespace antispoof
