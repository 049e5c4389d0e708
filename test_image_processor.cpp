#include "image_processor.hpp"
#include "test_fixtures.hpp"
#include <dlib/base64.h>
#include <gtest/gtest.h>
#include <cctype>
#include <sstream>

namespace {

std::string toBase64(const std::string& bytes) {
    dlib::base64 codec;
    std::istringstream in(bytes);
    std::ostringstream out;
    codec.encode(in, out);
    return out.str();
}

std::string stripPadding(std::string text) {
    while (!text.empty() && (text.back() == '=' || std::isspace(static_cast<unsigned char>(text.back())))) {
        text.pop_back();
    }
    return text;
}

} // namespace

class ImageProcessorTest : public ::testing::Test {
protected:
    QualityConfig config;
    cv::Mat frame = fixtures::stripedGrayFrame(160);
};

TEST_F(ImageProcessorTest, DecodesRawPngBytes) {
    ImageProcessor processor(config);
    cv::Mat decoded = processor.decodeImage(fixtures::encodePng(frame));

    ASSERT_FALSE(decoded.empty());
    EXPECT_EQ(decoded.cols, 160);
    EXPECT_EQ(decoded.rows, 160);
    EXPECT_EQ(decoded.type(), CV_8UC3);
}

TEST_F(ImageProcessorTest, DecodesBareBase64) {
    ImageProcessor processor(config);
    cv::Mat decoded = processor.decodeImage(toBase64(fixtures::encodePng(frame)));

    ASSERT_FALSE(decoded.empty());
    EXPECT_EQ(cv::norm(decoded, frame, cv::NORM_INF), 0.0);
}

TEST_F(ImageProcessorTest, RepairsMissingBase64Padding) {
    ImageProcessor processor(config);
    std::string png = fixtures::encodePng(frame);
    // Pad the payload so the encoded form is guaranteed to end in '='
    while (png.size() % 3 == 0) {
        png.push_back('\0');
    }

    cv::Mat decoded = processor.decodeImage(stripPadding(toBase64(png)));
    ASSERT_FALSE(decoded.empty());
    EXPECT_EQ(decoded.cols, 160);
}

TEST_F(ImageProcessorTest, DecodesDataUri) {
    ImageProcessor processor(config);
    std::string payload = "data:image/png;base64," + toBase64(fixtures::encodePng(frame));

    cv::Mat decoded = processor.decodeImage(payload);
    ASSERT_FALSE(decoded.empty());
    EXPECT_EQ(decoded.rows, 160);
}

TEST_F(ImageProcessorTest, RejectsMalformedPayloads) {
    ImageProcessor processor(config);

    EXPECT_TRUE(processor.decodeImage("").empty());
    EXPECT_TRUE(processor.decodeImage("abcde").empty());               // impossible base64 length
    EXPECT_TRUE(processor.decodeImage("!!!not base64!!!").empty());
    EXPECT_TRUE(processor.decodeImage(toBase64("plain text, not pixels")).empty());
    EXPECT_TRUE(processor.decodeImage("data:image/png;base64").empty()); // no comma
}

TEST_F(ImageProcessorTest, RejectsOversizedPayloads) {
    config.max_encoded_bytes = 64;
    ImageProcessor processor(config);

    EXPECT_TRUE(processor.decodeImage(fixtures::encodePng(frame)).empty());
    EXPECT_TRUE(processor.decodeImage(toBase64(fixtures::encodePng(frame))).empty());
}

TEST_F(ImageProcessorTest, ValidatesDimensions) {
    ImageProcessor processor(config);

    EXPECT_TRUE(processor.validateImage(cv::Mat(100, 100, CV_8UC3)));
    EXPECT_FALSE(processor.validateImage(cv::Mat(100, 99, CV_8UC3)));
    EXPECT_FALSE(processor.validateImage(cv::Mat(99, 100, CV_8UC3)));
    EXPECT_FALSE(processor.validateImage(cv::Mat(100, 4097, CV_8UC1)));
    EXPECT_FALSE(processor.validateImage(cv::Mat()));
}

TEST_F(ImageProcessorTest, SharpnessSeparatesFlatAndTexturedFrames) {
    ImageProcessor processor(config);

    double flat = ImageProcessor::assessSharpness(fixtures::uniformFrame());
    double textured = ImageProcessor::assessSharpness(frame);

    EXPECT_DOUBLE_EQ(flat, 0.0);
    EXPECT_FALSE(processor.isSharpEnough(flat));
    EXPECT_GT(textured, 100.0);
    EXPECT_TRUE(processor.isSharpEnough(textured));
}

TEST_F(ImageProcessorTest, SharpnessFloorIsInclusive) {
    config.sharpness_floor = 250.0;
    ImageProcessor processor(config);

    EXPECT_TRUE(processor.isSharpEnough(250.0));
    EXPECT_FALSE(processor.isSharpEnough(249.99));
}
