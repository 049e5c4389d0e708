#include "antispoof/spoof_techniques.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>

using namespace antispoof;

class SpoofTechniquesTest : public ::testing::Test {
protected:
    SpoofConfig config;

    SpoofFrame prepare(const cv::Mat& frame, const cv::Rect& face) {
        return prepareFrame(frame, face);
    }
};

TEST_F(SpoofTechniquesTest, PrepareFrameClipsFaceToFrame) {
    cv::Mat frame = fixtures::uniformFrame(100);
    SpoofFrame prepared = prepare(frame, cv::Rect(80, 80, 50, 50));

    EXPECT_EQ(prepared.face, cv::Rect(80, 80, 20, 20));
    EXPECT_EQ(prepared.gray.type(), CV_8UC1);
    EXPECT_EQ(prepared.color.type(), CV_8UC3);
}

TEST_F(SpoofTechniquesTest, FlatFaceFailsSharpness) {
    SpoofSignal signal = checkFaceSharpness(prepare(fixtures::uniformFrame(), cv::Rect(60, 60, 120, 120)), config);

    EXPECT_EQ(signal.technique, FACE_SHARPNESS);
    EXPECT_FALSE(signal.passed);
    EXPECT_DOUBLE_EQ(signal.metric, 0.0);
    EXPECT_NE(signal.reason.find("Image too blurry"), std::string::npos);
}

TEST_F(SpoofTechniquesTest, TexturedFacePassesSharpness) {
    SpoofSignal signal = checkFaceSharpness(prepare(fixtures::stripedGrayFrame(), cv::Rect(60, 60, 120, 120)), config);

    EXPECT_TRUE(signal.passed);
    EXPECT_GT(signal.metric, config.face_sharpness_floor);
}

TEST_F(SpoofTechniquesTest, NoiseFailsMoireCheck) {
    SpoofSignal signal = checkMoirePattern(prepare(fixtures::noiseFrame(), cv::Rect(60, 60, 120, 120)), config);

    EXPECT_EQ(signal.technique, MOIRE_PATTERN);
    EXPECT_FALSE(signal.passed);
    EXPECT_GT(signal.metric, config.moire_variance_ceiling);
    EXPECT_NE(signal.reason.find("Screen display detected"), std::string::npos);
}

TEST_F(SpoofTechniquesTest, SparseEdgesPassMoireCheck) {
    SpoofSignal signal = checkMoirePattern(prepare(fixtures::stripedGrayFrame(), cv::Rect(60, 60, 120, 120)), config);

    EXPECT_TRUE(signal.passed);
    EXPECT_GT(signal.metric, 0.0);
    EXPECT_LT(signal.metric, config.moire_variance_ceiling);
}

TEST_F(SpoofTechniquesTest, AchromaticFrameHasTooFewHuePeaks) {
    cv::Mat frame = fixtures::stripedGrayFrame();
    EXPECT_EQ(countHuePeaks(frame, config.hue_peak_multiplier), 1);

    SpoofSignal signal = checkColorDistribution(prepare(frame, cv::Rect(60, 60, 120, 120)), config);
    EXPECT_EQ(signal.technique, COLOR_DISTRIBUTION);
    EXPECT_FALSE(signal.passed);
    EXPECT_DOUBLE_EQ(signal.metric, 1.0);
    EXPECT_NE(signal.reason.find("too few color peaks"), std::string::npos);
}

TEST_F(SpoofTechniquesTest, PeakyGamutExceedsHueCeiling) {
    std::vector<int> hues;
    for (int h = 0; h < 180; h += 4) {
        hues.push_back(h);
    }
    ASSERT_EQ(hues.size(), 45u);
    cv::Mat frame = fixtures::hueBandsFrame(hues);

    EXPECT_EQ(countHuePeaks(frame, config.hue_peak_multiplier), 45);

    SpoofSignal signal = checkColorDistribution(prepare(frame, cv::Rect(0, 0, 60, 60)), config);
    EXPECT_FALSE(signal.passed);
    EXPECT_NE(signal.reason.find("peaky color gamut"), std::string::npos);
}

TEST_F(SpoofTechniquesTest, ModerateHueSpreadPasses) {
    std::vector<int> hues;
    for (int h = 0; h < 160; h += 16) {
        hues.push_back(h);
    }
    ASSERT_EQ(hues.size(), 10u);
    cv::Mat frame = fixtures::hueBandsFrame(hues);

    SpoofSignal signal = checkColorDistribution(prepare(frame, cv::Rect(0, 0, 40, 40)), config);
    EXPECT_TRUE(signal.passed);
    EXPECT_DOUBLE_EQ(signal.metric, 10.0);
}

TEST_F(SpoofTechniquesTest, LargeRectangleOutsideFaceIsScreenBorder) {
    // 160 x 150 screen covers 60% of a 200 x 200 frame
    cv::Mat frame = fixtures::screenFrame(cv::Rect(20, 20, 160, 150));
    SpoofSignal signal = checkScreenBorder(prepare(frame, cv::Rect(90, 80, 20, 20)), config);

    EXPECT_EQ(signal.technique, SCREEN_BORDER);
    EXPECT_FALSE(signal.passed);
    EXPECT_GT(signal.metric, config.border_area_ratio);
    EXPECT_NE(signal.reason.find("Screen border detected"), std::string::npos);
}

TEST_F(SpoofTechniquesTest, RectangleWithinFaceIsIgnored) {
    cv::Mat frame = fixtures::screenFrame(cv::Rect(20, 20, 160, 150));
    SpoofSignal signal = checkScreenBorder(prepare(frame, cv::Rect(5, 5, 190, 190)), config);

    EXPECT_TRUE(signal.passed);
    EXPECT_DOUBLE_EQ(signal.metric, 0.0);
}

TEST_F(SpoofTechniquesTest, SmallRectangleIsNotScreenBorder) {
    cv::Mat frame = fixtures::screenFrame(cv::Rect(20, 20, 60, 60));
    SpoofSignal signal = checkScreenBorder(prepare(frame, cv::Rect(120, 120, 40, 40)), config);

    EXPECT_TRUE(signal.passed);
}

TEST_F(SpoofTechniquesTest, UniformLightingFails) {
    SpoofSignal signal = checkLightingUniformity(prepare(fixtures::uniformFrame(), cv::Rect(60, 60, 120, 120)), config);

    EXPECT_EQ(signal.technique, LIGHTING_UNIFORMITY);
    EXPECT_FALSE(signal.passed);
    EXPECT_NE(signal.reason.find("Artificial lighting detected"), std::string::npos);
}

TEST_F(SpoofTechniquesTest, VariedLightingPasses) {
    SpoofSignal signal = checkLightingUniformity(prepare(fixtures::gradientFrame(200, 0, 255), cv::Rect(40, 40, 100, 100)), config);

    EXPECT_TRUE(signal.passed);
    EXPECT_GT(signal.metric, config.brightness_stddev_floor);
}

TEST_F(SpoofTechniquesTest, FlatFrameConcentratesEnergyOnBlockGrid) {
    cv::Mat gray(256, 256, CV_8UC1, cv::Scalar(128));
    EXPECT_NEAR(blockEnergyRatio(gray, 8), 1.0, 1e-3);

    SpoofSignal signal = checkCompressionArtifacts(prepare(fixtures::uniformFrame(), cv::Rect(60, 60, 120, 120)), config);
    EXPECT_EQ(signal.technique, COMPRESSION_ARTIFACTS);
    EXPECT_FALSE(signal.passed);
    EXPECT_NE(signal.reason.find("Digital photo detected"), std::string::npos);
}

TEST_F(SpoofTechniquesTest, SeparableTextureOffGridPassesBlockCheck) {
    SpoofSignal signal = checkCompressionArtifacts(prepare(fixtures::stripedGrayFrame(), cv::Rect(60, 60, 120, 120)), config);

    EXPECT_TRUE(signal.passed);
    EXPECT_LT(signal.metric, config.block_energy_ratio_ceiling);
}

TEST_F(SpoofTechniquesTest, MetricHelpersHandleEmptyInput) {
    EXPECT_EQ(highFrequencyVariance(cv::Mat()), 0.0);
    EXPECT_EQ(countHuePeaks(cv::Mat(), 3.0), 0);
    EXPECT_EQ(blockEnergyRatio(cv::Mat(), 8), 0.0);
    EXPECT_EQ(largestScreenBorderRatio(cv::Mat(), cv::Rect(), config), 0.0);
}
