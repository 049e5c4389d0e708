#include "antispoof/spoof_battery.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>

using namespace antispoof;

namespace {

SpoofTechnique fixedTechnique(const std::string& id, bool passes, int* calls = nullptr) {
    return SpoofTechnique{id, [passes, calls](const SpoofFrame&) {
        if (calls) {
            (*calls)++;
        }
        // The battery stamps the registered id onto the signal
        return SpoofSignal("unnamed", passes ? 1.0 : 0.0, passes, passes ? "ok" : "rejected");
    }};
}

} // namespace

class SpoofBatteryTest : public ::testing::Test {
protected:
    SpoofConfig config;
    cv::Rect face_rect = cv::Rect(60, 60, 120, 120);
};

TEST_F(SpoofBatteryTest, StandardBatteryHasDocumentedOrder) {
    SpoofBattery battery = SpoofBattery::standard(config);

    std::vector<std::string> expected = {
        "face_sharpness", "moire_pattern", "color_distribution",
        "screen_border", "lighting_uniformity", "compression_artifacts"
    };
    EXPECT_EQ(battery.techniqueIds(), expected);
    EXPECT_EQ(battery.size(), 6u);
}

TEST_F(SpoofBatteryTest, RecordsEverySignalButReportsFirstFailure) {
    cv::Mat frame = fixtures::uniformFrame();
    SpoofBattery battery = SpoofBattery::standard(config);

    BatteryResult result = battery.run(frame, FaceRegion(frame, face_rect));

    EXPECT_FALSE(result.passed);
    ASSERT_EQ(result.signals.size(), 6u);
    ASSERT_NE(result.firstFailure(), nullptr);
    EXPECT_EQ(result.firstFailure()->technique, "face_sharpness");
    EXPECT_EQ(*result.first_failure, 0u);
    // Later failures are recorded too
    EXPECT_FALSE(result.signals[4].passed);
    EXPECT_FALSE(result.signals[5].passed);
}

TEST_F(SpoofBatteryTest, StopsAtFirstFailureWhenConfigured) {
    config.evaluate_all_techniques = false;
    cv::Mat frame = fixtures::uniformFrame();
    SpoofBattery battery = SpoofBattery::standard(config);

    BatteryResult result = battery.run(frame, FaceRegion(frame, face_rect));

    EXPECT_FALSE(result.passed);
    ASSERT_EQ(result.signals.size(), 1u);
    EXPECT_EQ(result.signals[0].technique, "face_sharpness");
}

TEST_F(SpoofBatteryTest, FixtureFailingOnlyColorCheckReportsThatTechnique) {
    cv::Mat frame = fixtures::stripedGrayFrame();
    SpoofBattery battery = SpoofBattery::standard(config);

    BatteryResult result = battery.run(frame, FaceRegion(frame, face_rect));

    EXPECT_FALSE(result.passed);
    ASSERT_EQ(result.signals.size(), 6u);
    ASSERT_NE(result.firstFailure(), nullptr);
    EXPECT_EQ(result.firstFailure()->technique, "color_distribution");
    for (size_t i = 0; i < result.signals.size(); i++) {
        EXPECT_EQ(result.signals[i].passed, i != 2) << result.signals[i].technique;
    }
}

TEST_F(SpoofBatteryTest, RunsAreDeterministic) {
    cv::Mat frame = fixtures::stripedGrayFrame();
    SpoofBattery battery = SpoofBattery::standard(config);

    BatteryResult first = battery.run(frame, FaceRegion(frame, face_rect));
    BatteryResult second = battery.run(frame, FaceRegion(frame, face_rect));

    ASSERT_EQ(first.signals.size(), second.signals.size());
    for (size_t i = 0; i < first.signals.size(); i++) {
        EXPECT_EQ(first.signals[i].toJson(), second.signals[i].toJson());
    }
}

TEST_F(SpoofBatteryTest, AppendedTechniqueRunsLast) {
    int calls = 0;
    SpoofBattery battery({fixedTechnique("first", true), fixedTechnique("second", true)}, true);
    battery.append(fixedTechnique("seventh", false, &calls));

    cv::Mat frame = fixtures::stripedGrayFrame();
    BatteryResult result = battery.run(frame, FaceRegion(frame, face_rect));

    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(result.passed);
    ASSERT_EQ(result.signals.size(), 3u);
    EXPECT_EQ(result.signals[0].technique, "first");
    EXPECT_EQ(result.firstFailure()->technique, "seventh");
}

TEST_F(SpoofBatteryTest, FailFastSkipsLaterTechniques) {
    int later_calls = 0;
    SpoofBattery battery({fixedTechnique("gate", false), fixedTechnique("later", true, &later_calls)}, false);

    cv::Mat frame = fixtures::stripedGrayFrame();
    BatteryResult result = battery.run(frame, FaceRegion(frame, face_rect));

    EXPECT_FALSE(result.passed);
    EXPECT_EQ(later_calls, 0);
}

TEST_F(SpoofBatteryTest, AllPassingTechniquesPass) {
    SpoofBattery battery({fixedTechnique("a", true), fixedTechnique("b", true)}, true);

    cv::Mat frame = fixtures::stripedGrayFrame();
    BatteryResult result = battery.run(frame, FaceRegion(frame, face_rect));

    EXPECT_TRUE(result.passed);
    EXPECT_EQ(result.firstFailure(), nullptr);
    EXPECT_EQ(result.signals.size(), 2u);
}

TEST_F(SpoofBatteryTest, OpenCvFaultBecomesVerificationError) {
    SpoofBattery battery({SpoofTechnique{"broken", [](const SpoofFrame&) -> SpoofSignal {
        throw cv::Exception(cv::Error::StsError, "synthetic failure", "broken", __FILE__, __LINE__);
    }}}, true);

    cv::Mat frame = fixtures::stripedGrayFrame();
    EXPECT_THROW(battery.run(frame, FaceRegion(frame, face_rect)), VerificationError);
}

TEST_F(SpoofBatteryTest, EmptyFrameIsAFault) {
    SpoofBattery battery = SpoofBattery::standard(config);
    EXPECT_THROW(battery.run(cv::Mat(), FaceRegion()), VerificationError);
}
