#include "verification_config.hpp"
#include "verification_types.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>

TEST(VerificationConfigTest, DefaultsMatchDocumentedGates) {
    VerificationConfig config;

    EXPECT_EQ(config.quality.min_image_width, 100);
    EXPECT_DOUBLE_EQ(config.quality.sharpness_floor, 100.0);
    EXPECT_DOUBLE_EQ(config.locator.scale_factor, 1.1);
    EXPECT_EQ(config.locator.min_neighbors, 5);
    EXPECT_EQ(config.locator.min_face_size, 30);
    EXPECT_DOUBLE_EQ(config.spoof.moire_variance_ceiling, 2000.0);
    EXPECT_DOUBLE_EQ(config.spoof.brightness_stddev_floor, 20.0);
    EXPECT_EQ(config.spoof.block_size, 8);
    EXPECT_TRUE(config.spoof.evaluate_all_techniques);
    EXPECT_DOUBLE_EQ(config.match.histogram_correlation_floor, 0.7);
}

TEST(VerificationConfigTest, PolicyMapsToLayeredTolerance) {
    MatchConfig match;
    EXPECT_DOUBLE_EQ(match.tolerance(MatchPolicy::STRICT), 0.3);
    EXPECT_DOUBLE_EQ(match.tolerance(MatchPolicy::DEFAULT), 0.4);
    EXPECT_DOUBLE_EQ(match.tolerance(MatchPolicy::RELAXED), 0.5);
}

TEST(VerificationConfigTest, PartialJsonKeepsDefaults) {
    json j = {
        {"spoof", {{"moire_variance_ceiling", 2500.0}, {"evaluate_all_techniques", false}}},
        {"match", {{"default_tolerance", 0.45}}}
    };

    VerificationConfig config = VerificationConfig::fromJson(j);

    EXPECT_DOUBLE_EQ(config.spoof.moire_variance_ceiling, 2500.0);
    EXPECT_FALSE(config.spoof.evaluate_all_techniques);
    EXPECT_DOUBLE_EQ(config.match.default_tolerance, 0.45);
    EXPECT_DOUBLE_EQ(config.match.strict_tolerance, 0.3);
    EXPECT_EQ(config.locator.min_face_size, 30);
}

TEST(VerificationConfigTest, WrongTypesAreRejected) {
    EXPECT_THROW(VerificationConfig::fromJson(json{{"quality", {{"sharpness_floor", "high"}}}}), std::runtime_error);
    EXPECT_THROW(VerificationConfig::fromJson(json{{"spoof", 3}}), std::runtime_error);
    EXPECT_THROW(VerificationConfig::fromJson(json::array()), std::runtime_error);
}

TEST(VerificationConfigTest, InconsistentValuesAreRejected) {
    EXPECT_THROW(VerificationConfig::fromJson(json{{"locator", {{"scale_factor", 1.0}}}}), std::runtime_error);
    EXPECT_THROW(VerificationConfig::fromJson(json{{"spoof", {{"block_size", 0}}}}), std::runtime_error);
    EXPECT_THROW(VerificationConfig::fromJson(json{{"match", {{"strict_tolerance", 0.6}}}}), std::runtime_error);
}

TEST(VerificationConfigTest, SerializedConfigLoadsBack) {
    VerificationConfig original;
    original.spoof.hue_peak_ceiling = 55;
    original.models.models_path = "/opt/faceverify/models";

    VerificationConfig loaded = VerificationConfig::fromJson(original.toJson());

    EXPECT_EQ(loaded.spoof.hue_peak_ceiling, 55);
    EXPECT_EQ(loaded.models.models_path, "/opt/faceverify/models");
    EXPECT_EQ(loaded.toJson(), original.toJson());
}

TEST(VerificationConfigTest, LoadsFromFile) {
    std::string path = ::testing::TempDir() + "faceverify_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"quality": {"sharpness_floor": 80}})";
    }

    VerificationConfig config = VerificationConfig::loadFromFile(path);
    EXPECT_DOUBLE_EQ(config.quality.sharpness_floor, 80.0);
    std::remove(path.c_str());

    EXPECT_THROW(VerificationConfig::loadFromFile("/nonexistent/faceverify.json"), std::runtime_error);
}

TEST(VerificationConfigTest, ModelFilesResolveAgainstModelsPath) {
    ModelConfig models;
    models.models_path = "/srv/models";

    EXPECT_EQ(models.resolve("net.dat"), "/srv/models/net.dat");
    EXPECT_EQ(models.resolve("/abs/net.dat"), "/abs/net.dat");
}

TEST(VerificationTypesTest, ReasonsHaveStableNamesAndGuidance) {
    EXPECT_EQ(failureReasonToString(FailureReason::SPOOFING_DETECTED), "SpoofingDetected");
    EXPECT_EQ(failureReasonToString(FailureReason::MATCH_BELOW_THRESHOLD), "MatchBelowThreshold");
    EXPECT_EQ(failureReasonToString(FailureReason::INVALID_REFERENCE_IMAGE), "InvalidReferenceImage");
    EXPECT_NE(failureGuidance(FailureReason::EYES_NOT_VISIBLE).find("sunglasses"), std::string::npos);
    EXPECT_NE(failureGuidance(FailureReason::NO_REFERENCE_IMAGE), failureGuidance(FailureReason::MATCH_BELOW_THRESHOLD));
}

TEST(VerificationTypesTest, PolicyNamesRoundTrip) {
    EXPECT_EQ(parseMatchPolicy("strict"), MatchPolicy::STRICT);
    EXPECT_EQ(parseMatchPolicy("relaxed"), MatchPolicy::RELAXED);
    EXPECT_EQ(parseMatchPolicy("lenient"), std::nullopt);
    EXPECT_EQ(matchPolicyToString(MatchPolicy::DEFAULT), "default");
}

TEST(VerificationTypesTest, ResultJsonAlwaysNamesStrategy) {
    VerificationResult result = VerificationResult::rejected(FailureReason::NO_FACE_DETECTED);
    json j = result.toJson();

    EXPECT_EQ(j["accepted"], false);
    EXPECT_EQ(j["failureReason"], "NoFaceDetected");
    EXPECT_EQ(j["matchStrategyUsed"], "embedding");
    EXPECT_TRUE(j["spoofSignals"].is_array());
    EXPECT_FALSE(j.contains("failedTechnique"));
    EXPECT_FALSE(j.contains("matchDistance"));

    VerificationResult accepted;
    accepted.accepted = true;
    accepted.confidence_score = 82.5f;
    json aj = accepted.toJson();
    EXPECT_TRUE(aj["failureReason"].is_null());
    EXPECT_TRUE(aj["failureMessage"].is_null());
}
