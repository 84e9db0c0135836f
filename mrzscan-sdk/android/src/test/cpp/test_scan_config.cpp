#include "ScanConfig.h"

#include <gtest/gtest.h>

#include <fstream>
#include <string>

using namespace mrzscan;

class ScanConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        applyLogLevel("info");
    }
};

TEST_F(ScanConfigTest, Defaults) {
    ScanConfig config;

    EXPECT_EQ(config.heuristic.minLineLength, 25);
    EXPECT_EQ(config.heuristic.td1MinLength, 25);
    EXPECT_EQ(config.heuristic.td1MaxLength, 35);
    EXPECT_EQ(config.heuristic.twoLineMinLength, 30);
    EXPECT_EQ(config.heuristic.fillerWeight, 10);
    EXPECT_EQ(config.heuristic.canLength, 6);
    ASSERT_EQ(config.heuristic.canLabels.size(), 3u);
    EXPECT_EQ(config.heuristic.canLabels[0], "CAN");
    EXPECT_FLOAT_EQ(config.pump.minConfidence, 0.4f);
    EXPECT_FALSE(config.pump.lockOnValid);
    EXPECT_EQ(config.logLevel, "info");
}

TEST_F(ScanConfigTest, YamlOverrides) {
    std::string yaml =
        "%YAML:1.0\n"
        "heuristic:\n"
        "  minLineLength: 20\n"
        "  twoLineMinLength: 36\n"
        "  canLength: 8\n"
        "  canLabels: [ \"NUMERO\", \"CAN\" ]\n"
        "pump:\n"
        "  minConfidence: 0.6\n"
        "  lockOnValid: 1\n"
        "logLevel: debug\n";

    ScanConfig config;
    ASSERT_TRUE(loadScanConfigFromString(yaml, config));

    EXPECT_EQ(config.heuristic.minLineLength, 20);
    EXPECT_EQ(config.heuristic.twoLineMinLength, 36);
    EXPECT_EQ(config.heuristic.canLength, 8);
    ASSERT_EQ(config.heuristic.canLabels.size(), 2u);
    EXPECT_EQ(config.heuristic.canLabels[0], "NUMERO");
    EXPECT_NEAR(config.pump.minConfidence, 0.6f, 1e-6);
    EXPECT_TRUE(config.pump.lockOnValid);
    EXPECT_EQ(config.logLevel, "debug");

    // Untouched keys keep their defaults
    EXPECT_EQ(config.heuristic.td1MaxLength, 35);
    EXPECT_EQ(config.heuristic.fillerWeight, 10);
}

TEST_F(ScanConfigTest, JsonOverrides) {
    std::string json = "{ \"pump\": { \"minConfidence\": 0.75, \"lockOnValid\": \"true\" } }";

    ScanConfig config;
    ASSERT_TRUE(loadScanConfigFromString(json, config));

    EXPECT_NEAR(config.pump.minConfidence, 0.75f, 1e-6);
    EXPECT_TRUE(config.pump.lockOnValid);
    EXPECT_EQ(config.heuristic.minLineLength, 25);
}

TEST_F(ScanConfigTest, InvalidValuesKeepPreviousOnes) {
    std::string yaml =
        "%YAML:1.0\n"
        "heuristic:\n"
        "  minLineLength: 0\n"
        "  fillerWeight: -3\n"
        "  td1MinLength: 40\n"
        "  canLabels: [ 1, 2 ]\n"
        "pump:\n"
        "  minConfidence: 1.5\n"
        "  lockOnValid: maybe\n"
        "logLevel: 3\n";

    ScanConfig config;
    ASSERT_TRUE(loadScanConfigFromString(yaml, config));

    EXPECT_EQ(config.heuristic.minLineLength, 25);
    EXPECT_EQ(config.heuristic.fillerWeight, 10);
    EXPECT_EQ(config.heuristic.td1MinLength, 25);
    EXPECT_EQ(config.heuristic.td1MaxLength, 35);
    EXPECT_EQ(config.heuristic.canLabels.size(), 3u);
    EXPECT_FLOAT_EQ(config.pump.minConfidence, 0.4f);
    EXPECT_FALSE(config.pump.lockOnValid);
    EXPECT_EQ(config.logLevel, "info");
}

TEST_F(ScanConfigTest, ZeroFillerWeightIsAllowed) {
    ScanConfig config;
    ASSERT_TRUE(loadScanConfigFromString("%YAML:1.0\nheuristic:\n  fillerWeight: 0\n", config));

    EXPECT_EQ(config.heuristic.fillerWeight, 0);
}

TEST_F(ScanConfigTest, FillerWeightIsCapped) {
    ScanConfig config;
    ASSERT_TRUE(loadScanConfigFromString("%YAML:1.0\nheuristic:\n  fillerWeight: 100000\n", config));
    EXPECT_EQ(config.heuristic.fillerWeight, 10);

    ASSERT_TRUE(loadScanConfigFromString("%YAML:1.0\nheuristic:\n  fillerWeight: 1000\n", config));
    EXPECT_EQ(config.heuristic.fillerWeight, MAX_FILLER_WEIGHT);
}

TEST_F(ScanConfigTest, LoadFromFile) {
    std::string path = ::testing::TempDir() + "mrzscan_config_test.yml";
    {
        std::ofstream out(path);
        out << "%YAML:1.0\n"
            << "heuristic:\n"
            << "  td1MinLength: 28\n"
            << "  td1MaxLength: 32\n";
    }

    ScanConfig config;
    ASSERT_TRUE(loadScanConfig(path, config));

    EXPECT_EQ(config.heuristic.td1MinLength, 28);
    EXPECT_EQ(config.heuristic.td1MaxLength, 32);
}

TEST_F(ScanConfigTest, MissingFileLeavesConfigUntouched) {
    ScanConfig config;
    config.heuristic.canLength = 9;

    EXPECT_FALSE(loadScanConfig(::testing::TempDir() + "does_not_exist/mrzscan.yml", config));
    EXPECT_EQ(config.heuristic.canLength, 9);
}

TEST_F(ScanConfigTest, LogLevels) {
    EXPECT_TRUE(applyLogLevel("debug"));
    EXPECT_TRUE(applyLogLevel("off"));
    EXPECT_TRUE(applyLogLevel("info"));
    EXPECT_FALSE(applyLogLevel("loud"));
}
