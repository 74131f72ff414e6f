#include "core/ReadinessClassifier.hpp"
#include <gtest/gtest.h>

using namespace mcp_relay;

TEST(ReadinessClassifierTest, DetectsPackageRunnerCommand) {
    EXPECT_EQ(ReadinessClassifier::detect_mechanism("npx", {"-y", "server"}),
              LaunchMechanism::PACKAGE_RUNNER);
}

TEST(ReadinessClassifierTest, DetectsPackageRunnerInArguments) {
    EXPECT_EQ(ReadinessClassifier::detect_mechanism("cmd", {"/c", "npx", "server"}),
              LaunchMechanism::PACKAGE_RUNNER);
}

TEST(ReadinessClassifierTest, OtherCommandsAreGeneric) {
    EXPECT_EQ(ReadinessClassifier::detect_mechanism("uvx", {"mcp-server-fetch"}),
              LaunchMechanism::GENERIC);
    EXPECT_EQ(ReadinessClassifier::detect_mechanism("python", {}), LaunchMechanism::GENERIC);
}

TEST(ReadinessClassifierTest, SuccessKeywordIsReady) {
    EXPECT_EQ(ReadinessClassifier::classify("GitHub MCP Server running on stdio", LaunchMechanism::GENERIC),
              ReadinessVerdict::READY);
    EXPECT_EQ(ReadinessClassifier::classify("LISTENING on port 9000", LaunchMechanism::GENERIC),
              ReadinessVerdict::READY);
}

TEST(ReadinessClassifierTest, ErrorKeywordFails) {
    EXPECT_EQ(ReadinessClassifier::classify("Error: missing token", LaunchMechanism::GENERIC),
              ReadinessVerdict::FAILED);
    EXPECT_EQ(ReadinessClassifier::classify("npm ERR! 404 not found", LaunchMechanism::GENERIC),
              ReadinessVerdict::FAILED);
}

TEST(ReadinessClassifierTest, SuccessCheckedBeforeError) {
    EXPECT_EQ(ReadinessClassifier::classify("server started, ignoring error log", LaunchMechanism::GENERIC),
              ReadinessVerdict::READY);
}

TEST(ReadinessClassifierTest, NeutralLineIsUndecided) {
    EXPECT_EQ(ReadinessClassifier::classify("loading configuration", LaunchMechanism::GENERIC),
              ReadinessVerdict::UNDECIDED);
    EXPECT_EQ(ReadinessClassifier::classify("", LaunchMechanism::PACKAGE_RUNNER),
              ReadinessVerdict::UNDECIDED);
}

TEST(ReadinessClassifierTest, PackageRunnerTableIsBroader) {
    const std::string line = "added 12 packages from node_modules cache";
    EXPECT_EQ(ReadinessClassifier::classify(line, LaunchMechanism::GENERIC), ReadinessVerdict::UNDECIDED);
    EXPECT_EQ(ReadinessClassifier::classify(line, LaunchMechanism::PACKAGE_RUNNER), ReadinessVerdict::READY);
}
