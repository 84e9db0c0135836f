#include "test_helpers.h"
#include "CandidateExtractor.h"
#include "MRZParser.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

using namespace mrzscan;
using mrzscan::test::joinLines;

// ==================== MRZ Candidate ====================

class CandidateExtractorTest : public ::testing::Test {
};

TEST_F(CandidateExtractorTest, TwoLinePassportAmongNoise) {
    // First line is one filler short of a real TD3 line
    std::vector<std::string> lines = {
        "P<UTOERIKSSON<<ANNA<MARIA<<<<<<<<<<<<<<<<<<",
        "L898902C36UTO7408122F1204159ZE184226B<<<<<10",
        "NOISE",
        "123456"
    };

    std::optional<std::string> candidate = CandidateExtractor::extractMRZCandidate(lines);

    ASSERT_TRUE(candidate.has_value());
    EXPECT_EQ(*candidate, lines[0] + "\n" + lines[1]);
}

TEST_F(CandidateExtractorTest, TwoLineCandidateParsesAsTD3) {
    std::vector<std::string> lines = {"PASSPORT", test::ICAO_TD3[1], "UTOPIA", test::ICAO_TD3[0]};

    std::optional<std::string> candidate = CandidateExtractor::extractMRZCandidate(lines);
    ASSERT_TRUE(candidate.has_value());

    // Line 1 carries more fillers, so ranking restores document order
    EXPECT_EQ(*candidate, joinLines(test::ICAO_TD3));

    ParseResult parsed = MRZParser::parseAndValidate(*candidate);
    ASSERT_TRUE(parsed.ok());
    EXPECT_EQ(parsed.mrz->format, MRZFormat::TD3);
    EXPECT_TRUE(parsed.mrz->checks.isValid());
}

TEST_F(CandidateExtractorTest, NormalizesOcrNoise) {
    std::vector<std::string> lines = {
        "p<uto eriksson<<anna<maria<<<<<<<<<<<<<<<<<<<",
        "L898902C36UTO7408122F1204159ZE184226B<<<<<10 "
    };

    std::optional<std::string> candidate = CandidateExtractor::extractMRZCandidate(lines);

    ASSERT_TRUE(candidate.has_value());
    EXPECT_EQ(*candidate, joinLines(test::ICAO_TD3));
}

TEST_F(CandidateExtractorTest, ThreeCardLinesTakeTD1Path) {
    std::optional<std::string> candidate = CandidateExtractor::extractMRZCandidate(test::ICAO_TD1);

    ASSERT_TRUE(candidate.has_value());
    EXPECT_EQ(std::count(candidate->begin(), candidate->end(), '\n'), 2);
}

TEST_F(CandidateExtractorTest, TD1LinesAreEmittedInRankOrder) {
    // Scores: line 1 = 190, line 3 = 160, line 2 = 140
    EXPECT_EQ(CandidateExtractor::scoreLine(test::ICAO_TD1[0]), 190);
    EXPECT_EQ(CandidateExtractor::scoreLine(test::ICAO_TD1[1]), 140);
    EXPECT_EQ(CandidateExtractor::scoreLine(test::ICAO_TD1[2]), 160);

    std::optional<std::string> candidate = CandidateExtractor::extractMRZCandidate(test::ICAO_TD1);
    ASSERT_TRUE(candidate.has_value());
    EXPECT_EQ(*candidate, test::ICAO_TD1[0] + "\n" + test::ICAO_TD1[2] + "\n" + test::ICAO_TD1[1]);

    // The swapped block still has the TD1 shape but its line 2 fields fail
    ParseResult parsed = MRZParser::parseAndValidate(*candidate);
    ASSERT_TRUE(parsed.ok());
    EXPECT_EQ(parsed.mrz->format, MRZFormat::TD1);
    EXPECT_TRUE(parsed.mrz->checks.documentNumberOK);
    EXPECT_FALSE(parsed.mrz->checks.birthDateOK);
    EXPECT_FALSE(parsed.mrz->checks.isValid());
}

TEST_F(CandidateExtractorTest, EqualScoresKeepInputOrder) {
    std::string a = "AAAAAAAAAAAAAAAAAAAAAAAAA<<AA";
    std::string b = "BBBBBBBBBBBBBBBBBBBBBBBBB<<BB";
    std::string c = "CCCCCCCCCCCCCCCCCCCCCCCCC<<CC";

    std::optional<std::string> candidate = CandidateExtractor::extractMRZCandidate({a, b, c});

    ASSERT_TRUE(candidate.has_value());
    EXPECT_EQ(*candidate, a + "\n" + b + "\n" + c);
}

TEST_F(CandidateExtractorTest, LinesWithoutDoubleFillerAreIgnored) {
    std::vector<std::string> lines = {
        "L898902C36UTO7408122F1204159ZE184226B<1234510",
        "P<UTOERIKSSON<ANNA<MARIA<X<X<X<X<X<X<X<X<X<X"
    };

    EXPECT_FALSE(CandidateExtractor::extractMRZCandidate(lines).has_value());
}

TEST_F(CandidateExtractorTest, ShortLinesAreIgnored) {
    std::vector<std::string> lines = {"P<UTOERIKSSON<<ANNA", "L898902C36UTO<<<"};

    EXPECT_FALSE(CandidateExtractor::extractMRZCandidate(lines).has_value());
}

TEST_F(CandidateExtractorTest, TwoLinePathNeedsThirtyCharacters) {
    // Both MRZ-like, but the second line is below the two-line minimum
    std::vector<std::string> lines = {test::ICAO_TD3[0], "ABCDEFGHIJKLMNOPQRSTUVW<<<<"};

    EXPECT_FALSE(CandidateExtractor::extractMRZCandidate(lines).has_value());
}

TEST_F(CandidateExtractorTest, SingleLineIsNotACandidate) {
    EXPECT_FALSE(CandidateExtractor::extractMRZCandidate({test::ICAO_TD3[1]}).has_value());
    EXPECT_FALSE(CandidateExtractor::extractMRZCandidate({}).has_value());
}

TEST_F(CandidateExtractorTest, ConfigRaisesTwoLineMinimum) {
    HeuristicConfig config;
    config.twoLineMinLength = 45;

    EXPECT_FALSE(CandidateExtractor::extractMRZCandidate(test::ICAO_TD3, config).has_value());
}

TEST_F(CandidateExtractorTest, ConfigFillerWeightChangesRanking) {
    // Without filler weight, the longer line 2 outranks line 1
    HeuristicConfig config;
    config.fillerWeight = 0;
    std::vector<std::string> lines = {
        "P<UTOERIKSSON<<ANNA<MARIA<<<<<<<<<<<<<<<<<<",
        test::ICAO_TD3[1]
    };

    std::optional<std::string> candidate = CandidateExtractor::extractMRZCandidate(lines, config);

    ASSERT_TRUE(candidate.has_value());
    EXPECT_EQ(*candidate, lines[1] + "\n" + lines[0]);
}

// ==================== CAN ====================

class CANExtractorTest : public ::testing::Test {
};

TEST_F(CANExtractorTest, LabeledLine) {
    std::vector<std::string> lines = {"REPUBLIC OF UTOPIA", "CAN 482391", "ID 123456"};

    EXPECT_EQ(CandidateExtractor::extractCAN(lines), "482391");
}

TEST_F(CANExtractorTest, LabeledLineWinsOverEarlierUnlabeled) {
    std::vector<std::string> lines = {"DOB 740812", "Card access number: 482391"};

    EXPECT_EQ(CandidateExtractor::extractCAN(lines), "482391");
}

TEST_F(CANExtractorTest, FallsBackToFirstSixDigitRun) {
    std::vector<std::string> lines = {"UTOPIA", "12345", "NO 9876543 X 654321", "111222"};

    EXPECT_EQ(CandidateExtractor::extractCAN(lines), "654321");
}

TEST_F(CANExtractorTest, MRZLinesAreExcluded) {
    std::vector<std::string> lines = {"L898902C36UTO740812<2F1204159", "CAN<482391"};

    EXPECT_FALSE(CandidateExtractor::extractCAN(lines).has_value());
}

TEST_F(CANExtractorTest, LongerRunsDoNotMatch) {
    std::vector<std::string> lines = {"CAN 4823910", "12345"};

    EXPECT_FALSE(CandidateExtractor::extractCAN(lines).has_value());
}

TEST_F(CANExtractorTest, NoneWhenAbsent) {
    EXPECT_FALSE(CandidateExtractor::extractCAN({"NOISE", "UTOPIA"}).has_value());
    EXPECT_FALSE(CandidateExtractor::extractCAN({}).has_value());
}

TEST_F(CANExtractorTest, ConfigLengthAndLabels) {
    HeuristicConfig config;
    config.canLength = 8;
    config.canLabels = {"NUMERO"};

    std::vector<std::string> lines = {"12345678", "numero 87654321"};

    EXPECT_EQ(CandidateExtractor::extractCAN(lines, config), "87654321");
}

TEST_F(CANExtractorTest, DigitRuns) {
    std::vector<std::string> runs = CandidateExtractor::digitRuns("CAN 12-345678x9");

    ASSERT_EQ(runs.size(), 3u);
    EXPECT_EQ(runs[0], "12");
    EXPECT_EQ(runs[1], "345678");
    EXPECT_EQ(runs[2], "9");
}
