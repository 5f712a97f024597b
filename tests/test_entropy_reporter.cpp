#include <gtest/gtest.h>

#include <cmath>
#include <sstream>
#include <string>
#include <vector>

#include "passgen/entropy_reporter.hpp"

using passgen::EntropyReporter;

namespace {

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

TEST(EntropyReporterTest, EntropyPerTokenIsLog2) {
    EXPECT_DOUBLE_EQ(EntropyReporter::Compute(2.0, 1.0).entropy_per_token, 1.0);
    EXPECT_DOUBLE_EQ(EntropyReporter::Compute(1024.0, 1.0).entropy_per_token, 10.0);
    EXPECT_DOUBLE_EQ(EntropyReporter::Compute(1.0, 8.0).total_entropy, 0.0);
}

TEST(EntropyReporterTest, TotalEntropyScalesWithCount) {
    const auto report = EntropyReporter::Compute(26.0, 10.0);
    EXPECT_NEAR(report.entropy_per_token, 4.7004, 1e-4);
    EXPECT_NEAR(report.total_entropy, 47.004, 1e-3);
}

TEST(EntropyReporterTest, GuessTimesSubtractWorkBits) {
    const auto report = EntropyReporter::Compute(2.0, 80.0);
    EXPECT_EQ(report.guess_times[0].label, "1 billion / second");
    EXPECT_EQ(report.guess_times[1].label, "1 quadrillion / second");
    EXPECT_EQ(report.guess_times[2].label, "1 sextillion / second");
    EXPECT_DOUBLE_EQ(report.guess_times[0].seconds, std::exp2(49.0));
    EXPECT_DOUBLE_EQ(report.guess_times[1].seconds, std::exp2(29.0));
    EXPECT_DOUBLE_EQ(report.guess_times[2].seconds, std::exp2(9.0));
}

TEST(EntropyReporterTest, DurationTiers) {
    EXPECT_EQ(EntropyReporter::FormatDuration(0.0), "less than a second");
    EXPECT_EQ(EntropyReporter::FormatDuration(0.5), "less than a second");
    EXPECT_EQ(EntropyReporter::FormatDuration(1.0), "1 seconds");
    EXPECT_EQ(EntropyReporter::FormatDuration(45.0), "45 seconds");
    EXPECT_EQ(EntropyReporter::FormatDuration(60.0), "1 minutes");
    EXPECT_EQ(EntropyReporter::FormatDuration(3700.0), "62 minutes");
    EXPECT_EQ(EntropyReporter::FormatDuration(90000.0), "25 hours");
    EXPECT_EQ(EntropyReporter::FormatDuration(3.0 * passgen::kDay), "3 days");
    EXPECT_EQ(EntropyReporter::FormatDuration(40000000.0), "1 years");
    EXPECT_EQ(EntropyReporter::FormatDuration(50.0 * passgen::kYear), "50 years");
    EXPECT_EQ(EntropyReporter::FormatDuration(7.0 * passgen::kCentury), "7 centuries");
}

TEST(EntropyReporterTest, LargeValuesUseExponentMarker) {
    EXPECT_EQ(EntropyReporter::FormatUnit(999999.0, "days"), "999999 days");
    EXPECT_EQ(EntropyReporter::FormatUnit(1e6, "centuries"), "1e+6 centuries");
    EXPECT_EQ(EntropyReporter::FormatUnit(3.2e9, "centuries"), "3e+9 centuries");
    EXPECT_EQ(EntropyReporter::FormatUnit(7.7e9, "centuries"), "8e+9 centuries");
    EXPECT_EQ(EntropyReporter::FormatUnit(4.1e123, "centuries"), "4e+123 centuries");
    EXPECT_EQ(EntropyReporter::FormatDuration(3.2e9 * passgen::kCentury), "3e+9 centuries");
}

TEST(EntropyReporterTest, PrintWritesReportAndSeparator) {
    const auto report = EntropyReporter::Compute(1024.0, 4.0);
    std::ostringstream out;
    EntropyReporter::Print(report, out, [] { return std::size_t{12}; });

    const auto lines = SplitLines(out.str());
    ASSERT_EQ(lines.size(), 7u);
    EXPECT_EQ(lines[0], "entropy per token:          10.0 bits");
    EXPECT_EQ(lines[1], "total entropy:              40 bits");
    EXPECT_EQ(lines[2], "guess times:");
    EXPECT_EQ(lines[3], "  1 billion / second:       9 minutes");
    EXPECT_EQ(lines[4], "  1 quadrillion / second:   less than a second");
    EXPECT_EQ(lines[5], "  1 sextillion / second:    less than a second");
    EXPECT_EQ(lines[6], std::string(12, '-'));
}

TEST(EntropyReporterTest, MissingWidthProviderFallsBackToDefault) {
    const auto report = EntropyReporter::Compute(10.0, 8.0);
    std::ostringstream out;
    EntropyReporter::Print(report, out, passgen::TerminalWidthProvider{});
    const auto lines = SplitLines(out.str());
    ASSERT_FALSE(lines.empty());
    EXPECT_EQ(lines.back(), std::string(passgen::kDefaultTerminalWidth, '-'));
}

TEST(EntropyReporterTest, TerminalWidthQueryIsPositive) {
    EXPECT_GT(EntropyReporter::QueryTerminalWidth(), 0u);
}
