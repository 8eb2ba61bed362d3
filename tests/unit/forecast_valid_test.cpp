#include <gtest/gtest.h>

#include <string>
#include <variant>

#include "hrrr/common/diagnostic.hpp"
#include "hrrr/inventory/forecast_valid.hpp"

namespace hrrr {
namespace {

auto Resolve(const std::string& text, int forecast_hour) -> std::string {
  auto tmpl = MatchForecastValidTemplate(text);
  EXPECT_TRUE(tmpl.has_value()) << text;
  return ResolveForecastValid(*tmpl, forecast_hour);
}

// =============================================================================
// Matching
// =============================================================================

TEST(ForecastValidMatchTest, AnalysisLiteral) {
  auto tmpl = MatchForecastValidTemplate("analysis");
  ASSERT_TRUE(tmpl.has_value());
  EXPECT_TRUE(std::holds_alternative<AnalysisTemplate>(*tmpl));
}

TEST(ForecastValidMatchTest, InstantShape) {
  auto tmpl = MatchForecastValidTemplate("30 min fcst");
  ASSERT_TRUE(tmpl.has_value());
  ASSERT_TRUE(std::holds_alternative<InstantTemplate>(*tmpl));
  EXPECT_EQ(std::get<InstantTemplate>(*tmpl),
            (InstantTemplate{.value = 30, .unit = "min"}));
}

TEST(ForecastValidMatchTest, IntervalShape) {
  auto tmpl = MatchForecastValidTemplate("0-15 min acc");
  ASSERT_TRUE(tmpl.has_value());
  ASSERT_TRUE(std::holds_alternative<IntervalTemplate>(*tmpl));
  const auto& interval = std::get<IntervalTemplate>(*tmpl);
  EXPECT_EQ(interval.start_text, "0");
  EXPECT_EQ(interval.start, 0);
  EXPECT_EQ(interval.end, 15);
  EXPECT_EQ(interval.unit, "min");
  EXPECT_EQ(interval.stat, "acc");
}

TEST(ForecastValidMatchTest, InstantShapeIsFoundInsideLongerText) {
  auto tmpl = MatchForecastValidTemplate("foo 3 hour fcst");
  ASSERT_TRUE(tmpl.has_value());
  ASSERT_TRUE(std::holds_alternative<InstantTemplate>(*tmpl));
  EXPECT_EQ(std::get<InstantTemplate>(*tmpl),
            (InstantTemplate{.value = 3, .unit = "hour"}));
}

TEST(ForecastValidMatchTest, InstantShapeWinsOverIntervalEndingInFcst) {
  auto tmpl = MatchForecastValidTemplate("1-2 hour max fcst");
  ASSERT_TRUE(tmpl.has_value());
  ASSERT_TRUE(std::holds_alternative<InstantTemplate>(*tmpl));
  EXPECT_EQ(std::get<InstantTemplate>(*tmpl),
            (InstantTemplate{.value = 2, .unit = "hour max"}));
}

TEST(ForecastValidMatchTest, UnrecognizedTemplateFails) {
  for (const char* text : {"", "Analysis", "hour fcst", "3 hour",
                           "x-2 hour acc", "1-2hour acc", "analysis "}) {
    auto tmpl = MatchForecastValidTemplate(text);
    ASSERT_FALSE(tmpl.has_value()) << "'" << text << "'";
    EXPECT_EQ(tmpl.error().Kind(), DiagKind::kTemplateParse);
  }
}

TEST(ForecastValidMatchTest, LargeTemplateNumbersAreAccepted) {
  auto tmpl = MatchForecastValidTemplate("2147483600 min fcst");
  ASSERT_TRUE(tmpl.has_value());
  EXPECT_EQ(std::get<InstantTemplate>(*tmpl).value, 2147483600);
}

TEST(ForecastValidMatchTest, OversizedTemplateNumberIsParseError) {
  for (const char* text :
       {"99999999999999999999 min fcst", "0-99999999999999999999 min acc",
        "4611686018427387904 min fcst"}) {
    auto tmpl = MatchForecastValidTemplate(text);
    ASSERT_FALSE(tmpl.has_value()) << text;
    EXPECT_EQ(tmpl.error().Kind(), DiagKind::kTemplateParse);
    EXPECT_NE(tmpl.error().Message().find(text), std::string::npos);
  }
}

TEST(ForecastValidMatchTest, ParseErrorNamesTemplateText) {
  auto tmpl = MatchForecastValidTemplate("average of something");
  ASSERT_FALSE(tmpl.has_value());
  EXPECT_NE(
      tmpl.error().Message().find("average of something"), std::string::npos);
}

// =============================================================================
// Analysis
// =============================================================================

TEST(ForecastValidResolveTest, AnalysisAtHourZero) {
  EXPECT_EQ(Resolve("analysis", 0), "analysis");
}

TEST(ForecastValidResolveTest, AnalysisAfterHourZeroIsHourForecast) {
  EXPECT_EQ(Resolve("analysis", 1), "1 hour fcst");
  EXPECT_EQ(Resolve("analysis", 7), "7 hour fcst");
}

// =============================================================================
// Single instant
// =============================================================================

TEST(ForecastValidResolveTest, InstantHourUsesForecastHour) {
  EXPECT_EQ(Resolve("3 hour fcst", 5), "5 hour fcst");
  EXPECT_EQ(Resolve("2 hour fcst", 48), "48 hour fcst");
}

TEST(ForecastValidResolveTest, InstantMinuteShiftsBySixtyPerHour) {
  EXPECT_EQ(Resolve("30 min fcst", 2), "90 min fcst");
  EXPECT_EQ(Resolve("15 min fcst", 1), "15 min fcst");
  EXPECT_EQ(Resolve("60 min fcst", 18), "1080 min fcst");
}

TEST(ForecastValidResolveTest, InstantMinuteDoesNotOverflowInt) {
  EXPECT_EQ(Resolve("2147483600 min fcst", 48), "2147486420 min fcst");
}

TEST(ForecastValidResolveTest, TrailingFcstResolvesAsInstant) {
  EXPECT_EQ(Resolve("1-2 hour max fcst", 5), "5 hour max fcst");
  EXPECT_EQ(Resolve("0-1 hour acc fcst", 5), "5 hour acc fcst");
  EXPECT_EQ(Resolve("60-75 min acc fcst", 5), "5 min acc fcst");
}

// =============================================================================
// Intervals
// =============================================================================

TEST(ForecastValidResolveTest, IntervalMinuteShiftsFromHourTwo) {
  EXPECT_EQ(Resolve("0-15 min acc", 3), "60-75 min acc");
  EXPECT_EQ(Resolve("60-75 min acc", 1), "0-15 min acc");
  EXPECT_EQ(Resolve("60-75 min ave", 2), "60-75 min ave");
}

TEST(ForecastValidResolveTest, IntervalHourFromOneStartsAtPreviousHour) {
  EXPECT_EQ(Resolve("1-2 hour acc", 5), "4-5 hour acc");
  EXPECT_EQ(Resolve("1-2 hour max", 2), "1-2 hour max");
}

TEST(ForecastValidResolveTest, IntervalHourFromZeroAccumulatesFromStart) {
  EXPECT_EQ(Resolve("0-2 hour acc", 5), "0-5 hour acc");
  EXPECT_EQ(Resolve("0-0 day acc", 1), "0-1 hour acc");
}

TEST(ForecastValidResolveTest, IntervalNonMinuteUnitIsNormalizedToHour) {
  EXPECT_EQ(Resolve("0-0 day acc", 5), "0-5 hour acc");
}

TEST(ForecastValidResolveTest, DayOverrideOnWholeDays) {
  EXPECT_EQ(Resolve("0-1 hour acc", 24), "0-1 day acc");
  EXPECT_EQ(Resolve("1-2 hour acc", 48), "0-2 day acc");
  EXPECT_EQ(Resolve("0-0 day acc", 0), "0-0 day acc");
}

TEST(ForecastValidResolveTest, DayOverrideSkipsMinuteWindows) {
  EXPECT_EQ(Resolve("0-15 min acc", 24), "1320-1335 min acc");
}

TEST(ForecastValidResolveTest, IntervalMinuteDoesNotOverflowInt) {
  EXPECT_EQ(
      Resolve("2147483600-2147483615 min acc", 48),
      "2147486360-2147486375 min acc");
}

// =============================================================================
// Window pieces
// =============================================================================

TEST(IntervalWindowTest, ComputeKeepsStartTextComparisonLiteral) {
  IntervalTemplate tmpl{
      .start_text = "01", .start = 1, .end = 2, .unit = "hour", .stat = "acc"};
  auto window = ComputeIntervalWindow(tmpl, 5);
  EXPECT_EQ(window.start, 0);
  EXPECT_EQ(window.end, 5);
}

TEST(IntervalWindowTest, DayOverrideReplacesHourBounds) {
  IntervalWindow window{.start = 23, .end = 24, .unit = "hour", .stat = "acc"};
  EXPECT_EQ(
      ApplyDayOverride(window, 24),
      (IntervalWindow{.start = 0, .end = 1, .unit = "day", .stat = "acc"}));
}

TEST(IntervalWindowTest, DayOverrideLeavesOtherHoursAlone) {
  IntervalWindow window{.start = 22, .end = 23, .unit = "hour", .stat = "acc"};
  EXPECT_EQ(ApplyDayOverride(window, 23), window);
}

TEST(IntervalWindowTest, FormatJoinsFields) {
  EXPECT_EQ(
      FormatIntervalWindow(
          {.start = 4, .end = 5, .unit = "hour", .stat = "max fcst"}),
      "4-5 hour max fcst");
}

}  // namespace
}  // namespace hrrr
