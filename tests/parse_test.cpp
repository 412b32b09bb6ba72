#include <gtest/gtest.h>

#include <deckprep/parse.hpp>

namespace deckprep::test {

TEST(ParseNumber, AcceptsIntegersAndFloats) {
  EXPECT_EQ(parse_number<int>("42").value(), 42);
  EXPECT_DOUBLE_EQ(parse_number<double>("-14.5").value(), -14.5);
  EXPECT_DOUBLE_EQ(parse_number<double>("+3").value(), 3.0);
}

TEST(ParseNumber, RejectsGarbage) {
  EXPECT_EQ(parse_number<int>("abc").error(), "not a number");
  EXPECT_EQ(parse_number<int>("12x").error(), "trailing characters");
  EXPECT_EQ(parse_number<int>("99999999999").error(), "out of range");
  EXPECT_FALSE(parse_number<int>("").has_value());
}

TEST(ParseClock, AcceptsSecondsAndMinutesSeconds) {
  EXPECT_EQ(parse_clock("1800").value(), 1800);
  EXPECT_EQ(parse_clock("30:00").value(), 1800);
  EXPECT_EQ(parse_clock(" 1:05 ").value(), 65);
  EXPECT_EQ(parse_clock("0:59").value(), 59);
}

TEST(ParseClock, RejectsMalformedTimes) {
  EXPECT_FALSE(parse_clock("").has_value());
  EXPECT_FALSE(parse_clock("1:75").has_value());
  EXPECT_FALSE(parse_clock("1:2:3").has_value());
  EXPECT_FALSE(parse_clock("-5").has_value());
  EXPECT_FALSE(parse_clock("ab:cd").has_value());
}

TEST(ParseCommandLine, SplitsOnWhitespaceAndHonoursQuotes) {
  auto args = parse_command_line(R"(add "my track.wav" 'it''s' a\ b)");
  ASSERT_EQ(args.size(), 4u);
  EXPECT_EQ(args[0], "add");
  EXPECT_EQ(args[1], "my track.wav");
  EXPECT_EQ(args[2], "its");
  EXPECT_EQ(args[3], "a b");
}

TEST(ParseCommandLine, EmptyInputGivesNoArguments) {
  EXPECT_TRUE(parse_command_line("   ").empty());
}

TEST(Trim, StripsBothEnds) {
  EXPECT_EQ(trim("  Type II \t\n"), "Type II");
  EXPECT_EQ(trim(""), "");
  EXPECT_EQ(trim("   "), "");
}

} // namespace deckprep::test
