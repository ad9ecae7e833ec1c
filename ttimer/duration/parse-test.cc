#include "ttimer/duration/parse.h"

#include <limits>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "ttimer/errors/human-error.h"

namespace ttimer {
namespace {

using ::testing::Optional;

absl::Duration MustParse(absl::string_view input) {
  absl::StatusOr<absl::Duration> d = ParseDuration(input);
  EXPECT_TRUE(d.ok()) << "input: \"" << input << "\": " << d.status();
  return d.value_or(absl::InfiniteDuration());
}

absl::Status ParseError(absl::string_view input) {
  absl::StatusOr<absl::Duration> d = ParseDuration(input);
  EXPECT_FALSE(d.ok()) << "input: \"" << input << "\" parsed as " << *d;
  return d.status();
}

TEST(ParseDurationTest, Seconds) {
  EXPECT_EQ(MustParse("5"), absl::Seconds(5));
  EXPECT_EQ(MustParse("0"), absl::ZeroDuration());
  EXPECT_EQ(MustParse("007"), absl::Seconds(7));
  EXPECT_EQ(MustParse("3600"), absl::Hours(1));
}

TEST(ParseDurationTest, AllFields) {
  EXPECT_EQ(MustParse("1:30"), absl::Seconds(90));
  EXPECT_EQ(MustParse("2:0:0"), absl::Hours(2));
  EXPECT_EQ(MustParse("1:2:3:4"),
            absl::Hours(24) + absl::Hours(2) + absl::Minutes(3) + absl::Seconds(4));
  EXPECT_EQ(MustParse("0:90"), absl::Seconds(90));
  EXPECT_EQ(MustParse("90:0"), absl::Minutes(90));
}

TEST(ParseDurationTest, Milliseconds) {
  EXPECT_EQ(MustParse("0:0:0:1.500"), absl::Milliseconds(1500));
  EXPECT_EQ(MustParse("1.5"), absl::Seconds(1) + absl::Milliseconds(5));
  EXPECT_EQ(MustParse("0.2500"), absl::Milliseconds(2500));
  EXPECT_EQ(MustParse("1:00.001"), absl::Seconds(60) + absl::Milliseconds(1));
}

TEST(ParseDurationTest, MissingParts) {
  absl::Status st = ParseError("");
  EXPECT_TRUE(IsUserError(st));
  EXPECT_EQ(st.message(), "Failed to parse the duration");
  EXPECT_THAT(ErrorCause(st), Optional(std::string("Missing parts")));
}

TEST(ParseDurationTest, TooManyParts) {
  for (absl::string_view input : {":::::", "1:2:3:4:5", "0:0:0:0:0:0"}) {
    absl::Status st = ParseError(input);
    EXPECT_TRUE(IsUserError(st));
    EXPECT_EQ(st.message(), "Failed to parse the duration");
    EXPECT_THAT(ErrorCause(st), Optional(std::string("Too many parts"))) << input;
  }
}

TEST(ParseDurationTest, TooManyDots) {
  absl::Status st = ParseError("1.2.3");
  EXPECT_THAT(ErrorCause(st),
              Optional(std::string("Too many parts in seconds.milliseconds")));

  st = ParseError("1:2.3.4");
  EXPECT_THAT(ErrorCause(st),
              Optional(std::string("Too many parts in seconds.milliseconds")));
}

TEST(ParseDurationTest, NonNumericFieldsNameTheField) {
  absl::Status st = ParseError("x");
  EXPECT_EQ(st.message(), "Failed to parse the seconds part");
  EXPECT_THAT(ErrorInternal(st), Optional(std::string("invalid digit found in string")));

  st = ParseError("1.x");
  EXPECT_EQ(st.message(), "Failed to parse the milliseconds part");

  st = ParseError("1.");
  EXPECT_EQ(st.message(), "Failed to parse the milliseconds part");
  EXPECT_THAT(ErrorInternal(st),
              Optional(std::string("cannot parse integer from empty string")));

  st = ParseError("x:0");
  EXPECT_EQ(st.message(), "Failed to parse the minutes part");
  EXPECT_EQ(ErrorHint(st), "Make sure to provide a valid number for the minutes part");

  st = ParseError("x:0:0");
  EXPECT_EQ(st.message(), "Failed to parse the hours part");

  st = ParseError("x:0:0:0");
  EXPECT_EQ(st.message(), "Failed to parse the days part");

  st = ParseError("1:");
  EXPECT_EQ(st.message(), "Failed to parse the seconds part");

  st = ParseError(":5");
  EXPECT_EQ(st.message(), "Failed to parse the minutes part");
  EXPECT_THAT(ErrorInternal(st),
              Optional(std::string("cannot parse integer from empty string")));
}

TEST(ParseDurationTest, RejectsSignsAndWhitespace) {
  for (absl::string_view input : {"-5", "+5", " 5", "5 ", "1:-1", "1e3"}) {
    absl::Status st = ParseError(input);
    EXPECT_TRUE(IsUserError(st)) << input;
    EXPECT_THAT(ErrorInternal(st), Optional(std::string("invalid digit found in string")))
        << input;
  }
}

TEST(ParseDurationTest, OverflowNamesTheUnit) {
  absl::Status st = ParseError("99999999999999999999:0");
  EXPECT_TRUE(IsUserError(st));
  EXPECT_EQ(st.message(), "Duration overflow");
  EXPECT_THAT(ErrorCause(st), Optional(std::string("Overflow in minutes")));

  // Fits in 64 bits but not once multiplied.
  st = ParseError("9223372036854775807:0");
  EXPECT_THAT(ErrorCause(st), Optional(std::string("Overflow in minutes")));

  st = ParseError("3000000000000000:0:0");
  EXPECT_THAT(ErrorCause(st), Optional(std::string("Overflow in hours")));

  st = ParseError("200000000000000:0:0:0");
  EXPECT_THAT(ErrorCause(st), Optional(std::string("Overflow in days")));

  st = ParseError("99999999999999999999");
  EXPECT_THAT(ErrorCause(st), Optional(std::string("Overflow in seconds")));

  st = ParseError("1.99999999999999999999");
  EXPECT_THAT(ErrorCause(st), Optional(std::string("Overflow in milliseconds")));
}

TEST(ParseDurationTest, OverflowFromAddition) {
  // Each product fits, the sum does not.
  absl::Status st = ParseError("100000000000000:9223372036854775807");
  EXPECT_THAT(ErrorCause(st), Optional(std::string("Overflow in minutes")));

  st = ParseError("100000000000000:0:0:9223372036854775807");
  EXPECT_THAT(ErrorCause(st), Optional(std::string("Overflow in days")));
}

TEST(ParseDurationTest, LargestValue) {
  absl::Duration d = MustParse("9223372036854775807.999");
  EXPECT_EQ(absl::ToInt64Seconds(d), std::numeric_limits<int64_t>::max());
  EXPECT_NE(d, absl::InfiniteDuration());
}

}  // namespace
}  // namespace ttimer
