#include "ttimer/duration/format.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "ttimer/duration/parse.h"

namespace ttimer {
namespace {

TEST(FormatRemainingTest, OmitsLeadingZeroUnits) {
  EXPECT_EQ(FormatRemaining(absl::ZeroDuration()), "0s");
  EXPECT_EQ(FormatRemaining(absl::Seconds(5)), "5s");
  EXPECT_EQ(FormatRemaining(absl::Seconds(90)), "1m 30s");
  EXPECT_EQ(FormatRemaining(absl::Minutes(2)), "2m 0s");
}

TEST(FormatRemainingTest, ShowsSmallerUnitsOnceLargerIsNonZero) {
  EXPECT_EQ(FormatRemaining(absl::Hours(1)), "1h 0m 0s");
  EXPECT_EQ(FormatRemaining(absl::Hours(24)), "1d 0h 0m 0s");
  EXPECT_EQ(FormatRemaining(absl::Hours(24) + absl::Seconds(1)), "1d 0h 0m 1s");
  EXPECT_EQ(FormatRemaining(absl::Hours(26) + absl::Minutes(3) + absl::Seconds(4)),
            "1d 2h 3m 4s");
}

TEST(FormatRemainingTest, TruncatesSubSeconds) {
  EXPECT_EQ(FormatRemaining(absl::Milliseconds(1999)), "1s");
  EXPECT_EQ(FormatRemaining(absl::Milliseconds(500)), "0s");
}

TEST(FormatRemainingTest, NormalizesParsedFields) {
  EXPECT_EQ(FormatRemaining(*ParseDuration("90:0")), "1h 30m 0s");
  EXPECT_EQ(FormatRemaining(*ParseDuration("0:90")), "1m 30s");
  EXPECT_EQ(FormatRemaining(*ParseDuration("0:25:0:0")), "1d 1h 0m 0s");
  EXPECT_EQ(FormatRemaining(*ParseDuration("1:2:3:4")), "1d 2h 3m 4s");
}

TEST(FormatRemainingTest, NegativeClampsToZero) {
  EXPECT_EQ(FormatRemaining(absl::Seconds(-3)), "0s");
}

}  // namespace
}  // namespace ttimer
