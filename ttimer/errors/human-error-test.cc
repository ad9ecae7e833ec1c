#include "ttimer/errors/human-error.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace ttimer {
namespace {

using ::testing::HasSubstr;
using ::testing::Optional;

TEST(HumanErrorTest, UserErrorCarriesTitleAndHint) {
  absl::Status st = UserError("Missing parts", "Provide the seconds");
  EXPECT_TRUE(IsUserError(st));
  EXPECT_FALSE(IsSystemError(st));
  EXPECT_EQ(st.message(), "Missing parts");
  EXPECT_EQ(ErrorHint(st), "Provide the seconds");
  EXPECT_FALSE(ErrorCause(st).has_value());
  EXPECT_FALSE(ErrorInternal(st).has_value());
}

TEST(HumanErrorTest, CauseIsWrapped) {
  absl::Status st = UserErrorWithCause("Duration overflow", "Too large",
                                       UserError("Overflow in hours", "Be reasonable"));
  EXPECT_TRUE(IsUserError(st));
  EXPECT_EQ(st.message(), "Duration overflow");
  EXPECT_THAT(ErrorCause(st), Optional(std::string("Overflow in hours")));

  std::string text = FormatHumanError(st);
  EXPECT_THAT(text, HasSubstr("Duration overflow (Overflow in hours)"));
  EXPECT_THAT(text, HasSubstr(" - Too large\n"));
  EXPECT_THAT(text, HasSubstr(" - Be reasonable\n"));
}

TEST(HumanErrorTest, NestedCausesAreJoined) {
  absl::Status inner = UserErrorWithCause("b", "", UserError("c", ""));
  absl::Status outer = UserErrorWithCause("a", "", inner);
  EXPECT_THAT(ErrorCause(outer), Optional(std::string("b: c")));
}

TEST(HumanErrorTest, InternalDetailIsKept) {
  absl::Status st = UserErrorWithInternal("Failed to parse the seconds part", "Use digits",
                                          "invalid digit found in string");
  EXPECT_THAT(ErrorInternal(st), Optional(std::string("invalid digit found in string")));
  EXPECT_THAT(FormatHumanError(st),
              HasSubstr("This was caused by:\n - invalid digit found in string"));
}

TEST(HumanErrorTest, SystemError) {
  absl::Status st = SystemErrorWithInternal("Failed to write to the terminal",
                                            "Try notifying the developer", "EPIPE");
  EXPECT_TRUE(IsSystemError(st));
  EXPECT_FALSE(IsUserError(st));
  EXPECT_EQ(st.code(), absl::StatusCode::kInternal);
  EXPECT_THAT(FormatHumanError(st), HasSubstr("Try notifying the developer"));
}

TEST(HumanErrorTest, OkFormatsEmpty) {
  EXPECT_EQ(FormatHumanError(absl::OkStatus()), "");
  EXPECT_FALSE(IsSystemError(absl::OkStatus()));
}

}  // namespace
}  // namespace ttimer
