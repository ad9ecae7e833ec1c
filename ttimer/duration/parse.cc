#include "ttimer/duration/parse.h"

#include <cstdint>
#include <limits>
#include <vector>

#include "absl/numeric/int128.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "ttimer/errors/human-error.h"

namespace ttimer {
namespace {

constexpr size_t kMaxParts = 4;
constexpr int64_t kMaxSeconds = std::numeric_limits<int64_t>::max();

constexpr char kParseFailed[] = "Failed to parse the duration";
constexpr char kFormatHint[] = "Provide the duration in the following format: \"d:h:m:s.ms\"";

struct Unit {
  const char* name;
  uint64_t seconds;
};

// Indexed by position from the right.
constexpr Unit kUnits[kMaxParts] = {
    {"seconds", 1},
    {"minutes", 60},
    {"hours", 3600},
    {"days", 86400},
};

absl::Status OverflowError(absl::string_view unit) {
  return UserErrorWithCause(
      "Duration overflow", "The provided duration is too large to be represented",
      UserError(absl::StrCat("Overflow in ", unit),
                "Make sure the value is within a reasonable range"));
}

// ParseCount accepts only ASCII digits. A digits-only token that does not fit
// in 64 bits is an overflow of `unit`, not a syntax error.
absl::Status ParseCount(absl::string_view token, absl::string_view title,
                        absl::string_view hint, absl::string_view unit, uint64_t* value) {
  if (token.empty()) {
    return UserErrorWithInternal(title, hint, "cannot parse integer from empty string");
  }
  for (char c : token) {
    if (!absl::ascii_isdigit(static_cast<unsigned char>(c))) {
      return UserErrorWithInternal(title, hint, "invalid digit found in string");
    }
  }
  if (!absl::SimpleAtoi(token, value)) {
    return OverflowError(unit);
  }
  return absl::OkStatus();
}

// AddScaled computes *total += value * unit.seconds, failing instead of
// exceeding kMaxSeconds.
absl::Status AddScaled(uint64_t value, const Unit& unit, absl::uint128* total) {
  absl::uint128 scaled = absl::uint128(value) * unit.seconds;
  if (scaled > absl::uint128(kMaxSeconds)) {
    return OverflowError(unit.name);
  }
  absl::uint128 sum = *total + scaled;
  if (sum > absl::uint128(kMaxSeconds)) {
    return OverflowError(unit.name);
  }
  *total = sum;
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<absl::Duration> ParseDuration(absl::string_view input) {
  if (input.empty()) {
    return UserErrorWithCause(
        kParseFailed, kFormatHint,
        UserError("Missing parts",
                  "Make sure to provide at least the seconds part of the duration"));
  }

  // Collect up to one more part than allowed, starting from the right, so that
  // extra parts are reported instead of dropped.
  std::vector<absl::string_view> all = absl::StrSplit(input, ':');
  std::vector<absl::string_view> parts;
  for (auto it = all.rbegin(); it != all.rend() && parts.size() <= kMaxParts; ++it) {
    parts.push_back(*it);
  }
  if (parts.size() > kMaxParts) {
    return UserErrorWithCause(
        kParseFailed, kFormatHint,
        UserError("Too many parts",
                  "Make sure to provide at most 4 parts for days, hours, minutes, and "
                  "seconds"));
  }

  std::vector<absl::string_view> s_ms = absl::StrSplit(parts[0], '.');
  if (s_ms.size() > 2) {
    return UserErrorWithCause(
        kParseFailed, kFormatHint,
        UserError("Too many parts in seconds.milliseconds",
                  "Make sure to provide at most one dot in the seconds part"));
  }

  uint64_t secs = 0;
  absl::Status st =
      ParseCount(s_ms[0], "Failed to parse the seconds part",
                 "Make sure to provide a valid number for the seconds part", "seconds",
                 &secs);
  if (!st.ok()) {
    return st;
  }
  uint64_t millis = 0;
  if (s_ms.size() == 2) {
    st = ParseCount(s_ms[1], "Failed to parse the milliseconds part",
                    "Make sure to provide a valid number for the milliseconds part",
                    "milliseconds", &millis);
    if (!st.ok()) {
      return st;
    }
  }

  absl::uint128 total = 0;
  st = AddScaled(secs, kUnits[0], &total);
  if (!st.ok()) {
    return st;
  }
  st = AddScaled(millis / 1000, Unit{"milliseconds", 1}, &total);
  if (!st.ok()) {
    return st;
  }

  for (size_t i = 1; i < parts.size(); ++i) {
    uint64_t value = 0;
    if (i >= kMaxParts) {
      return UserError("Invalid duration part",
                       "Make sure to provide a valid number for the duration part");
    }
    st = ParseCount(parts[i], absl::StrCat("Failed to parse the ", kUnits[i].name, " part"),
                    absl::StrCat("Make sure to provide a valid number for the ",
                                 kUnits[i].name, " part"),
                    kUnits[i].name, &value);
    if (!st.ok()) {
      return st;
    }
    st = AddScaled(value, kUnits[i], &total);
    if (!st.ok()) {
      return st;
    }
  }

  return absl::Seconds(static_cast<int64_t>(total)) +
         absl::Milliseconds(static_cast<int64_t>(millis % 1000));
}

}  // namespace ttimer
