#include "ttimer/errors/human-error.h"

#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"

namespace ttimer {
namespace {

absl::optional<std::string> Payload(const absl::Status& status, absl::string_view url) {
  absl::optional<absl::Cord> p = status.GetPayload(url);
  if (!p.has_value()) {
    return absl::nullopt;
  }
  return std::string(*p);
}

absl::Status WithHint(absl::Status status, absl::string_view hint) {
  status.SetPayload(kHintPayloadUrl, absl::Cord(hint));
  return status;
}

}  // namespace

absl::Status UserError(absl::string_view title, absl::string_view hint) {
  return WithHint(absl::InvalidArgumentError(title), hint);
}

absl::Status UserErrorWithCause(absl::string_view title, absl::string_view hint,
                                const absl::Status& cause) {
  absl::Status st = UserError(title, hint);
  std::string cause_text(cause.message());
  if (auto nested = ErrorCause(cause); nested.has_value()) {
    absl::StrAppend(&cause_text, ": ", *nested);
  }
  st.SetPayload(kCausePayloadUrl, absl::Cord(cause_text));
  std::string cause_hint = ErrorHint(cause);
  if (!cause_hint.empty()) {
    st.SetPayload(kCauseHintPayloadUrl, absl::Cord(cause_hint));
  }
  if (auto internal = ErrorInternal(cause); internal.has_value()) {
    st.SetPayload(kInternalPayloadUrl, absl::Cord(*internal));
  }
  return st;
}

absl::Status UserErrorWithInternal(absl::string_view title, absl::string_view hint,
                                   absl::string_view internal) {
  absl::Status st = UserError(title, hint);
  st.SetPayload(kInternalPayloadUrl, absl::Cord(internal));
  return st;
}

absl::Status SystemErrorWithInternal(absl::string_view title, absl::string_view hint,
                                     absl::string_view internal) {
  absl::Status st = WithHint(absl::InternalError(title), hint);
  st.SetPayload(kInternalPayloadUrl, absl::Cord(internal));
  return st;
}

bool IsUserError(const absl::Status& status) {
  return status.code() == absl::StatusCode::kInvalidArgument;
}

bool IsSystemError(const absl::Status& status) {
  return !status.ok() && !IsUserError(status);
}

std::string ErrorHint(const absl::Status& status) {
  return Payload(status, kHintPayloadUrl).value_or("");
}

absl::optional<std::string> ErrorCause(const absl::Status& status) {
  return Payload(status, kCausePayloadUrl);
}

absl::optional<std::string> ErrorInternal(const absl::Status& status) {
  return Payload(status, kInternalPayloadUrl);
}

std::string FormatHumanError(const absl::Status& status) {
  if (status.ok()) {
    return "";
  }

  std::string out = IsUserError(status) ? "Oh no! We ran into a problem.\n\n"
                                        : "Whoops! Something went wrong on our end.\n\n";
  absl::StrAppend(&out, status.message());
  absl::optional<std::string> cause = ErrorCause(status);
  if (cause.has_value()) {
    absl::StrAppend(&out, " (", *cause, ")");
  }
  absl::StrAppend(&out, "\n");
  if (auto internal = ErrorInternal(status); internal.has_value()) {
    absl::StrAppend(&out, "\nThis was caused by:\n - ", *internal, "\n");
  }

  std::string hint = ErrorHint(status);
  absl::optional<std::string> cause_hint = Payload(status, kCauseHintPayloadUrl);
  if (!hint.empty() || cause_hint.has_value()) {
    absl::StrAppend(&out, "\nTo try and fix this, you can:\n");
    if (!hint.empty()) {
      absl::StrAppend(&out, " - ", hint, "\n");
    }
    if (cause_hint.has_value()) {
      absl::StrAppend(&out, " - ", *cause_hint, "\n");
    }
  }
  return out;
}

}  // namespace ttimer
