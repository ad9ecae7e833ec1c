#include "ttimer/posix/strerror.h"

#include <string.h>

#include "absl/strings/str_cat.h"

namespace ttimer {

std::string StrError(int error_number) {
  char buf[256];
#if (_POSIX_C_SOURCE >= 200112L) && !_GNU_SOURCE
  if (strerror_r(error_number, buf, sizeof(buf)) != 0) {
    return absl::StrCat("Error number ", error_number);
  }
  return std::string(buf);
#else
  // GNU strerror_r may return a static string instead of filling buf.
  return std::string(strerror_r(error_number, buf, sizeof(buf)));
#endif
}

}  // namespace ttimer
