#ifndef TTIMER_POSIX_STRERROR_H_
#define TTIMER_POSIX_STRERROR_H_

#include <string>

namespace ttimer {

// StrError is a thread-safe, C++ friendly variant of strerror.
std::string StrError(int error_number);

}  // namespace ttimer

#endif  // TTIMER_POSIX_STRERROR_H_
