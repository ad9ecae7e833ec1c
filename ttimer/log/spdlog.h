#ifndef TTIMER_LOG_SPDLOG_H_
#define TTIMER_LOG_SPDLOG_H_

#include <iostream>
#include <string>
#include <vector>

#include "absl/base/optimization.h"
#include "spdlog/spdlog.h"

namespace ttimer {

// The timer draws on stderr, so logs go to --log_file or nowhere.
const std::vector<spdlog::sink_ptr>& LogSinks();

spdlog::logger MakeLogger(std::string name);

//// Checks (uses logger) ////

#define TT_SPDLOG_CHECK_MESG(logger, cond, mesg)                                    \
  do {                                                                              \
    if (ABSL_PREDICT_FALSE(!(cond))) {                                              \
      if (std::string(mesg) != "") {                                                \
        SPDLOG_LOGGER_CRITICAL(logger, "invariant violation: wanted {}: {}", #cond, \
                               mesg);                                               \
      } else {                                                                      \
        SPDLOG_LOGGER_CRITICAL(logger, "invariant violation: wanted {}", #cond);    \
      }                                                                             \
      ::ttimer::DumpStackTraceAndExit(5);                                           \
    }                                                                               \
  } while (0);

//// Assertions (uses stderr) ////

#define TT_ASSERT_MESG(cond, mesg)                                              \
  do {                                                                          \
    if (ABSL_PREDICT_FALSE(!(cond))) {                                          \
      if (std::string(mesg) != "") {                                            \
        std::cerr << "assert failed: wanted " << #cond << ": " << mesg << "\n"; \
      } else {                                                                  \
        std::cerr << "assert failed: wanted " << #cond << "\n";                 \
      }                                                                         \
      ::ttimer::DumpStackTraceAndExit(5);                                       \
    }                                                                           \
  } while (0);

void DumpStackTraceAndExit(int exit_status);

}  // namespace ttimer

#endif  // TTIMER_LOG_SPDLOG_H_
