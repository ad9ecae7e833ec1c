#ifndef TTIMER_INIT_INIT_H_
#define TTIMER_INIT_INIT_H_

namespace ttimer {

// MainInit parses flags (removing them from argv) and installs the absl
// symbolizer and failure signal handler. --help and --version are handled
// here and exit the process.
void MainInit(int* argc, char*** argv);

}  // namespace ttimer

#endif  // TTIMER_INIT_INIT_H_
