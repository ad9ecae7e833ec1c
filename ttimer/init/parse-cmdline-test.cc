#include <cstdio>
#include <cstring>

#include "absl/strings/str_format.h"
#include "ttimer/init/config.h"
#include "ttimer/init/init.h"

int main() {
  const char* test_args[] = {"parse_cmdline_test", "--interactive=false", "1:30"};
  int test_argc = 3;

  char** got_argv = const_cast<char**>(test_args);

  ttimer::MainInit(&test_argc, &got_argv);

  if (test_argc != 2) {
    absl::FPrintF(stderr, "want 2 args, got %d\n", test_argc);
    for (int i = 0; i < test_argc; ++i) {
      absl::FPrintF(stderr, "argv[%d] = %s\n", i, got_argv[i]);
    }
    return 2;
  }
  bool all_good = true;
  if (strcmp(got_argv[0], "parse_cmdline_test") != 0) {
    absl::FPrintF(stderr, "argv[0]: want parse_cmdline_test, got %s\n", got_argv[0]);
    all_good = false;
  }
  if (strcmp(got_argv[1], "1:30") != 0) {
    absl::FPrintF(stderr, "argv[1]: want 1:30, got %s\n", got_argv[1]);
    all_good = false;
  }
  if (ttimer::ConfigFromFlags().interactive) {
    absl::FPrintF(stderr, "interactive: want false, got true\n");
    all_good = false;
  }
  if (!all_good) {
    return 3;
  }
  return 0;
}
