#include "gtest/gtest.h"
#include "ttimer/init/init.h"

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  ttimer::MainInit(&argc, &argv);
  return RUN_ALL_TESTS();
}
