/// @file
/// This is the default main() function for the gtest-based unit tests.

#include <iostream>

#include <gmock/gmock.h>

int main(int argc, char** argv) {
  std::cout << "Using combinadic_googletest_main.cc\n";
  testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
