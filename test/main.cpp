#include <gtest/gtest.h>

#include <cpptrace/cpptrace.hpp>
#include <string>
#include <vector>

int main(int argc, char **argv) {
  cpptrace::register_terminate_handler();

  // build new arg list
  std::vector<char*> args;
  for (int i=0; i<argc; i++)
      args.push_back(argv[i]);

  // add --gtest_catch_exceptions=0
  std::string no_catch{"--gtest_catch_exceptions=0"};
  args.push_back(no_catch.data());

  // InitGoogleTest reads argv[argc]
  args.push_back(nullptr);

  argc = args.size() - 1;
  argv = args.data();

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
