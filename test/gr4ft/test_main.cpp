#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <redlog.hpp>

int main(int argc, char** argv) {
  // keep test output readable; failures still surface through doctest
  redlog::set_level(redlog::level::error);

  doctest::Context context(argc, argv);
  return context.run();
}
