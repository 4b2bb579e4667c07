#include "minitest.hpp"
#include "util/Log.hpp"

int main(int argc, char** argv) {
  // Keep test output readable; failures still surface through assertions
  netmount::util::log_configure(netmount::util::LogLevel::Error, "");
  return mini::run_all(argc > 1 ? argv[1] : "");
}
