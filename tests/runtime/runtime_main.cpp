#include "runtime_support.h"

namespace {

void verify_all() {
  runtime_test::run_decimal_text_tests();
  runtime_test::run_decimal_arithmetic_tests();
}

}  // namespace

int main() {
  verify_all();
  return 0;
}
