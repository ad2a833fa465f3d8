#include <cassert>
#include <vector>

#include "measure_support.h"

namespace measure_test {
namespace {

using udec::UncertainValue;

void test_sum() {
  expect_text(udec::sum({}), "0 ± 0");
  expect_text(udec::sum({uv("10.0", "0.3"), uv("20.0", "0.4")}), "30.0 ± 0.5");
  expect_text(udec::sum({uv("1.00", "0.02"), uv("2.00", "0.02"), uv("3.00", "0.01")}), "6.00 ± 0.03");
  // Unlike add, sum keeps every digit of the total.
  expect_text(udec::sum({uv("1.8", "0.6"), uv("2000.0", "0.3")}), "2001.8 ± 0.7");
  expect_text(udec::sum({uv("1.7775", "0.6")}), "1.8 ± 0.6");
}

void test_product() {
  expect_text(udec::product({}), "1 ± 0");
  expect_text(udec::product({uv("2.0", "0.1"), uv("3.0", "0.2")}), "6.0 ± 0.5");
  expect_text(udec::product({uv("2.0", "0")}), "2.0 ± 0.0");
  expect_text(udec::product({uv("2.0", "0.1"), uv("3.0", "0.2"), uv("0.50", "0.01")}), "3.0 ± 0.3");
  assert(throws<udec::DomainError>(
      [] { (void)udec::product({uv("2.0", "0.1"), uv("0.0", "0.1")}); }));
}

void test_reducers_agree_with_pairwise_ops() {
  const std::vector<UncertainValue> values = {uv("2.0", "0.1"), uv("3.0", "0.2")};
  assert(udec::product(values) == values[0] * values[1]);
  const std::vector<UncertainValue> terms = {uv("10.0", "0.3"), uv("20.0", "0.4")};
  assert(udec::sum(terms) == terms[0] + terms[1]);
}

}  // namespace

void run_reducer_tests() {
  test_sum();
  test_product();
  test_reducers_agree_with_pairwise_ops();
}

}  // namespace measure_test
