#include <cassert>
#include <string_view>

#include "runtime_support.h"

namespace runtime_test {
namespace {

using udec::Context;
using udec::Decimal;

void test_parse_keeps_trailing_zeros() {
  const auto value = dec("1.7775");
  assert(value.digits() == 5);
  assert(value.exponent() == -4);
  expect_text(value, "1.7775");

  assert(dec("2000").digits() == 4);
  assert(dec("2000.0").exponent() == -1);
  assert(dec("0.000").digits() == 1);
  assert(dec("0.000").exponent() == -3);
  assert(dec("0.000").is_zero());
  expect_text(dec("0.000"), "0.000");
}

void test_scientific_rendering() {
  expect_text(dec("2.0E+3"), "2.0E+3");
  expect_text(dec("1E+2"), "1E+2");
  expect_text(dec("123E+1"), "1.23E+3");
  expect_text(dec("0.00001"), "0.00001");
  expect_text(dec("0.0000001"), "1E-7");
  expect_text(dec("12.50e-1"), "1.250");
  expect_text(dec("-0.5"), "-0.5");
  expect_text(dec("-0"), "-0");
  expect_text(dec("0E+3"), "0E+3");
}

void test_malformed_and_special_text_is_rejected() {
  const char* rejected[] = {"", "abc", "1.2.3", "1e", "+-1", ".", "1 2", "Infinity", "-inf",
                            "NaN", "sNaN", "0x10", "1,5", "1E+6145"};
  const Context ctx;
  for (const char* text : rejected) {
    Decimal out;
    assert(!ctx.try_parse(text, out));
  }
  Decimal out;
  assert(!ctx.try_parse(std::string_view("1\0" "5", 3), out));
  assert(throws_decimal_error([&] { (void)ctx.parse("abc"); }));
}

void test_parse_rounds_half_up_to_precision() {
  expect_text(dec("0.670820393249936908922752100619382871"), "0.6708203932499369089227521006193829");
  expect_text(dec("12345678901234567890123456789012345"), "1.234567890123456789012345678901235E+34");
  expect_text(Context(3).parse("2.345"), "2.35");
  expect_text(Context(3).parse("-2.345"), "-2.35");
}

void test_constructors() {
  expect_text(Decimal(), "0");
  expect_text(Decimal::one(), "1");
  expect_text(Decimal::from_int(-42), "-42");
  expect_text(Decimal::unit(-3), "0.001");
  expect_text(Decimal::unit(2), "1E+2");
  expect_text(Decimal::unit(0), "1");
  assert(throws_decimal_error([] { Context bad(0); }));
}

void test_sign_and_identity() {
  expect_text(dec("1.50").negated(), "-1.50");
  expect_text(dec("-1.50").abs(), "1.50");
  expect_text(dec("0").negated(), "-0");
  assert(dec("-0").negative());
  assert(dec("-0").is_zero());
  assert(dec("2.0").identical(dec("2.0")));
  assert(!dec("2.0").identical(dec("2")));
  assert(!dec("-0").identical(dec("0")));
}

void test_copies_are_independent() {
  Decimal original = dec("1.25");
  Decimal copy = original;
  copy = copy.negated();
  expect_text(original, "1.25");
  expect_text(copy, "-1.25");
  original = copy;
  expect_text(original, "-1.25");
  original = original;
  expect_text(original, "-1.25");
}

}  // namespace

void run_decimal_text_tests() {
  test_parse_keeps_trailing_zeros();
  test_scientific_rendering();
  test_malformed_and_special_text_is_rejected();
  test_parse_rounds_half_up_to_precision();
  test_constructors();
  test_sign_and_identity();
  test_copies_are_independent();
}

}  // namespace runtime_test
