#include "string_utils.h"

#include <string>
#include <vector>

#include "test_support.h"

namespace {

void TestParseNonNegativeInt() {
  int value = -1;
  test::Expect(doe::ParseNonNegativeInt("4", &value) && value == 4, "plain integer");
  test::Expect(doe::ParseNonNegativeInt(" 0 ", &value) && value == 0, "zero with spaces");
  test::Expect(doe::ParseNonNegativeInt("8.0", &value) && value == 8, "integral decimal");
  test::Expect(doe::ParseNonNegativeInt("2147483647", &value) && value == 2147483647,
               "INT_MAX accepted");

  value = 7;
  test::Expect(!doe::ParseNonNegativeInt("1e10", &value), "above INT_MAX rejected");
  test::Expect(!doe::ParseNonNegativeInt("2147483648", &value), "INT_MAX + 1 rejected");
  test::Expect(!doe::ParseNonNegativeInt("-1", &value), "negative rejected");
  test::Expect(!doe::ParseNonNegativeInt("2.5", &value), "fraction rejected");
  test::Expect(!doe::ParseNonNegativeInt("four", &value), "text rejected");
  test::Expect(value == 7, "output untouched on failure");
}

void TestParseDouble() {
  double value = 0.0;
  test::Expect(doe::ParseDouble(" -1.5e2 ", &value) && value == -150.0, "exponent form");
  test::Expect(!doe::ParseDouble("1.5mm", &value), "trailing text rejected");
  test::Expect(!doe::ParseDouble("", &value), "empty rejected");
}

void TestFormatting() {
  test::ExpectEq(doe::FormatRoundTrip(105.0), "105", "integral value");
  test::ExpectEq(doe::FormatRoundTrip(0.1), "0.1", "shortest text");
  test::ExpectEq(doe::FormatFixed(100.0, 6), "100.000000", "six decimals");
  test::ExpectEq(doe::FormatFixed(-7.9, 0), "-8", "zero decimals rounds");
}

void TestSplitAndTrim() {
  const std::vector<std::string> parts = doe::Split("a,,b;c", ",;");
  test::Expect(parts == std::vector<std::string>({"a", "", "b", "c"}), "empty fields kept");
  test::ExpectEq(doe::Trim("\t x \r\n"), "x", "trim whitespace");
  test::Expect(doe::StartsWith("IM_scaled_piston_5", "IM_scaled_piston_"), "prefix");
}

}  // namespace

int main() {
  TestParseNonNegativeInt();
  TestParseDouble();
  TestFormatting();
  TestSplitAndTrim();
  return test::Finish("string_utils_test");
}
