#include "scale_table.h"
#include "log_service.h"

#include <limits>
#include <string>

#include "test_support.h"

namespace {

void TestHeaderAndBlankRowsSkipped() {
  const std::string content = "scale\n\n1\n2.5\n\n-3\n";
  const ScaleTableResult result = ParseScaleFactorTable(content, nullptr);
  test::Expect(result.scales.size() == 3, "three scales");
  test::Expect(result.scales.size() == 3 && result.scales[0] == 1.0 &&
                   result.scales[1] == 2.5 && result.scales[2] == -3.0,
               "scales kept in file order");
  test::Expect(result.rows_read == 3 && result.rows_skipped == 0, "row counters");
}

void TestNonNumericRowsSkippedWithWarning() {
  LogService log;
  const std::string content = "scale,comment\nabc,x\n4,first\n\"5.5\",second\n1e1;semicolon\n";
  const ScaleTableResult result = ParseScaleFactorTable(content, &log);
  test::Expect(result.scales.size() == 3, "three usable rows");
  test::Expect(result.scales.size() == 3 && result.scales[0] == 4.0 &&
                   result.scales[1] == 5.5 && result.scales[2] == 10.0,
               "first column only, quotes stripped");
  test::Expect(result.rows_skipped == 1, "one skipped row");
  test::Expect(log.CountLevel(LogLevel::Warning) == 1, "one warning for the bad row");
  bool mentions_row = false;
  for (const std::string& line : log.GetLogs()) {
    if (line.find("row 2") != std::string::npos && line.find("abc") != std::string::npos) {
      mentions_row = true;
    }
  }
  test::Expect(mentions_row, "warning names the row and its value");
}

void TestBomAndCrLf() {
  const std::string content = "\xEF\xBB\xBFscale\r\n7\r\n8\r\n";
  const ScaleTableResult result = ParseScaleFactorTable(content, nullptr);
  test::Expect(result.scales.size() == 2 && result.scales[0] == 7.0 && result.scales[1] == 8.0,
               "BOM header dropped and CR stripped");
}

void TestOutOfRangeRowsSkipped() {
  LogService log;
  const std::string content = "scale\n1e20\n-1e16\n1e15\n2\n";
  const ScaleTableResult result = ParseScaleFactorTable(content, &log);
  test::Expect(result.scales.size() == 2 && result.scales[0] == 1e15 && result.scales[1] == 2.0,
               "scales beyond the accepted magnitude dropped");
  test::Expect(result.rows_skipped == 2, "two rows skipped");
  test::Expect(log.CountLevel(LogLevel::Warning) == 2, "one warning per dropped row");
  test::Expect(!IsUsableScaleFactor(std::numeric_limits<double>::quiet_NaN()), "NaN rejected");
  test::Expect(!IsUsableScaleFactor(std::numeric_limits<double>::infinity()),
               "infinity rejected");
  test::Expect(IsUsableScaleFactor(-3.5), "ordinary negative scale accepted");
}

void TestHeaderOnly() {
  const ScaleTableResult result = ParseScaleFactorTable("scale\n", nullptr);
  test::Expect(result.scales.empty() && result.rows_read == 0, "header-only table is empty");
}

void TestLoadFromFile() {
  test::ScratchDir scratch("doe_scales");
  const std::filesystem::path path = scratch.path() / "scales.csv";
  test::WriteText(path, "scale\n5\n10\n");
  ScaleTableResult result;
  std::string error;
  test::Expect(LoadScaleFactorTable(path, &result, &error, nullptr), "load succeeds");
  test::Expect(result.scales.size() == 2, "two scales loaded");
  test::Expect(!LoadScaleFactorTable(scratch.path() / "missing.csv", &result, &error, nullptr),
               "missing table fails");
  test::Expect(error.find("missing.csv") != std::string::npos, "error names the path");
}

}  // namespace

int main() {
  TestHeaderAndBlankRowsSkipped();
  TestNonNumericRowsSkippedWithWarning();
  TestBomAndCrLf();
  TestOutOfRangeRowsSkipped();
  TestHeaderOnly();
  TestLoadFromFile();
  return test::Finish("scale_table_test");
}
