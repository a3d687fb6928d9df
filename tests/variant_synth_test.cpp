#include "variant_synth.h"
#include "log_service.h"
#include "string_utils.h"

#include <limits>
#include <map>
#include <string>

#include "test_support.h"

namespace {

const char kGeometry[] =
    "// piston geometry\n"
    "lK 100\n"
    "lZ0 50\n"
    "lKG 30\n"
    "lSK 20\n"
    "lF 7\n";

struct Fixture {
  explicit Fixture(const test::ScratchDir& scratch) : base(scratch.path() / "base") {
    test::WriteText(base / "geometry.txt", kGeometry);
    test::WriteText(base / "Zscalar" / "scalar.txt",
                    "IM_piston/piston_pr.inp\nIM_piston/piston.inp\n0 0\n100 100\n");
    test::WriteText(base / "simulation" / "T1" / "input" / "options_piston.txt",
                    "IM_piston_path ./old\nfoo 1\n");
    test::WriteText(base / "simulation" / "T1" / "input" / "geometry.txt", "lK 1\n");
    test::WriteText(base / "simulation" / "T1" / "run.dat", "payload");
    test::WriteText(base / "simulation" / "T2" / "options_piston.txt",
                    "IM_piston_path\t./old\r\n");
    test::WriteText(base / "simulation" / "notes" / "readme.txt", "not a sub-case");
  }

  SynthesisRequest MakeRequest(const std::vector<double>& scales) const {
    SynthesisRequest request;
    request.template_simulation_dir = base / "simulation";
    request.scalar_template = base / "Zscalar" / "scalar.txt";
    request.geometry_file = base / "geometry.txt";
    request.scales = scales;
    request.rules = DefaultDerivationRules(Lz0Sign::Plus);
    request.base = {{"lK", 100.0}, {"lZ0", 50.0}, {"lKG", 30.0}, {"lSK", 20.0}};
    return request;
  }

  std::filesystem::path base;
};

std::map<std::string, std::string> SnapshotTree(const std::filesystem::path& root) {
  std::map<std::string, std::string> files;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
    if (entry.is_regular_file()) {
      files[std::filesystem::relative(entry.path(), root).generic_string()] =
          test::ReadText(entry.path());
    }
  }
  return files;
}

void TestVariantDirectoryName() {
  test::ExpectEq(VariantDirectoryName("IM_scaled_piston_", 5.7), "IM_scaled_piston_5",
                 "fraction truncated");
  test::ExpectEq(VariantDirectoryName("IM_scaled_piston_", -2.5), "IM_scaled_piston_-2",
                 "negative truncated toward zero");
  test::ExpectEq(VariantDirectoryName("V", 0.0), "V0", "zero");
  test::ExpectEq(VariantDirectoryName("V", -0.5), "V0", "small negative gives no minus zero");
  test::ExpectEq(VariantDirectoryName("V", 1e20), "V100000000000000000000",
                 "huge scale formatted without an integer cast");
}

void TestRewriteScalarTemplate() {
  test::ExpectEq(RewriteScalarTemplate("a\r\nb\r\nc\r\nd\r\ne\r\n", 100.0, 105.0),
                 "a\r\nb\r\nc\r\n100 105\r\ne\r\n", "line 4 replaced, CRLF kept");
  test::ExpectEq(RewriteScalarTemplate("a\nb", 1.5, 2.25), "a\nb\n\n1.5 2.25\n",
                 "short template padded");
  test::ExpectEq(RewriteScalarTemplate("", 1.0, 2.0), "\n\n\n1 2\n", "empty template");
}

void TestSynthesizeVariants() {
  test::ScratchDir scratch("doe_synth");
  const Fixture fixture(scratch);
  LogService log;
  const SynthesisReport report = SynthesizeVariants(fixture.MakeRequest({5.0, -2.5}), &log);
  test::Expect(report.succeeded == 2 && report.failed == 0, "both variants succeed");
  if (report.variants.size() != 2) {
    test::Expect(false, "two variant records");
    return;
  }

  const VariantSynthesis& v5 = report.variants[0];
  const std::filesystem::path dir = fixture.base / "simulation" / "IM_scaled_piston_5";
  test::Expect(v5.dir == dir, "variant placed beside the sub-case templates");
  test::Expect(v5.working_dir.is_absolute(), "working dir is absolute");
  test::Expect(std::filesystem::is_directory(dir / "IM_piston"), "working folder created");
  test::Expect(v5.subcases == std::vector<std::string>({"T1", "T2"}),
               "only T* folders replicated, in name order");
  test::Expect(!std::filesystem::exists(dir / "notes"), "non sub-case folder not copied");

  test::ExpectEq(test::ReadText(dir / "scalar.txt"),
                 "IM_piston/piston_pr.inp\nIM_piston/piston.inp\n0 0\n100 105\n",
                 "scalar config tracks lK");

  const std::string expected_geometry = std::string("// piston geometry\n") +
                                        "lK 105\n" + "lZ0 55\n" + "lKG " +
                                        doe::FormatRoundTrip(30.0 + 0.86 * 5.0) + "\n" +
                                        "lSK 22.25\n" + "lF 7\n";
  test::ExpectEq(test::ReadText(dir / "T1" / "input" / "geometry.txt"), expected_geometry,
                 "T1 geometry rewritten from the base geometry");
  test::ExpectEq(test::ReadText(dir / "T2" / "input" / "geometry.txt"), expected_geometry,
                 "T2 geometry created under input/");
  test::ExpectEq(test::ReadText(dir / "T1" / "run.dat"), "payload", "other files copied");

  const std::string working = v5.working_dir.string();
  test::ExpectEq(test::ReadText(dir / "T1" / "input" / "options_piston.txt"),
                 "IM_piston_path " + working + "\nfoo 1\n", "options in input/ rewritten");
  test::ExpectEq(test::ReadText(dir / "T2" / "options_piston.txt"),
                 "IM_piston_path\t" + working + "\r\n", "options in the replica root rewritten");

  test::Expect(std::filesystem::is_directory(fixture.base / "simulation" /
                                             "IM_scaled_piston_-2"),
               "negative scale variant created");
  test::ExpectEq(test::ReadText(fixture.base / "simulation" / "T1" / "input" /
                                "options_piston.txt"),
                 "IM_piston_path ./old\nfoo 1\n", "templates left untouched");
}

void TestSynthesisIsIdempotent() {
  test::ScratchDir scratch("doe_synth_idem");
  const Fixture fixture(scratch);
  const SynthesisRequest request = fixture.MakeRequest({5.0, 10.0});
  SynthesizeVariants(request, nullptr);
  const auto first = SnapshotTree(fixture.base);
  SynthesizeVariants(request, nullptr);
  const auto second = SnapshotTree(fixture.base);
  test::Expect(first == second, "second synthesis leaves a byte-identical tree");
}

void TestCollidingNamesWarn() {
  test::ScratchDir scratch("doe_synth_collide");
  const Fixture fixture(scratch);
  LogService log;
  const SynthesisReport report = SynthesizeVariants(fixture.MakeRequest({5.0, 5.7}), &log);
  test::Expect(report.succeeded == 2, "both scales synthesized");
  test::Expect(log.CountLevel(LogLevel::Warning) >= 1, "collision warned");
  test::ExpectEq(test::ReadText(fixture.base / "simulation" / "IM_scaled_piston_5" /
                                "scalar.txt"),
                 "IM_piston/piston_pr.inp\nIM_piston/piston.inp\n0 0\n100 105.7\n",
                 "later scale wins");
}

void TestFailuresAreIsolated() {
  test::ScratchDir scratch("doe_synth_fail");
  const Fixture fixture(scratch);
  SynthesisRequest request = fixture.MakeRequest({1.0});
  request.template_simulation_dir = fixture.base / "empty";
  std::filesystem::create_directories(request.template_simulation_dir);
  SynthesisReport report = SynthesizeVariants(request, nullptr);
  test::Expect(report.failed == 1 && !report.variants[0].ok, "no sub-cases is a failure");
  test::Expect(report.variants[0].error.find("sub-case") != std::string::npos,
               "error mentions sub-cases");

  request = fixture.MakeRequest({1.0, 2.0});
  request.base.erase("lK");
  report = SynthesizeVariants(request, nullptr);
  test::Expect(report.failed == 2, "missing tracked parameter fails every variant");
  test::Expect(report.variants[1].error.find("lK") != std::string::npos,
               "error names the tracked parameter");
}

void TestUnusableScalesRejected() {
  test::ScratchDir scratch("doe_synth_range");
  const Fixture fixture(scratch);
  LogService log;
  const SynthesisReport report = SynthesizeVariants(
      fixture.MakeRequest({std::numeric_limits<double>::quiet_NaN(),
                           std::numeric_limits<double>::infinity(), 1e20, 2.0}),
      &log);
  test::Expect(report.failed == 3 && report.succeeded == 1,
               "non-finite and oversized scales fail, the rest proceed");
  if (report.variants.size() == 4) {
    test::Expect(report.variants[0].error.find("out of range") != std::string::npos,
                 "error says out of range");
    test::Expect(report.variants[3].ok, "ordinary scale still synthesized");
  }
  test::Expect(!std::filesystem::exists(fixture.base / "simulation" /
                                        "IM_scaled_piston_100000000000000000000"),
               "no folder created for a rejected scale");
}

}  // namespace

int main() {
  TestVariantDirectoryName();
  TestRewriteScalarTemplate();
  TestSynthesizeVariants();
  TestSynthesisIsIdempotent();
  TestCollidingNamesWarn();
  TestFailuresAreIsolated();
  TestUnusableScalesRejected();
  return test::Finish("variant_synth_test");
}
