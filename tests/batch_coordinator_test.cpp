#include "batch_coordinator.h"
#include "log_service.h"
#include "rescale_runner.h"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "test_support.h"

namespace {

const char kMesh[] = "*NODE\n1, 0.0, 0.0, 5.0\n2, 0.0, 0.0, 15.0\n*ELEMENT\n1, 1, 2, 2\n";
const char kScalar[] = "IM_piston/piston_pr.inp\nIM_piston/piston.inp\n0 0\n10 20\n";

// IM_scaled_piston_1 and _3 are complete; _2 has no scalar.txt.
std::filesystem::path BuildSimulationRoot(const test::ScratchDir& scratch) {
  const std::filesystem::path root = scratch.path() / "simulation";
  for (const char* name : {"IM_scaled_piston_1", "IM_scaled_piston_3"}) {
    test::WriteText(root / name / "scalar.txt", kScalar);
    test::WriteText(root / name / "IM_piston" / "piston_pr.inp", kMesh);
  }
  std::filesystem::create_directories(root / "IM_scaled_piston_2");
  std::filesystem::create_directories(root / "T1");
  return root;
}

BatchOptions MakeOptions(const std::filesystem::path& root, int workers) {
  BatchOptions options;
  options.simulation_root = root;
  options.max_workers = workers;
  return options;
}

class ScriptedRunner : public MeshRescaleRunner {
 public:
  RescaleRunResult Run(const std::filesystem::path& config_path,
                       const std::filesystem::path& working_dir) override {
    (void)config_path;
    const std::string name = working_dir.filename().string();
    if (name == "IM_scaled_piston_3") {
      throw std::runtime_error("scripted crash");
    }
    RescaleRunResult result;
    result.outcome = RescaleOutcome::Failed;
    result.detail = "scripted failure";
    result.exit_code = 1;
    return result;
  }
  std::string GetName() const override { return "scripted"; }
};

void ExpectRescaledPair(const BatchResult& result, const std::filesystem::path& root,
                        const std::string& label) {
  test::Expect(result.ok, label + ": batch ran: " + result.error);
  if (result.variants.size() != 3) {
    test::Expect(false, label + ": three variants discovered");
    return;
  }
  test::ExpectEq(result.variants[0].name, "IM_scaled_piston_1", label + ": sorted 1");
  test::ExpectEq(result.variants[1].name, "IM_scaled_piston_2", label + ": sorted 2");
  test::ExpectEq(result.variants[2].name, "IM_scaled_piston_3", label + ": sorted 3");
  test::Expect(result.variants[0].status == VariantStatus::Success, label + ": 1 succeeds");
  test::Expect(result.variants[1].status == VariantStatus::Skipped, label + ": 2 skipped");
  test::Expect(result.variants[2].status == VariantStatus::Success, label + ": 3 succeeds");
  test::Expect(result.Count(VariantStatus::Success) == 2, label + ": success count");
  test::Expect(!result.AllSucceeded(), label + ": skipped variant is not a success");
  for (const char* name : {"IM_scaled_piston_1", "IM_scaled_piston_3"}) {
    const std::string mesh = test::ReadText(root / name / "IM_piston" / "piston.inp");
    test::Expect(mesh.find("2.5000000000000E+01") != std::string::npos,
                 label + ": " + name + " rescaled mesh written");
  }
}

void TestInProcessBatch() {
  test::ScratchDir scratch("doe_batch_inproc");
  const std::filesystem::path root = BuildSimulationRoot(scratch);
  LogService log;
  InProcessRescaleRunner runner(&log);

  std::mutex progress_mutex;
  std::vector<double> progress_values;
  const BatchResult result = RunBatch(MakeOptions(root, 3), runner, &log,
                                      [&](const std::string& phase, double value) {
                                        std::lock_guard<std::mutex> lock(progress_mutex);
                                        if (phase == "rescale") {
                                          progress_values.push_back(value);
                                        }
                                      });
  ExpectRescaledPair(result, root, "inprocess");
  test::Expect(progress_values.size() == 3, "progress reported per variant");
  bool reached_end = false;
  for (double value : progress_values) {
    reached_end = reached_end || value == 1.0;
  }
  test::Expect(reached_end, "progress reaches 1");
  test::Expect(log.CountLevel(LogLevel::Warning) >= 1, "skipped variant warned");
}

void TestSubprocessBatch() {
#ifdef DOE_Z_MESH_SCALER_PATH
  test::ScratchDir scratch("doe_batch_subproc");
  const std::filesystem::path root = BuildSimulationRoot(scratch);
  SubprocessRescaleRunner runner(DOE_Z_MESH_SCALER_PATH, 60.0);
  const BatchResult result = RunBatch(MakeOptions(root, 2), runner, nullptr);
  ExpectRescaledPair(result, root, "subprocess");
#endif
}

void TestSubprocessFailureAndTimeout() {
  test::ScratchDir scratch("doe_batch_timeout");
  const std::filesystem::path root = BuildSimulationRoot(scratch);

  SubprocessRescaleRunner failing("false", 10.0);
  BatchResult result = RunBatch(MakeOptions(root, 2), failing, nullptr);
  test::Expect(result.ok && result.Count(VariantStatus::Failed) == 2,
               "non-zero exit recorded as failed");
  test::Expect(result.variants.size() == 3 &&
                   result.variants[0].detail.find("return code 1") != std::string::npos,
               "failure detail carries the return code");

  const std::filesystem::path script = scratch.path() / "slow_scaler.sh";
  test::WriteText(script, "#!/bin/sh\nexec sleep 10\n");
  std::filesystem::permissions(script, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::add);
  SubprocessRescaleRunner slow(script, 0.5);
  result = RunBatch(MakeOptions(root, 2), slow, nullptr);
  test::Expect(result.ok && result.Count(VariantStatus::Timeout) == 2,
               "slow scaler recorded as timeout");
  test::Expect(result.Count(VariantStatus::Skipped) == 1, "skip unaffected by timeouts");
}

void TestFailuresAreIsolated() {
  test::ScratchDir scratch("doe_batch_isolated");
  const std::filesystem::path root = BuildSimulationRoot(scratch);
  ScriptedRunner runner;
  const BatchResult result = RunBatch(MakeOptions(root, 1), runner, nullptr);
  test::Expect(result.ok, "batch completes despite failing variants");
  test::Expect(result.variants.size() == 3, "every variant has a result");
  if (result.variants.size() == 3) {
    test::Expect(result.variants[0].status == VariantStatus::Failed, "failure recorded");
    test::Expect(result.variants[2].status == VariantStatus::Error, "exception recorded");
    test::ExpectEq(result.variants[2].detail, "scripted crash", "exception text kept");
  }
}

void TestThrowingLogListenerStaysInItsVariant() {
  test::ScratchDir scratch("doe_batch_listener");
  const std::filesystem::path root = BuildSimulationRoot(scratch);
  LogService log;
  log.SetListener([](const LogEvent& event) {
    if (event.message.rfind("processing ", 0) == 0) {
      throw std::runtime_error("console closed");
    }
  });
  InProcessRescaleRunner runner(&log);
  const BatchResult result = RunBatch(MakeOptions(root, 2), runner, &log);
  test::Expect(result.ok, "batch survives a throwing listener");
  if (result.variants.size() == 3) {
    test::Expect(result.variants[0].status == VariantStatus::Error, "variant 1 reports error");
    test::ExpectEq(result.variants[0].detail, "console closed", "listener text kept");
    test::Expect(result.variants[1].status == VariantStatus::Skipped, "variant 2 still skipped");
    test::Expect(result.variants[2].status == VariantStatus::Error, "variant 3 reports error");
  } else {
    test::Expect(false, "three variant results");
  }
}

void TestPreconditions() {
  test::ScratchDir scratch("doe_batch_pre");
  InProcessRescaleRunner runner;
  BatchResult result = RunBatch(MakeOptions(scratch.path() / "missing", 0), runner, nullptr);
  test::Expect(!result.ok && result.variants.empty(), "missing root aborts");
  test::Expect(result.error.find("not found") != std::string::npos, "missing root error");

  std::filesystem::create_directories(scratch.path() / "empty" / "T1");
  result = RunBatch(MakeOptions(scratch.path() / "empty", 0), runner, nullptr);
  test::Expect(!result.ok, "no variants aborts");
  test::Expect(result.error.find("IM_scaled_piston_") != std::string::npos,
               "no variants error names the prefix");
}

void TestCopyFanOut() {
  test::ScratchDir scratch("doe_batch_copy");
  const std::filesystem::path root = BuildSimulationRoot(scratch);
  const std::filesystem::path source = scratch.path() / "Zscalar" / "piston_pr.inp";
  test::WriteText(source, "*NODE\n9, 1, 2, 3\n");

  LogService log;
  const BatchResult result = CopyPistonPrFiles(MakeOptions(root, 0), source, &log);
  test::Expect(result.ok && result.AllSucceeded(), "copy reaches every variant");
  for (const char* name : {"IM_scaled_piston_1", "IM_scaled_piston_2", "IM_scaled_piston_3"}) {
    test::ExpectEq(test::ReadText(root / name / "IM_piston" / "piston_pr.inp"),
                   "*NODE\n9, 1, 2, 3\n", std::string(name) + " holds the staged mesh");
  }
  test::Expect(log.CountLevel(LogLevel::Warning) == 1, "missing working folder warned once");

  const BatchResult missing =
      CopyPistonPrFiles(MakeOptions(root, 0), scratch.path() / "nope.inp", nullptr);
  test::Expect(!missing.ok, "missing source aborts the copy");
}

void TestSummaryFiles() {
  test::ScratchDir scratch("doe_batch_summary");
  const std::filesystem::path root = BuildSimulationRoot(scratch);
  InProcessRescaleRunner runner;
  const BatchResult result = RunBatch(MakeOptions(root, 2), runner, nullptr);

  const std::filesystem::path json_path = scratch.path() / "out" / "batch_summary.json";
  const std::filesystem::path csv_path = scratch.path() / "out" / "batch_summary.csv";
  std::string error;
  test::Expect(WriteBatchSummary(json_path, csv_path, "rescale", result, &error),
               "summary written: " + error);

  const nlohmann::json root_json = nlohmann::json::parse(test::ReadText(json_path));
  test::Expect(root_json.at("phase").get<std::string>() == "rescale", "phase recorded");
  test::Expect(root_json.at("success_count").get<int>() == 2, "success_count");
  test::Expect(root_json.at("skipped_count").get<int>() == 1, "skipped_count");
  test::Expect(root_json.at("variants").size() == 3, "variant entries");
  test::Expect(root_json.at("variants")[1].at("status").get<std::string>() == "skipped",
               "status token");

  const std::string csv = test::ReadText(csv_path);
  test::Expect(csv.rfind("name,status,elapsed_seconds,detail\n", 0) == 0, "csv header");
  test::Expect(csv.find("IM_scaled_piston_2,skipped,") != std::string::npos, "csv row");
}

}  // namespace

int main() {
  TestInProcessBatch();
  TestSubprocessBatch();
  TestSubprocessFailureAndTimeout();
  TestFailuresAreIsolated();
  TestThrowingLogListenerStaysInItsVariant();
  TestPreconditions();
  TestCopyFanOut();
  TestSummaryFiles();
  return test::Finish("batch_coordinator_test");
}
