#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "base_layout.h"
#include "batch_coordinator.h"
#include "doe_config.h"
#include "file_locator.h"
#include "geometry_params.h"
#include "log_service.h"
#include "process_runner.h"
#include "rescale_runner.h"
#include "scale_table.h"
#include "string_utils.h"
#include "variant_deriver.h"
#include "variant_synth.h"

namespace {

constexpr const char* kScalerToolName = "z_mesh_scaler";
constexpr const char* kSummaryStem = "batch_summary";

enum class CliMode {
  None,
  Verify,
  Setup,
  Synthesize,
  Batch,
};

struct CliOptions {
  CliMode mode = CliMode::None;
  std::string base_folder;
  std::string config_path;
  std::string export_config_path;
  std::string scales_path;
  bool force = false;
  bool copy_only = false;
  bool scale_only = false;
  bool summary = false;
  std::string execution_mode;
  std::string scaler;
  int workers = -1;
  double timeout = -1.0;
};

void PrintUsage() {
  std::cout
      << "Usage: piston_doe <mode> [options]\n"
      << "Modes:\n"
      << "  --verify <base>                  check the base folder layout\n"
      << "  --setup <base> [--force]         stage piston_pr.inp into Zscalar/ and print "
         "geometry values\n"
      << "  --synthesize <base> --scales <table>\n"
      << "                                   create one variant per scale factor\n"
      << "  --batch <base>                   copy piston_pr.inp and rescale every variant\n"
      << "Optional: --copy-only | --scale-only (run one batch phase)\n"
      << "Optional: --mode inprocess|subprocess (rescale execution, default inprocess)\n"
      << "Optional: --workers N (0 = hardware concurrency)\n"
      << "Optional: --timeout S (subprocess time budget per variant, default 300)\n"
      << "Optional: --scaler <path> (z_mesh_scaler executable for subprocess mode)\n"
      << "Optional: --summary (write batch_summary.json/.csv under simulation/)\n"
      << "Optional: --config <file> (load JSON sweep configuration)\n"
      << "Optional: --export-config <file> (write JSON sweep configuration)\n";
}

void InstallConsoleListener(LogService* log) {
  log->SetListener([](const LogEvent& event) {
    if (event.level == LogLevel::Info) {
      std::cout << "[" << event.category << "] " << event.message << "\n";
    } else {
      const char* tag = event.level == LogLevel::Error ? "error" : "warning";
      std::cerr << "[" << event.category << "] " << tag << ": " << event.message << "\n";
    }
  });
}

// Accepts "--name value" and "--name=value".
bool ReadOptionValue(int argc, char** argv, int* i, const std::string& name,
                     std::string* out, bool* matched, std::string* error) {
  const std::string arg = argv[*i];
  *matched = false;
  if (arg == name) {
    *matched = true;
    if (*i + 1 >= argc) {
      *error = name + " requires a value";
      return false;
    }
    *out = argv[++(*i)];
    return true;
  }
  const std::string prefix = name + "=";
  if (doe::StartsWith(arg, prefix)) {
    *matched = true;
    *out = arg.substr(prefix.size());
    return true;
  }
  return true;
}

bool SetMode(CliOptions* options, CliMode mode, int argc, char** argv, int* i,
             std::string* error) {
  if (options->mode != CliMode::None) {
    *error = "only one of --verify, --setup, --synthesize, --batch may be given";
    return false;
  }
  options->mode = mode;
  if (*i + 1 < argc && !doe::StartsWith(argv[*i + 1], "--")) {
    options->base_folder = argv[++(*i)];
  }
  return true;
}

bool ParseArgs(int argc, char** argv, CliOptions* options, std::string* error) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--verify") {
      if (!SetMode(options, CliMode::Verify, argc, argv, &i, error)) {
        return false;
      }
      continue;
    }
    if (arg == "--setup") {
      if (!SetMode(options, CliMode::Setup, argc, argv, &i, error)) {
        return false;
      }
      continue;
    }
    if (arg == "--synthesize") {
      if (!SetMode(options, CliMode::Synthesize, argc, argv, &i, error)) {
        return false;
      }
      continue;
    }
    if (arg == "--batch") {
      if (!SetMode(options, CliMode::Batch, argc, argv, &i, error)) {
        return false;
      }
      continue;
    }
    if (arg == "--force") {
      options->force = true;
      continue;
    }
    if (arg == "--copy-only") {
      options->copy_only = true;
      continue;
    }
    if (arg == "--scale-only") {
      options->scale_only = true;
      continue;
    }
    if (arg == "--summary") {
      options->summary = true;
      continue;
    }

    bool matched = false;
    std::string value;
    if (!ReadOptionValue(argc, argv, &i, "--config", &options->config_path, &matched, error)) {
      return false;
    }
    if (matched) {
      continue;
    }
    if (!ReadOptionValue(argc, argv, &i, "--export-config", &options->export_config_path,
                         &matched, error)) {
      return false;
    }
    if (matched) {
      continue;
    }
    if (!ReadOptionValue(argc, argv, &i, "--scales", &options->scales_path, &matched, error)) {
      return false;
    }
    if (matched) {
      continue;
    }
    if (!ReadOptionValue(argc, argv, &i, "--mode", &options->execution_mode, &matched,
                         error)) {
      return false;
    }
    if (matched) {
      continue;
    }
    if (!ReadOptionValue(argc, argv, &i, "--scaler", &options->scaler, &matched, error)) {
      return false;
    }
    if (matched) {
      continue;
    }
    if (!ReadOptionValue(argc, argv, &i, "--workers", &value, &matched, error)) {
      return false;
    }
    if (matched) {
      if (!doe::ParseNonNegativeInt(value, &options->workers)) {
        *error = "--workers expects a non-negative integer: " + value;
        return false;
      }
      continue;
    }
    if (!ReadOptionValue(argc, argv, &i, "--timeout", &value, &matched, error)) {
      return false;
    }
    if (matched) {
      if (!doe::ParseDouble(value, &options->timeout) || options->timeout <= 0.0) {
        *error = "--timeout expects a positive number of seconds: " + value;
        return false;
      }
      continue;
    }

    if (doe::StartsWith(arg, "--")) {
      *error = "unsupported option: " + arg;
      return false;
    }
    *error = "unexpected argument: " + arg;
    return false;
  }
  if (options->copy_only && options->scale_only) {
    *error = "--copy-only and --scale-only are mutually exclusive";
    return false;
  }
  return true;
}

bool ApplyOverrides(const CliOptions& options, DoeConfig* config, std::string* error) {
  if (!options.base_folder.empty()) {
    config->base_folder = options.base_folder;
  }
  if (!options.execution_mode.empty()) {
    config->execution_mode = options.execution_mode;
  }
  if (!options.scaler.empty()) {
    config->scaler_executable = options.scaler;
  }
  if (options.workers >= 0) {
    config->max_workers = options.workers;
  }
  if (options.timeout > 0.0) {
    config->timeout_seconds = options.timeout;
  }
  if (options.summary) {
    config->write_summary = true;
  }
  return ValidateDoeConfig(*config, error);
}

int RunVerify(const DoeConfig& config, LogService* log) {
  const BaseLayout layout = ResolveBaseLayout(config);
  const BaseLayoutStatus status = VerifyBaseLayout(layout, log);
  return status.critical_ok() ? 0 : 1;
}

int RunSetup(const DoeConfig& config, bool force, LogService* log) {
  const BaseLayout layout = ResolveBaseLayout(config);
  const BaseLayoutStatus status = VerifyBaseLayout(layout, log);
  if (!status.critical_ok()) {
    log->Error("setup", "base folder is incomplete: " + layout.base_folder.string());
    return 1;
  }
  std::string error;
  if (StagePistonPrTemplate(layout, force, &error, log) == StageOutcome::Failed) {
    log->Error("setup", error);
    return 1;
  }
  GeometryParameterSet params;
  if (!LoadGeometryParameters(layout.geometry_file, DefaultGeometryParameterNames(), &params,
                              &error, log)) {
    log->Error("setup", error);
    return 1;
  }
  return MissingParameters(params).empty() ? 0 : 1;
}

int RunSynthesize(const DoeConfig& config, const std::string& scales_path, LogService* log) {
  if (scales_path.empty()) {
    log->Error("synthesis", "--synthesize requires --scales <table>");
    return 1;
  }
  const BaseLayout layout = ResolveBaseLayout(config);
  const BaseLayoutStatus status = VerifyBaseLayout(layout, log);
  if (!status.critical_ok() || !status.simulation_dir || !status.scalar_template) {
    log->Error("synthesis", "base folder is incomplete: " + layout.base_folder.string());
    return 1;
  }

  Lz0Sign sign = Lz0Sign::Plus;
  if (!ParseLz0Sign(config.lz0_sign, &sign)) {
    log->Error("synthesis", "invalid lz0_sign: " + config.lz0_sign);
    return 1;
  }
  const std::vector<DerivationRule> rules = DefaultDerivationRules(sign);
  std::vector<std::string> names;
  for (const auto& rule : rules) {
    names.push_back(rule.name);
  }

  std::string error;
  GeometryParameterSet params;
  if (!LoadGeometryParameters(layout.geometry_file, names, &params, &error, log)) {
    log->Error("synthesis", error);
    return 1;
  }
  SynthesisRequest request;
  if (!ResolveBaseParameters(params, rules, &request.base, &error)) {
    log->Error("synthesis", error);
    return 1;
  }
  ScaleTableResult table;
  if (!LoadScaleFactorTable(scales_path, &table, &error, log)) {
    log->Error("synthesis", error);
    return 1;
  }
  if (table.scales.empty()) {
    log->Error("synthesis", "no usable scale factors in " + scales_path);
    return 1;
  }

  request.template_simulation_dir = layout.simulation_dir;
  request.scalar_template = layout.scalar_template;
  request.geometry_file = layout.geometry_file;
  request.scales = table.scales;
  request.rules = rules;
  request.options = MakeSynthesisOptions(config);

  const SynthesisReport report = SynthesizeVariants(request, log);
  return report.failed == 0 ? 0 : 1;
}

bool WriteSummaryFor(const BatchOptions& options, const std::string& phase,
                     const BatchResult& result, LogService* log) {
  const std::filesystem::path stem =
      options.simulation_root / (std::string(kSummaryStem) + "_" + phase);
  std::string error;
  if (!WriteBatchSummary(stem.string() + ".json", stem.string() + ".csv", phase, result,
                         &error)) {
    log->Error("batch", "failed to write batch summary: " + error);
    return false;
  }
  log->Info("batch", "wrote batch summary: " + stem.string() + ".json");
  return true;
}

std::unique_ptr<MeshRescaleRunner> MakeRunner(const DoeConfig& config, const char* argv0,
                                              LogService* log) {
  if (doe::ToLower(config.execution_mode) != "subprocess") {
    return std::make_unique<InProcessRescaleRunner>(log);
  }
  const LocateResult located = LocateTool(kScalerToolName, config.scaler_executable,
                                          CurrentExecutableDir(argv0), config.base_folder);
  if (!located.ok) {
    log->Error("batch", located.error);
    return nullptr;
  }
  log->Info("batch", "using scaler: " + located.path.string());
  return std::make_unique<SubprocessRescaleRunner>(located.path, config.timeout_seconds);
}

int RunBatchMode(const DoeConfig& config, const CliOptions& cli, const char* argv0,
                 LogService* log) {
  const BaseLayout layout = ResolveBaseLayout(config);
  const BatchOptions options = MakeBatchOptions(config);
  bool all_ok = true;

  if (!cli.scale_only) {
    std::error_code ec;
    std::filesystem::path source = layout.staged_mesh;
    if (!std::filesystem::is_regular_file(source, ec)) {
      log->Warning("batch", "staged mesh not found, copying " + layout.mesh_source.string());
      source = layout.mesh_source;
    }
    const BatchResult copied = CopyPistonPrFiles(options, source, log);
    if (!copied.ok) {
      return 1;
    }
    if (config.write_summary && !WriteSummaryFor(options, "copy", copied, log)) {
      all_ok = false;
    }
    all_ok = all_ok && copied.AllSucceeded();
  }

  if (!cli.copy_only) {
    std::unique_ptr<MeshRescaleRunner> runner = MakeRunner(config, argv0, log);
    if (!runner) {
      return 1;
    }
    const BatchResult rescaled = RunBatch(options, *runner, log);
    if (!rescaled.ok) {
      return 1;
    }
    if (config.write_summary && !WriteSummaryFor(options, "rescale", rescaled, log)) {
      all_ok = false;
    }
    all_ok = all_ok && rescaled.AllSucceeded();
  }
  return all_ok ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage();
    return 1;
  }
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage();
      return 0;
    }
  }

  CliOptions cli;
  std::string error;
  if (!ParseArgs(argc, argv, &cli, &error)) {
    std::cerr << error << "\n";
    PrintUsage();
    return 1;
  }

  DoeConfig config;
  if (!cli.config_path.empty()) {
    if (!LoadDoeConfigFromFile(cli.config_path, &config, &error)) {
      std::cerr << "config load error: " << error << "\n";
      return 1;
    }
  }
  if (!ApplyOverrides(cli, &config, &error)) {
    std::cerr << "invalid configuration: " << error << "\n";
    return 1;
  }
  if (!cli.export_config_path.empty()) {
    if (!SaveDoeConfigToFile(cli.export_config_path, config, &error)) {
      std::cerr << "config export error: " << error << "\n";
      return 1;
    }
    std::cout << "wrote config: " << cli.export_config_path << "\n";
    if (cli.mode == CliMode::None) {
      return 0;
    }
  }
  if (cli.mode == CliMode::None) {
    std::cerr << "no mode given\n";
    PrintUsage();
    return 1;
  }
  if (config.base_folder.empty()) {
    std::cerr << "base folder is required (pass it after the mode or set base_folder)\n";
    return 1;
  }

  LogService log;
  InstallConsoleListener(&log);
  switch (cli.mode) {
    case CliMode::Verify:
      return RunVerify(config, &log);
    case CliMode::Setup:
      return RunSetup(config, cli.force, &log);
    case CliMode::Synthesize:
      return RunSynthesize(config, cli.scales_path, &log);
    case CliMode::Batch:
      return RunBatchMode(config, cli, argv[0], &log);
    case CliMode::None:
      break;
  }
  return 1;
}
