#include "variant_synth.h"

#include <cmath>
#include <exception>
#include <map>
#include <utility>

#include "file_utils.h"
#include "log_service.h"
#include "scale_table.h"
#include "string_utils.h"
#include "text_rewrite.h"

namespace {

constexpr const char* kLogCategory = "synth";

struct LineSpan {
  std::string text;
  std::string ending;
};

std::vector<LineSpan> SplitKeepingEndings(const std::string& content) {
  std::vector<LineSpan> lines;
  size_t start = 0;
  while (start < content.size()) {
    const size_t newline = content.find('\n', start);
    LineSpan span;
    if (newline == std::string::npos) {
      span.text = content.substr(start);
      start = content.size();
    } else {
      span.text = content.substr(start, newline - start);
      span.ending = "\n";
      start = newline + 1;
    }
    if (!span.text.empty() && span.text.back() == '\r') {
      span.text.pop_back();
      span.ending = "\r" + span.ending;
    }
    lines.push_back(span);
  }
  return lines;
}

bool WriteScalarConfig(const SynthesisRequest& request, VariantSynthesis* variant,
                       std::string* error) {
  const std::string& tracked = request.options.tracked_param;
  auto base_it = variant->params.base.find(tracked);
  auto scaled_it = variant->params.scaled.find(tracked);
  if (base_it == variant->params.base.end() || scaled_it == variant->params.scaled.end()) {
    *error = "tracked parameter '" + tracked + "' has no derived value";
    return false;
  }
  std::string content;
  if (!ReadFileBytes(request.scalar_template, &content, error)) {
    *error = "scalar template not found: " + request.scalar_template.string();
    return false;
  }
  const std::string rewritten =
      RewriteScalarTemplate(content, base_it->second, scaled_it->second);
  return WriteFileBytes(variant->dir / request.options.scalar_file, rewritten, error);
}

bool RewriteGeometry(const SynthesisRequest& request, const VariantSynthesis& variant,
                     const std::filesystem::path& replica, const std::string& base_geometry,
                     LogService* log, std::string* error) {
  const std::filesystem::path input_dir = replica / request.options.subcase_input_folder;
  if (!EnsureDirectory(input_dir, error)) {
    return false;
  }
  std::string content = base_geometry;
  for (const auto& entry : variant.params.scaled) {
    int count = 0;
    content = SubstituteParameterValue(content, entry.first, doe::FormatRoundTrip(entry.second),
                                       &count);
    if (count == 0) {
      LogWarning(log, kLogCategory,
                 variant.name + "/" + replica.filename().string() + ": '" + entry.first +
                     "' not present in geometry, left unchanged");
    }
  }
  return WriteFileBytes(input_dir / request.options.geometry_file, content, error);
}

bool RewriteOptionsFiles(const SynthesisRequest& request, const VariantSynthesis& variant,
                         const std::filesystem::path& replica, LogService* log,
                         std::string* error) {
  const std::vector<std::filesystem::path> candidates = {
      replica / request.options.subcase_input_folder / request.options.options_file,
      replica / request.options.options_file,
  };
  const std::string working_path = variant.working_dir.string();
  bool found = false;
  for (const auto& candidate : candidates) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(candidate, ec)) {
      continue;
    }
    found = true;
    std::string bytes;
    if (!ReadFileBytes(candidate, &bytes, error)) {
      return false;
    }
    int count = 0;
    const std::string rewritten =
        SubstitutePathField(bytes, request.options.path_field, working_path, &count);
    if (count == 0) {
      LogWarning(log, kLogCategory,
                 candidate.string() + ": field '" + request.options.path_field + "' not found");
      continue;
    }
    if (!WriteFileBytes(candidate, rewritten, error)) {
      return false;
    }
  }
  if (!found) {
    LogWarning(log, kLogCategory,
               variant.name + "/" + replica.filename().string() + ": no " +
                   request.options.options_file + " found");
  }
  return true;
}

void RunVariantSteps(const SynthesisRequest& request, VariantSynthesis* variant,
                     LogService* log) {
  std::string error;

  if (!EnsureDirectory(variant->dir, &error) ||
      !EnsureDirectory(variant->dir / request.options.working_subfolder, &error)) {
    variant->error = error;
    return;
  }
  std::error_code ec;
  variant->working_dir =
      std::filesystem::absolute(variant->dir / request.options.working_subfolder, ec)
          .lexically_normal();
  if (ec) {
    variant->error = "failed to resolve working folder: " + ec.message();
    return;
  }

  if (!WriteScalarConfig(request, variant, &error)) {
    variant->error = error;
    return;
  }

  const std::vector<std::filesystem::path> subcases =
      ListSubdirectories(request.template_simulation_dir, request.options.subcase_prefix);
  if (subcases.empty()) {
    variant->error = "no '" + request.options.subcase_prefix + "*' sub-case folders in " +
                     request.template_simulation_dir.string();
    return;
  }

  std::string base_geometry;
  if (!ReadFileBytes(request.geometry_file, &base_geometry, &error)) {
    variant->error = "geometry file not found: " + request.geometry_file.string();
    return;
  }

  for (const auto& subcase : subcases) {
    const std::filesystem::path replica = variant->dir / subcase.filename();
    if (!ReplaceTree(subcase, replica, &error) ||
        !RewriteGeometry(request, *variant, replica, base_geometry, log, &error) ||
        !RewriteOptionsFiles(request, *variant, replica, log, &error)) {
      variant->error = subcase.filename().string() + ": " + error;
      return;
    }
    variant->subcases.push_back(subcase.filename().string());
  }
  variant->ok = true;
}

}  // namespace

SynthesisOptions MakeSynthesisOptions(const DoeConfig& config) {
  SynthesisOptions options;
  options.subcase_prefix = config.subcase_prefix;
  options.variant_prefix = config.variant_prefix;
  options.working_subfolder = config.working_subfolder;
  options.subcase_input_folder = config.subcase_input_folder;
  options.scalar_file = config.scalar_file;
  options.geometry_file = std::filesystem::path(config.geometry_file).filename().string();
  options.options_file = config.options_file;
  options.path_field = config.path_field;
  options.tracked_param = config.tracked_param;
  return options;
}

std::string VariantDirectoryName(const std::string& prefix, double scale) {
  // Adding 0.0 turns the -0 of scales in (-1, 0) into 0.
  return prefix + doe::FormatFixed(std::trunc(scale) + 0.0, 0);
}

std::string RewriteScalarTemplate(const std::string& content, double base, double scaled) {
  std::vector<LineSpan> lines = SplitKeepingEndings(content);
  const std::string default_ending =
      (!lines.empty() && !lines.front().ending.empty()) ? lines.front().ending : "\n";
  while (lines.size() < 4) {
    lines.push_back(LineSpan());
  }
  for (size_t i = 0; i < 3; ++i) {
    if (lines[i].ending.empty()) {
      lines[i].ending = default_ending;
    }
  }
  lines[3].text = doe::FormatRoundTrip(base) + " " + doe::FormatRoundTrip(scaled);
  if (lines[3].ending.empty()) {
    lines[3].ending = default_ending;
  }

  std::string out;
  for (const LineSpan& line : lines) {
    out += line.text;
    out += line.ending;
  }
  return out;
}

VariantSynthesis SynthesizeVariant(const SynthesisRequest& request, double scale,
                                   LogService* log) {
  VariantSynthesis variant;
  variant.scale = scale;
  variant.name = VariantDirectoryName(request.options.variant_prefix, scale);
  const std::filesystem::path root =
      request.output_root.empty() ? request.template_simulation_dir : request.output_root;
  variant.dir = root / variant.name;
  if (!IsUsableScaleFactor(scale)) {
    variant.error = "scale factor " + doe::FormatRoundTrip(scale) + " is out of range";
    LogError(log, kLogCategory, variant.name + ": " + variant.error);
    return variant;
  }
  variant.params = DeriveVariant(request.base, scale, request.rules);

  LogInfo(log, kLogCategory, "scale " + doe::FormatFixed(scale, 6) + " -> " + variant.name);
  for (const auto& entry : variant.params.scaled) {
    LogInfo(log, kLogCategory,
            "  " + entry.first + ": " + doe::FormatFixed(variant.params.base[entry.first], 6) +
                " -> " + doe::FormatFixed(entry.second, 6) + " mm");
  }

  try {
    RunVariantSteps(request, &variant, log);
  } catch (const std::exception& exc) {
    variant.ok = false;
    variant.error = exc.what();
  }

  if (variant.ok) {
    LogInfo(log, kLogCategory,
            variant.name + ": " + std::to_string(variant.subcases.size()) +
                " sub-case(s) replicated");
  } else {
    LogError(log, kLogCategory, variant.name + ": " + variant.error);
  }
  return variant;
}

SynthesisReport SynthesizeVariants(const SynthesisRequest& request, LogService* log) {
  SynthesisReport report;
  std::map<std::string, double> seen;
  for (double scale : request.scales) {
    const std::string name = VariantDirectoryName(request.options.variant_prefix, scale);
    auto it = seen.find(name);
    if (it != seen.end() && it->second != scale) {
      LogWarning(log, kLogCategory,
                 "scale " + doe::FormatFixed(scale, 6) + " overwrites " + name +
                     " written for scale " + doe::FormatFixed(it->second, 6));
    }
    seen[name] = scale;

    VariantSynthesis variant = SynthesizeVariant(request, scale, log);
    if (variant.ok) {
      ++report.succeeded;
    } else {
      ++report.failed;
    }
    report.variants.push_back(std::move(variant));
  }
  LogInfo(log, kLogCategory,
          "synthesis finished: " + std::to_string(report.succeeded) + " succeeded, " +
              std::to_string(report.failed) + " failed");
  return report;
}
