#ifndef VARIANT_SYNTH_H
#define VARIANT_SYNTH_H

#include <filesystem>
#include <string>
#include <vector>

#include "doe_config.h"
#include "variant_deriver.h"

class LogService;

struct SynthesisOptions {
  std::string subcase_prefix = "T";
  std::string variant_prefix = "IM_scaled_piston_";
  std::string working_subfolder = "IM_piston";
  std::string subcase_input_folder = "input";
  std::string scalar_file = "scalar.txt";
  std::string geometry_file = "geometry.txt";
  std::string options_file = "options_piston.txt";
  std::string path_field = "IM_piston_path";
  std::string tracked_param = "lK";
};

SynthesisOptions MakeSynthesisOptions(const DoeConfig& config);

struct SynthesisRequest {
  std::filesystem::path template_simulation_dir;  // Holds the sub-case templates.
  std::filesystem::path output_root;              // Empty = template_simulation_dir.
  std::filesystem::path scalar_template;
  std::filesystem::path geometry_file;            // Base geometry rewritten per replica.
  std::vector<double> scales;
  BaseParameters base;
  std::vector<DerivationRule> rules;
  SynthesisOptions options;
};

struct VariantSynthesis {
  double scale = 0.0;
  std::string name;
  std::filesystem::path dir;
  std::filesystem::path working_dir;  // Absolute.
  VariantParameterSet params;
  std::vector<std::string> subcases;
  bool ok = false;
  std::string error;
};

struct SynthesisReport {
  std::vector<VariantSynthesis> variants;
  int succeeded = 0;
  int failed = 0;
};

// "<prefix><trunc(scale)>", e.g. IM_scaled_piston_5 for 5.7.
std::string VariantDirectoryName(const std::string& prefix, double scale);

// Replaces line 4 of a scalar-config template with "<base> <scaled>"; other
// lines and line endings are kept. Short templates are padded to 4 lines.
std::string RewriteScalarTemplate(const std::string& content, double base, double scaled);

VariantSynthesis SynthesizeVariant(const SynthesisRequest& request,
                                   double scale,
                                   LogService* log = nullptr);

// Sequential over request.scales; a failing variant does not stop the others.
SynthesisReport SynthesizeVariants(const SynthesisRequest& request, LogService* log = nullptr);

#endif  // VARIANT_SYNTH_H
