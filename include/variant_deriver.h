#ifndef VARIANT_DERIVER_H
#define VARIANT_DERIVER_H

#include <map>
#include <string>
#include <vector>

#include "geometry_params.h"

// Sign applied to the scale factor for lZ0. Revisions of the piston tooling
// disagree on it, so it is chosen explicitly per sweep.
enum class Lz0Sign {
  Plus,
  Minus,
};

bool ParseLz0Sign(const std::string& text, Lz0Sign* out);
std::string Lz0SignToken(Lz0Sign sign);

// scaled = base + coefficient * scale
struct DerivationRule {
  std::string name;
  double coefficient = 1.0;
};

std::vector<DerivationRule> DefaultDerivationRules(Lz0Sign lz0_sign = Lz0Sign::Plus);

using BaseParameters = std::map<std::string, double>;

struct VariantParameterSet {
  double scale = 0.0;
  BaseParameters base;
  BaseParameters scaled;
};

// Fails when any rule name has no resolved value in params.
bool ResolveBaseParameters(const GeometryParameterSet& params,
                           const std::vector<DerivationRule>& rules,
                           BaseParameters* out,
                           std::string* error);

// Pure; names without a rule are not carried into the result.
VariantParameterSet DeriveVariant(const BaseParameters& base,
                                  double scale,
                                  const std::vector<DerivationRule>& rules);

#endif  // VARIANT_DERIVER_H
