#include "variant_deriver.h"

#include <utility>

#include "string_utils.h"

bool ParseLz0Sign(const std::string& text, Lz0Sign* out) {
  const std::string token = doe::ToLower(doe::Trim(text));
  Lz0Sign sign = Lz0Sign::Plus;
  if (token == "plus" || token == "+") {
    sign = Lz0Sign::Plus;
  } else if (token == "minus" || token == "-") {
    sign = Lz0Sign::Minus;
  } else {
    return false;
  }
  if (out) {
    *out = sign;
  }
  return true;
}

std::string Lz0SignToken(Lz0Sign sign) {
  return sign == Lz0Sign::Minus ? "minus" : "plus";
}

std::vector<DerivationRule> DefaultDerivationRules(Lz0Sign lz0_sign) {
  return {
      {"lK", 1.0},
      {"lZ0", lz0_sign == Lz0Sign::Minus ? -1.0 : 1.0},
      {"lKG", 0.86},
      {"lSK", 0.45},
  };
}

bool ResolveBaseParameters(const GeometryParameterSet& params,
                           const std::vector<DerivationRule>& rules,
                           BaseParameters* out,
                           std::string* error) {
  BaseParameters resolved;
  std::string missing;
  for (const DerivationRule& rule : rules) {
    auto it = params.find(rule.name);
    if (it == params.end() || !it->second) {
      if (!missing.empty()) {
        missing += ", ";
      }
      missing += rule.name;
      continue;
    }
    resolved[rule.name] = *it->second;
  }
  if (!missing.empty()) {
    if (error) {
      *error = "missing geometry parameter(s): " + missing;
    }
    return false;
  }
  if (out) {
    *out = std::move(resolved);
  }
  return true;
}

VariantParameterSet DeriveVariant(const BaseParameters& base,
                                  double scale,
                                  const std::vector<DerivationRule>& rules) {
  VariantParameterSet variant;
  variant.scale = scale;
  for (const DerivationRule& rule : rules) {
    auto it = base.find(rule.name);
    if (it == base.end()) {
      continue;
    }
    variant.base[rule.name] = it->second;
    variant.scaled[rule.name] = it->second + rule.coefficient * scale;
  }
  return variant;
}
