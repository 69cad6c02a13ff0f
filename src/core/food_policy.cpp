#include "agripv/core/food_policy.h"

#include <cmath>
#include <stdexcept>

#include "agripv/util/strings.h"

namespace agripv {

const char* processing_pathway_id(ProcessingPathway p) {
  switch (p) {
    case ProcessingPathway::Fresh: return "fresh";
    case ProcessingPathway::Packaged: return "packaged";
    case ProcessingPathway::Canned: return "canned";
    case ProcessingPathway::Dried: return "dried";
  }
  return "fresh";
}

bool processing_pathway_from_string(std::string_view s, ProcessingPathway* out) {
  const std::string v = to_lower(std::string(s));
  for (const ProcessingPathway p : kAllPathways) {
    if (v == processing_pathway_id(p)) {
      if (out) *out = p;
      return true;
    }
  }
  return false;
}

double split_fraction(const ProcessingSplit& split, ProcessingPathway p) {
  switch (p) {
    case ProcessingPathway::Fresh: return split.fresh;
    case ProcessingPathway::Packaged: return split.packaged;
    case ProcessingPathway::Canned: return split.canned;
    case ProcessingPathway::Dried: return split.dried;
  }
  return 0.0;
}

void check_processing_split(const ProcessingSplit& split, const std::string& context) {
  for (const ProcessingPathway p : kAllPathways) {
    if (split_fraction(split, p) < 0.0) {
      throw std::invalid_argument(context + ": negative " + processing_pathway_id(p) + " fraction");
    }
  }
  const double total = split.sum();
  if (std::fabs(total - 1.0) > 0.001) {
    throw std::invalid_argument(context + ": processing fractions must sum to 1.0, got " + format_fixed(total, 4));
  }
}

const char* food_policy_kind_id(FoodPolicyKind k) {
  switch (k) {
    case FoodPolicyKind::AllFresh: return "all_fresh";
    case FoodPolicyKind::MaximizeStorage: return "maximize_storage";
    case FoodPolicyKind::BalancedMix: return "balanced_mix";
    case FoodPolicyKind::MarketResponsive: return "market_responsive";
  }
  return "all_fresh";
}

bool food_policy_kind_from_string(std::string_view s, FoodPolicyKind* out) {
  const std::string v = to_lower(trim(std::string(s)));
  FoodPolicyKind k;
  if (v == "all_fresh") {
    k = FoodPolicyKind::AllFresh;
  } else if (v == "maximize_storage" || v == "preserve_maximum") {
    k = FoodPolicyKind::MaximizeStorage;
  } else if (v == "balanced_mix" || v == "balanced") {
    k = FoodPolicyKind::BalancedMix;
  } else if (v == "market_responsive") {
    k = FoodPolicyKind::MarketResponsive;
  } else {
    return false;
  }
  if (out) *out = k;
  return true;
}

ProcessingSplit AllFreshPolicy::allocate(const FoodPolicyContext&) const { return ProcessingSplit{}; }

FixedSplitPolicy::FixedSplitPolicy(FoodPolicyKind kind, ProcessingSplit split) : kind_(kind), split_(split) {
  check_processing_split(split_, food_policy_kind_id(kind_));
}

ProcessingSplit FixedSplitPolicy::allocate(const FoodPolicyContext&) const { return split_; }

MarketResponsivePolicy::MarketResponsivePolicy(const FoodPolicyParams& params)
    : params_(params),
      low_(params.low_price_split.value_or(ProcessingSplit{0.30, 0.20, 0.25, 0.25})),
      normal_(params.normal_price_split.value_or(ProcessingSplit{0.65, 0.15, 0.10, 0.10})) {
  if (!(params_.price_threshold_fraction > 0.0)) {
    throw std::invalid_argument("market_responsive: price_threshold_fraction must be > 0");
  }
  check_processing_split(low_, "market_responsive low-price split");
  check_processing_split(normal_, "market_responsive normal-price split");
}

double MarketResponsivePolicy::reference_price(const std::string& crop) const {
  const auto it = params_.reference_prices_usd_per_kg.find(crop);
  if (it != params_.reference_prices_usd_per_kg.end()) return it->second;
  return fallback_reference_price(crop);
}

ProcessingSplit MarketResponsivePolicy::allocate(const FoodPolicyContext& ctx) const {
  const double threshold = reference_price(ctx.crop) * params_.price_threshold_fraction;
  return ctx.fresh_price_usd_per_kg < threshold ? low_ : normal_;
}

ProcessingSplit default_maximize_storage_split() { return ProcessingSplit{0.20, 0.10, 0.35, 0.35}; }
ProcessingSplit default_balanced_mix_split() { return ProcessingSplit{0.50, 0.20, 0.15, 0.15}; }

double fallback_reference_price(const std::string& crop) {
  const std::string c = to_lower(crop);
  if (c == "tomato") return 0.30;
  if (c == "potato") return 0.25;
  if (c == "onion") return 0.20;
  if (c == "kale") return 0.40;
  if (c == "cucumber") return 0.35;
  return 0.30;
}

std::unique_ptr<FoodPolicy> make_food_policy(const std::string& name, const FoodPolicyParams& params) {
  FoodPolicyKind kind;
  if (!food_policy_kind_from_string(name, &kind)) {
    throw std::invalid_argument("Unknown food policy '" + name +
                                "'. Valid: all_fresh, maximize_storage, balanced_mix, market_responsive");
  }
  switch (kind) {
    case FoodPolicyKind::AllFresh: return std::make_unique<AllFreshPolicy>();
    case FoodPolicyKind::MaximizeStorage:
      return std::make_unique<FixedSplitPolicy>(kind, params.split.value_or(default_maximize_storage_split()));
    case FoodPolicyKind::BalancedMix:
      return std::make_unique<FixedSplitPolicy>(kind, params.split.value_or(default_balanced_mix_split()));
    case FoodPolicyKind::MarketResponsive: return std::make_unique<MarketResponsivePolicy>(params);
  }
  throw std::invalid_argument("Unhandled food policy: " + name);
}

} // namespace agripv
