#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "agripv/core/scenario.h"

namespace agripv {

// --- post-harvest processing ---
//
// A harvest is split across pathways before sale. Each pathway has its own mass
// loss, spoilage and price multiplier (see PathwayParams in data_provider.h).

enum class ProcessingPathway : std::uint8_t {
  Fresh = 0,
  Packaged = 1,
  Canned = 2,
  Dried = 3,
};

inline constexpr std::array<ProcessingPathway, 4> kAllPathways = {
    ProcessingPathway::Fresh,
    ProcessingPathway::Packaged,
    ProcessingPathway::Canned,
    ProcessingPathway::Dried,
};

const char* processing_pathway_id(ProcessingPathway p);
bool processing_pathway_from_string(std::string_view s, ProcessingPathway* out);

double split_fraction(const ProcessingSplit& split, ProcessingPathway p);

// Throws std::invalid_argument when a fraction is negative or the total is not 1 (+-0.001).
void check_processing_split(const ProcessingSplit& split, const std::string& context);

enum class FoodPolicyKind : std::uint8_t {
  AllFresh = 0,
  MaximizeStorage,
  BalancedMix,
  MarketResponsive,
};

const char* food_policy_kind_id(FoodPolicyKind k);

// Accepts the canonical ids plus the aliases "preserve_maximum" and "balanced".
bool food_policy_kind_from_string(std::string_view s, FoodPolicyKind* out);

struct FoodPolicyContext {
  std::string crop;
  double harvest_yield_kg{0.0};
  double fresh_price_usd_per_kg{0.0};
};

class FoodPolicy {
 public:
  virtual ~FoodPolicy() = default;

  virtual FoodPolicyKind kind() const = 0;
  virtual ProcessingSplit allocate(const FoodPolicyContext& ctx) const = 0;

  const char* id() const { return food_policy_kind_id(kind()); }
};

class AllFreshPolicy final : public FoodPolicy {
 public:
  FoodPolicyKind kind() const override { return FoodPolicyKind::AllFresh; }
  ProcessingSplit allocate(const FoodPolicyContext& ctx) const override;
};

// Fixed split; used for both maximize_storage (20/10/35/35) and balanced_mix (50/20/15/15).
class FixedSplitPolicy final : public FoodPolicy {
 public:
  FixedSplitPolicy(FoodPolicyKind kind, ProcessingSplit split);

  FoodPolicyKind kind() const override { return kind_; }
  ProcessingSplit allocate(const FoodPolicyContext& ctx) const override;

 private:
  FoodPolicyKind kind_;
  ProcessingSplit split_;
};

// Processes more of the harvest when the fresh price falls below
// price_threshold_fraction of the crop's reference price.
class MarketResponsivePolicy final : public FoodPolicy {
 public:
  explicit MarketResponsivePolicy(const FoodPolicyParams& params);

  FoodPolicyKind kind() const override { return FoodPolicyKind::MarketResponsive; }
  ProcessingSplit allocate(const FoodPolicyContext& ctx) const override;

  double reference_price(const std::string& crop) const;

 private:
  FoodPolicyParams params_;
  ProcessingSplit low_;
  ProcessingSplit normal_;
};

ProcessingSplit default_maximize_storage_split();
ProcessingSplit default_balanced_mix_split();

// Built-in farmgate reference prices (USD/kg); 0.30 for crops not listed.
double fallback_reference_price(const std::string& crop);

// Throws std::invalid_argument for an unknown name or an invalid split.
std::unique_ptr<FoodPolicy> make_food_policy(const std::string& name, const FoodPolicyParams& params);

} // namespace agripv
