#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

#include "agripv/core/food_policy.h"

#define AGRIPV_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool same(const agripv::ProcessingSplit& a, const agripv::ProcessingSplit& b) {
  return std::fabs(a.fresh - b.fresh) < 1e-12 && std::fabs(a.packaged - b.packaged) < 1e-12 &&
         std::fabs(a.canned - b.canned) < 1e-12 && std::fabs(a.dried - b.dried) < 1e-12;
}

} // namespace

int test_food_policy() {
  using namespace agripv;

  FoodPolicyContext ctx;
  ctx.crop = "tomato";
  ctx.harvest_yield_kg = 1000.0;
  ctx.fresh_price_usd_per_kg = 0.30;

  AGRIPV_ASSERT(same(make_food_policy("all_fresh", {})->allocate(ctx), ProcessingSplit{}));
  AGRIPV_ASSERT(same(make_food_policy("maximize_storage", {})->allocate(ctx), default_maximize_storage_split()));
  AGRIPV_ASSERT(same(make_food_policy("balanced", {})->allocate(ctx), default_balanced_mix_split()));
  AGRIPV_ASSERT(std::string(make_food_policy("preserve_maximum", {})->id()) == "maximize_storage");

  // Custom split replaces the built-in one.
  {
    FoodPolicyParams params;
    params.split = ProcessingSplit{0.4, 0.3, 0.2, 0.1};
    AGRIPV_ASSERT(same(make_food_policy("balanced_mix", params)->allocate(ctx), *params.split));
  }

  // Market responsive: processes more below 80% of the reference price.
  {
    auto p = make_food_policy("market_responsive", {});
    ctx.fresh_price_usd_per_kg = 0.20;  // below 0.8 x 0.30
    const ProcessingSplit low = p->allocate(ctx);
    ctx.fresh_price_usd_per_kg = 0.30;
    const ProcessingSplit normal = p->allocate(ctx);
    AGRIPV_ASSERT(low.fresh < normal.fresh);
    AGRIPV_ASSERT(std::fabs(low.sum() - 1.0) < 1e-9);
    AGRIPV_ASSERT(std::fabs(normal.sum() - 1.0) < 1e-9);

    FoodPolicyParams params;
    params.reference_prices_usd_per_kg["tomato"] = 1.0;
    MarketResponsivePolicy custom(params);
    AGRIPV_ASSERT(custom.reference_price("tomato") == 1.0);
    AGRIPV_ASSERT(custom.reference_price("potato") == fallback_reference_price("potato"));
    AGRIPV_ASSERT(same(custom.allocate(ctx), low));
  }

  AGRIPV_ASSERT(split_fraction(default_balanced_mix_split(), ProcessingPathway::Packaged) == 0.20);

  // Validation.
  bool threw = false;
  try {
    check_processing_split(ProcessingSplit{0.5, 0.2, 0.2, 0.2}, "test");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  AGRIPV_ASSERT(threw);

  threw = false;
  try {
    check_processing_split(ProcessingSplit{1.2, -0.2, 0.0, 0.0}, "test");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  AGRIPV_ASSERT(threw);

  threw = false;
  try {
    FoodPolicyParams params;
    params.split = ProcessingSplit{0.9, 0.0, 0.0, 0.0};
    (void)make_food_policy("maximize_storage", params);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  AGRIPV_ASSERT(threw);

  threw = false;
  try {
    (void)make_food_policy("freeze_everything", {});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  AGRIPV_ASSERT(threw);

  ProcessingPathway pw;
  AGRIPV_ASSERT(processing_pathway_from_string("Canned", &pw) && pw == ProcessingPathway::Canned);
  AGRIPV_ASSERT(!processing_pathway_from_string("smoked", &pw));

  return 0;
}
