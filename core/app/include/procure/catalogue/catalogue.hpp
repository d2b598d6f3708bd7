#pragma once

#include "procure/random/i_random_source.hpp"

#include <map>
#include <string>
#include <vector>

namespace procure {
namespace catalogue {

// -----------------------------------------------------------------------------
// Catalogue: the fixed vocabularies of the simulated coffee market
// -----------------------------------------------------------------------------
//
// @brief  Read-only tables consulted by the generator, the market process,
//         the synthesis policies, and the tracking narrative.
//
// @details
// Every accessor returns a reference to a function-local static, built on
// first use and never modified afterwards. Order matters: the generator and
// the market process walk these tables in the order given here, and that
// order is part of the reproducible draw sequence of a seeded run.
//
// Thread model:
//   Immutable after first use; C++11 guarantees thread-safe initialization
//   of function-local statics.
// -----------------------------------------------------------------------------

struct RegionProfile {
  std::string name;
  std::vector<std::string> beans;  // Bean palette suppliers draw from
  double quality_min;
  double quality_max;
};

// The 8 supplier regions. Every region name is also a country name.
const std::vector<RegionProfile>& regions();

const std::vector<std::string>& certifications();

// Multiplier band applied to the base price for one bean type. Arabica is
// the base price itself and has no band.
struct BeanPriceBand {
  std::string bean;
  double multiplier_min;
  double multiplier_max;
};

inline const char* const kBaseBean = "Arabica";

const std::vector<BeanPriceBand>& beanPriceBands();

// Regional price offsets are drawn from [min, max] as a fraction of the base.
inline constexpr double kRegionalOffsetMin = -0.10;
inline constexpr double kRegionalOffsetMax = 0.15;

// -----------------------------------------------------------------------------
// Market factor vocabularies
// -----------------------------------------------------------------------------
// initial_details is used by the generator; extended_details (a superset) by
// the market process when it re-samples a factor. A re-sampled factor draws
// its status from resampleStatuses() whatever its name.
// -----------------------------------------------------------------------------
struct FactorVocabulary {
  std::string name;
  std::vector<std::string> statuses;
  std::vector<std::string> initial_details;
  std::vector<std::string> extended_details;
};

const std::vector<FactorVocabulary>& marketFactors();

// nullptr when `name` is not a catalogue factor.
const FactorVocabulary* findFactor(const std::string& name);

const std::vector<std::string>& impactLevels();
const std::vector<std::string>& resampleStatuses();

const std::vector<std::string>& shortTermForecasts();
const std::vector<std::string>& longTermForecasts();

// --- Synthesized contract terms ----------------------------------------------
const std::vector<std::string>& paymentTerms();
const std::vector<std::string>& deliveryTerms();
const std::vector<std::string>& sustainabilityRequirements();
inline const char* const kQualityRequirement = "SCA score 80+";
inline const char* const kDefaultBean = "Arabica";

// --- Orders and shipping ----------------------------------------------------
const std::vector<std::string>& carriers();
inline const char* const kDestinationPort = "Seattle, USA";

// --- Tracking narrative -----------------------------------------------------
const std::vector<std::string>& transitLocations();
const std::vector<std::string>& delayLocations();
const std::vector<std::string>& delayCauses();
const std::vector<std::string>& qualityCheckStatuses();
inline const char* const kWarehouse = "Central roastery warehouse";
inline const char* const kReceivedBy = "Warehouse Manager";

// -----------------------------------------------------------------------------
// Region -> country table
// -----------------------------------------------------------------------------
// Four coffee-growing region groups, each listing its member countries.
// std::map keeps the iteration order fixed.
// -----------------------------------------------------------------------------
const std::map<std::string, std::vector<std::string>>& regionGroups();

// -------------------------------------------------------------------------
// countryForRegion(rng, region)
// -------------------------------------------------------------------------
// @brief  Resolves a region label to a country name.
//
// @return
//   - a uniformly random member when `region` is a group name (one draw);
//   - `region` itself when it is a listed member country (no draw);
//   - "Unknown" otherwise.
// -------------------------------------------------------------------------
std::string countryForRegion(IRandomSource& rng, const std::string& region);

inline const char* const kUnknownCountry = "Unknown";

}  // namespace catalogue
}  // namespace procure
