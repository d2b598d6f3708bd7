#include "procure/catalogue/catalogue.hpp"

#include "procure/random/sampling.hpp"

namespace procure {
namespace catalogue {

const std::vector<RegionProfile>& regions() {
  static const std::vector<RegionProfile> kRegions = {
      {"Ethiopia", {"Arabica", "Typica", "Bourbon"}, 7.5, 9.5},
      {"Colombia", {"Arabica", "Bourbon", "Typica"}, 7.0, 9.0},
      {"Brazil", {"Arabica", "Bourbon", "Robusta"}, 6.5, 8.5},
      {"Vietnam", {"Robusta", "Arabica"}, 6.0, 8.0},
      {"Guatemala", {"Arabica", "Bourbon", "Typica"}, 7.0, 9.0},
      {"Costa Rica", {"Arabica", "Gesha", "Typica"}, 7.5, 9.5},
      {"Kenya", {"Arabica", "SL28", "SL34"}, 7.5, 9.5},
      {"Indonesia", {"Arabica", "Robusta", "Typica"}, 6.5, 8.5},
  };
  return kRegions;
}

const std::vector<std::string>& certifications() {
  static const std::vector<std::string> kCertifications = {
      "Organic", "Fair Trade", "Rainforest Alliance", "UTZ", "Bird Friendly"};
  return kCertifications;
}

const std::vector<BeanPriceBand>& beanPriceBands() {
  static const std::vector<BeanPriceBand> kBands = {
      {"Robusta", 0.7, 0.9},
      {"Bourbon", 1.05, 1.2},
      {"Typica", 1.0, 1.15},
      {"Gesha", 1.5, 2.5},
  };
  return kBands;
}

// -----------------------------------------------------------------------------
// Market factors
// -----------------------------------------------------------------------------
const std::vector<FactorVocabulary>& marketFactors() {
  static const std::vector<FactorVocabulary> kFactors = {
      {"Weather Conditions",
       {"Favorable", "Mixed", "Concerning"},
       {"Ideal rainfall in major growing regions",
        "Drought conditions in parts of Brazil",
        "Excessive rainfall in Colombia affecting harvest",
        "Normal seasonal patterns across most regions"},
       {"Ideal rainfall in major growing regions",
        "Drought conditions in parts of Brazil",
        "Excessive rainfall in Colombia affecting harvest",
        "Normal seasonal patterns across most regions",
        "Frost concerns in Brazil", "Hurricane damage in Central America"}},
      {"Political Stability",
       {"Stable", "Some Concerns", "Unstable"},
       {"No major political disruptions in key regions",
        "Political tensions in Ethiopia affecting exports",
        "Trade policy changes impacting shipping costs",
        "Labor disputes in Colombia affecting production"},
       {"No major political disruptions in key regions",
        "Political tensions in Ethiopia affecting exports",
        "Trade policy changes impacting shipping costs",
        "Labor disputes in Colombia affecting production",
        "New export regulations in Vietnam",
        "Currency devaluation in Brazil affecting prices"}},
      {"Global Demand",
       {"Growing", "Stable", "Declining"},
       {"Steady increase in global coffee consumption",
        "Shifting consumer preferences toward specialty coffee",
        "Economic slowdown affecting cafe sales",
        "New markets emerging in Asia"},
       {"Steady increase in global coffee consumption",
        "Shifting consumer preferences toward specialty coffee",
        "Economic slowdown affecting cafe sales",
        "New markets emerging in Asia", "Increased home consumption trends",
        "Seasonal demand fluctuations"}},
  };
  return kFactors;
}

const FactorVocabulary* findFactor(const std::string& name) {
  for (const auto& factor : marketFactors()) {
    if (factor.name == name) {
      return &factor;
    }
  }
  return nullptr;
}

const std::vector<std::string>& impactLevels() {
  static const std::vector<std::string> kImpacts = {"Minimal", "Moderate",
                                                    "Significant"};
  return kImpacts;
}

const std::vector<std::string>& resampleStatuses() {
  static const std::vector<std::string> kStatuses = {"Favorable", "Mixed",
                                                     "Concerning"};
  return kStatuses;
}

const std::vector<std::string>& shortTermForecasts() {
  static const std::vector<std::string> kShort = {"Price increase expected",
                                                  "Stable prices likely",
                                                  "Price decrease expected"};
  return kShort;
}

const std::vector<std::string>& longTermForecasts() {
  static const std::vector<std::string> kLong = {
      "Upward trend", "Stable market", "Downward pressure",
      "Increased volatility"};
  return kLong;
}

// -----------------------------------------------------------------------------
// Contract terms and shipping
// -----------------------------------------------------------------------------
const std::vector<std::string>& paymentTerms() {
  static const std::vector<std::string> kTerms = {"Net 30", "Net 45", "Net 60"};
  return kTerms;
}

const std::vector<std::string>& deliveryTerms() {
  static const std::vector<std::string> kTerms = {"FOB", "CIF", "EXW"};
  return kTerms;
}

const std::vector<std::string>& sustainabilityRequirements() {
  static const std::vector<std::string> kRequirements = {
      "Rainforest Alliance Certified", "Organic Certified",
      "Fair Trade Certified", "Standard Practices"};
  return kRequirements;
}

const std::vector<std::string>& carriers() {
  static const std::vector<std::string> kCarriers = {
      "OceanFreight", "AirCargo", "LandTransport"};
  return kCarriers;
}

// -----------------------------------------------------------------------------
// Tracking narrative
// -----------------------------------------------------------------------------
const std::vector<std::string>& transitLocations() {
  static const std::vector<std::string> kLocations = {
      "Origin port",       "Atlantic Ocean",    "Pacific Ocean",
      "Destination port",  "Customs clearance", "Local distribution center"};
  return kLocations;
}

const std::vector<std::string>& delayLocations() {
  static const std::vector<std::string> kLocations = {
      "Origin port", "Customs clearance", "International waters",
      "Transshipment port"};
  return kLocations;
}

const std::vector<std::string>& delayCauses() {
  static const std::vector<std::string> kCauses = {
      "Weather-related shipping delay", "Customs processing delay",
      "Logistics coordination issue", "Documentation discrepancy"};
  return kCauses;
}

const std::vector<std::string>& qualityCheckStatuses() {
  static const std::vector<std::string> kStatuses = {
      "Pending", "In progress", "Completed - Passed",
      "Completed - Minor issues"};
  return kStatuses;
}

// -----------------------------------------------------------------------------
// Region -> country
// -----------------------------------------------------------------------------
const std::map<std::string, std::vector<std::string>>& regionGroups() {
  static const std::map<std::string, std::vector<std::string>> kGroups = {
      {"Central America",
       {"Guatemala", "Costa Rica", "Honduras", "Nicaragua", "El Salvador",
        "Panama"}},
      {"South America", {"Brazil", "Colombia", "Peru", "Ecuador", "Bolivia"}},
      {"Africa",
       {"Ethiopia", "Kenya", "Rwanda", "Tanzania", "Uganda", "Burundi"}},
      {"Asia",
       {"Vietnam", "Indonesia", "India", "Papua New Guinea", "Thailand",
        "Laos"}},
  };
  return kGroups;
}

std::string countryForRegion(IRandomSource& rng, const std::string& region) {
  const auto& groups = regionGroups();

  auto group = groups.find(region);
  if (group != groups.end()) {
    return pick(rng, group->second);
  }

  for (const auto& entry : groups) {
    for (const auto& country : entry.second) {
      if (country == region) {
        return country;
      }
    }
  }
  return kUnknownCountry;
}

}  // namespace catalogue
}  // namespace procure
