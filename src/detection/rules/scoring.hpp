#ifndef SCORING_HPP
#define SCORING_HPP

#include "core/config.hpp"
#include "core/tunnel_detection.hpp"

#include <algorithm>

namespace Scoring {

constexpr double MIN_RISK = 0.0;
constexpr double MAX_RISK = 100.0;

inline double clamp_risk(double weight_sum) {
  return std::clamp(weight_sum, MIN_RISK, MAX_RISK);
}

// Maps a risk score onto the configured bands. Bands are lower bounds.
inline Confidence confidence_for(double risk_score,
                                 const Config::ClassifierConfig &bands) {
  if (risk_score >= bands.band_confirmed)
    return Confidence::CONFIRMED;
  if (risk_score >= bands.band_high)
    return Confidence::HIGH;
  if (risk_score >= bands.band_medium)
    return Confidence::MEDIUM;
  return Confidence::LOW;
}

} // namespace Scoring

#endif // SCORING_HPP
