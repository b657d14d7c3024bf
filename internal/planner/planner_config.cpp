#include "planner_config.hpp"

#include <cmath>
#include <string>

#include "internal/util/errors.hpp"

namespace modelplan::planner {

void PlannerConfig::Validate() const {
  if (default_lookback_days < 1) {
    throw util::InvalidArgument("planner config: default_lookback_days must be >= 1, got " +
                                std::to_string(default_lookback_days));
  }
  if (!std::isfinite(cost_per_compute_second) || cost_per_compute_second < 0.0) {
    throw util::InvalidArgument("planner config: cost_per_compute_second must be a non-negative number");
  }
  if (!std::isfinite(default_estimated_seconds) || default_estimated_seconds < 0.0) {
    throw util::InvalidArgument("planner config: default_estimated_seconds must be a non-negative number");
  }
}

} // namespace modelplan::planner
