#pragma once

namespace modelplan::planner {

/*
  Tunable knobs for the interval planner.

  A default-constructed value is the documented default configuration;
  there is no process-wide instance.
*/
struct PlannerConfig {
  // Days to look back when an incremental model has no watermark. >= 1.
  int default_lookback_days = 30;

  // USD per compute-second. >= 0.
  double cost_per_compute_second = 0.0007;

  // Drop modified models whose SQL change is formatting/comments only.
  bool skip_cosmetic_changes = true;

  // Runtime assumed for models without run history. >= 0.
  double default_estimated_seconds = 300.0;

  // Throws util::InvalidArgument.
  void Validate() const;
};

} // namespace modelplan::planner
