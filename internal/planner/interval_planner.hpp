#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/graph/dependency_graph.hpp"
#include "internal/model/plan.hpp"
#include "internal/planner/plan_request.hpp"
#include "internal/planner/planner_config.hpp"
#include "internal/sql/sql_toolkit.hpp"

namespace modelplan::planner {

/*
  Deterministic interval planner.

  Turns a structural diff into an execution plan: which models run, as a
  full refresh or over which date range, in which parallel layer, and at
  what estimated cost. Identical requests produce identical plans,
  byte for byte; nothing here reads the clock or draws random numbers.

  When unsure the planner schedules more work rather than less: unknown
  model kinds get a full refresh, unparseable SQL is never treated as a
  cosmetic change, and a cyclic affected subgraph is planned sequentially
  instead of being rejected.

  Stateless after construction; GeneratePlan may be called concurrently.
*/
class IntervalPlanner {
 public:
  // A null toolkit selects BasicSqlToolkit.
  explicit IntervalPlanner(PlannerConfig config = {}, std::shared_ptr<const sql::SqlToolkit> toolkit = nullptr);

  // Throws util::InvalidArgument when as_of_date is missing, the config is
  // out of range, or a watermark / run-stat entry is malformed.
  model::Plan GeneratePlan(const PlanRequest& request) const;

  const PlannerConfig& config() const {
    return config_;
  }

 private:
  std::set<std::string> FilterCosmeticChanges(const PlanRequest& request) const;

  PlannerConfig                          config_;
  std::shared_ptr<const sql::SqlToolkit> toolkit_;
};

// ------------------------------------------------------------
// Planning primitives
// ------------------------------------------------------------

// Longest-path layer of each affected model within the induced subgraph.
// Falls back to sequential groups (position in the list) on a cycle.
std::map<std::string, int> AssignParallelGroups(const std::vector<std::string>& affected_sorted,
                                                const graph::DependencyGraph& dag);

// Start resumes at the model's watermark end (or as_of - lookback), then
// widens back to the earliest upstream watermark start; end is as_of.
model::DateRange ComputeIncrementalRange(const std::string& model_name, const WatermarkMap& watermarks,
                                         const std::set<std::string>& upstream_affected, int default_lookback_days,
                                         util::Date as_of_date);

double RoundUsd(double value);

// sha256("{model}:{base}:{target}")
std::string ComputeStepId(const std::string& model_name, const std::string& base, const std::string& target);

// sha256(base || target || step_id...) in step order.
std::string ComputePlanId(const std::string& base, const std::string& target, const std::vector<model::PlanStep>& steps);

} // namespace modelplan::planner
