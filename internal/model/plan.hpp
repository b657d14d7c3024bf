#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/date.hpp"

namespace modelplan::model {

enum class RunType {
  kFullRefresh,
  kIncremental,
};

std::string_view ToString(RunType type);
RunType          ParseRunType(std::string_view text); // throws util::InvalidArgument

// Inclusive on both ends.
struct DateRange {
  util::Date start;
  util::Date end;
};

// Contract violation flattened into plain fields for embedding in a step.
struct StepViolation {
  std::string column_name;
  std::string violation_type;
  std::string severity;
  std::string expected;
  std::string actual;
  std::string message;
};

struct StepDiffDetail {
  std::string              change_type;
  std::vector<std::string> columns_added;
  std::vector<std::string> columns_removed;
  std::vector<std::string> columns_modified;
};

/*
  One unit of work in a plan.

  depends_on holds step ids of upstream steps in the same plan, ordered by
  the upstream model name.
*/
struct PlanStep {
  std::string              step_id;
  std::string              model;
  RunType                  run_type = RunType::kFullRefresh;
  std::optional<DateRange> input_range;
  std::vector<std::string> depends_on;
  int                      parallel_group = 0;
  std::string              reason;

  double estimated_compute_seconds = 0.0;
  double estimated_cost_usd        = 0.0;

  std::vector<StepViolation>    contract_violations;
  std::optional<StepDiffDetail> diff_detail;
};

struct PlanSummary {
  int                      total_steps        = 0;
  double                   estimated_cost_usd = 0.0;
  std::vector<std::string> models_changed;
  std::vector<std::string> cosmetic_changes_skipped;
  int                      contract_violations_count    = 0;
  int                      breaking_contract_violations = 0;
};

/*
  Fully resolved execution plan.

  Carries no timestamps; plan_id and every step_id are content hashes, so
  identical inputs give identical plans.
*/
struct Plan {
  std::string           plan_id;
  std::string           base;
  std::string           target;
  PlanSummary           summary;
  std::vector<PlanStep> steps;

  const PlanStep* FindStep(std::string_view model_name) const;
};

} // namespace modelplan::model
