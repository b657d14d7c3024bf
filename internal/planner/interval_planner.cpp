#include "interval_planner.hpp"

#include <algorithm>
#include <cmath>
#include <tuple>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/sql/basic_sql_toolkit.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace modelplan::planner {

using model::DateRange;
using model::Plan;
using model::PlanStep;
using model::RunType;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

// ------------------------------------------------------------
// Request validation
// ------------------------------------------------------------

void ValidateRequest(const PlanRequest& request) {
  if (!request.as_of_date) {
    throw util::InvalidArgument("as_of_date is required for deterministic planning");
  }

  request.diff.Validate();

  for (const auto& [name, watermark] : request.watermarks) {
    if (watermark.range_start > watermark.range_end) {
      throw util::InvalidArgument("watermark for '" + name + "' starts after it ends (" +
                                  watermark.range_start.ToString() + " > " + watermark.range_end.ToString() + ")");
    }
  }

  for (const auto& [name, stats] : request.run_stats) {
    if (stats.avg_runtime_seconds &&
        (!std::isfinite(*stats.avg_runtime_seconds) || *stats.avg_runtime_seconds < 0.0)) {
      throw util::InvalidArgument("run stats for '" + name + "' have an invalid avg_runtime_seconds");
    }
  }
}

// ------------------------------------------------------------
// Per-model decisions
// ------------------------------------------------------------

std::set<std::string> AffectedPredecessors(const std::string& name, const graph::DependencyGraph& dag,
                                           const std::set<std::string>& all_affected) {
  std::set<std::string> upstream;
  for (const auto& pred : dag.Predecessors(name)) {
    if (all_affected.count(pred)) {
      upstream.insert(pred);
    }
  }
  return upstream;
}

std::pair<RunType, std::optional<DateRange>> DetermineRunType(const model::ModelDefinition& definition,
                                                              const PlanRequest& request,
                                                              const std::set<std::string>& all_affected,
                                                              const PlannerConfig& config) {
  if (request.diff.IsAdded(definition.name)) {
    return {RunType::kFullRefresh, std::nullopt};
  }

  switch (definition.kind) {
    case model::ModelKind::kFullRefresh:
    case model::ModelKind::kMergeByKey:
      return {RunType::kFullRefresh, std::nullopt};

    case model::ModelKind::kIncrementalByTimeRange:
    case model::ModelKind::kAppendOnly:
      return {RunType::kIncremental,
              ComputeIncrementalRange(definition.name, request.watermarks,
                                      AffectedPredecessors(definition.name, request.dag, all_affected),
                                      config.default_lookback_days, *request.as_of_date)};
  }

  // kinds this build does not know about
  return {RunType::kFullRefresh, std::nullopt};
}

std::pair<double, double> EstimateCost(const std::string& name, const RunStatsMap& run_stats, const PlannerConfig& config) {
  double seconds = config.default_estimated_seconds;

  auto it = run_stats.find(name);
  if (it != run_stats.end() && it->second.avg_runtime_seconds) {
    seconds = *it->second.avg_runtime_seconds;
  }

  return {seconds, RoundUsd(seconds * config.cost_per_compute_second)};
}

std::string BuildReason(const std::string& name, const PlanRequest& request,
                        const std::set<std::string>& directly_changed) {
  if (request.diff.IsAdded(name)) {
    return "new model added";
  }
  if (request.diff.IsModified(name) && directly_changed.count(name)) {
    return "SQL logic changed";
  }

  if (request.dag.HasNode(name)) {
    // Sets iterate in name order, so the first hit is the smallest name.
    for (const auto& pred : request.dag.Predecessors(name)) {
      if (directly_changed.count(pred)) {
        return "downstream of " + pred;
      }
    }

    for (const auto& ancestor : request.dag.Ancestors(name)) {
      if (directly_changed.count(ancestor)) {
        return "downstream of " + ancestor;
      }
    }
  }

  return "included by planner policy";
}

std::vector<model::StepViolation> StepViolations(const std::string& name, const PlanRequest& request) {
  std::vector<model::StepViolation> out;
  if (!request.contract_results) {
    return out;
  }

  for (const auto& v : request.contract_results->ViolationsForModel(name)) {
    out.push_back({v.column_name, v.violation_type, std::string(model::ToString(v.severity)), v.expected, v.actual,
                   v.message});
  }
  return out;
}

std::optional<model::StepDiffDetail> StepDiff(const std::string& name, const PlanRequest& request,
                                              const std::set<std::string>& directly_changed) {
  if (!request.ast_diffs || !directly_changed.count(name)) {
    return std::nullopt;
  }

  auto it = request.ast_diffs->find(name);
  if (it == request.ast_diffs->end()) {
    return std::nullopt;
  }

  const auto&          detail = it->second;
  model::StepDiffDetail step_diff;
  step_diff.change_type      = std::string(model::ToString(detail.change_type));
  step_diff.columns_added    = detail.added_columns;
  step_diff.columns_removed  = detail.removed_columns;
  step_diff.columns_modified = detail.changed_columns;
  return step_diff;
}

} // namespace

// ------------------------------------------------------------
// IntervalPlanner
// ------------------------------------------------------------

IntervalPlanner::IntervalPlanner(PlannerConfig config, std::shared_ptr<const sql::SqlToolkit> toolkit)
    : config_(config), toolkit_(std::move(toolkit)) {
  config_.Validate();
  if (!toolkit_) {
    toolkit_ = std::make_shared<sql::BasicSqlToolkit>();
  }
}

std::set<std::string> IntervalPlanner::FilterCosmeticChanges(const PlanRequest& request) const {
  std::set<std::string> cosmetic;
  if (!config_.skip_cosmetic_changes || !request.base_sql) {
    return cosmetic;
  }

  for (const auto& name : request.diff.modified_models) {
    auto old_sql = request.base_sql->find(name);
    auto current = request.models.find(name);
    if (old_sql == request.base_sql->end() || current == request.models.end()) {
      continue;
    }

    const auto outcome = toolkit_->Diff(old_sql->second, current->second.EffectiveSql());
    if (!outcome.parsed) {
      MODELPLAN_LOG_DEBUG("Cosmetic check could not parse SQL; treating change as semantic", {StringField("model", name)});
      continue;
    }
    if (outcome.IsCosmetic()) {
      MODELPLAN_LOG_INFO("Skipping cosmetic-only change", {StringField("model", name)});
      cosmetic.insert(name);
    }
  }

  return cosmetic;
}

Plan IntervalPlanner::GeneratePlan(const PlanRequest& request) const {
  observability::SpanScope span("plan.generate");
  ValidateRequest(request);

  span.SetAttribute("plan.base", request.base);
  span.SetAttribute("plan.target", request.target);

  // 1. directly changed = added + modified, minus cosmetic-only edits
  std::set<std::string> directly_changed(request.diff.added_models.begin(), request.diff.added_models.end());
  directly_changed.insert(request.diff.modified_models.begin(), request.diff.modified_models.end());

  const auto cosmetic = FilterCosmeticChanges(request);
  for (const auto& name : cosmetic) {
    directly_changed.erase(name);
  }

  // 2. downstream closure, restricted to models in the target snapshot
  std::set<std::string> closure(directly_changed);
  for (const auto& name : directly_changed) {
    if (request.dag.HasNode(name)) {
      auto downstream = request.dag.Descendants(name);
      closure.insert(downstream.begin(), downstream.end());
    }
  }

  std::set<std::string> all_affected;
  for (const auto& name : closure) {
    if (request.models.count(name)) {
      all_affected.insert(name);
    }
  }

  // 3. everything below iterates in this order
  const std::vector<std::string> affected_sorted(all_affected.begin(), all_affected.end());

  // 4. parallel layers
  const auto groups = AssignParallelGroups(affected_sorted, request.dag);

  // 5. steps
  std::map<std::string, std::string> step_ids;
  for (const auto& name : affected_sorted) {
    step_ids[name] = ComputeStepId(name, request.base, request.target);
  }

  Plan plan;
  plan.base   = request.base;
  plan.target = request.target;
  plan.steps.reserve(affected_sorted.size());

  for (const auto& name : affected_sorted) {
    const auto& definition = request.models.at(name);

    PlanStep step;
    step.step_id = step_ids.at(name);
    step.model   = name;

    std::tie(step.run_type, step.input_range) = DetermineRunType(definition, request, all_affected, config_);
    std::tie(step.estimated_compute_seconds, step.estimated_cost_usd) = EstimateCost(name, request.run_stats, config_);

    for (const auto& pred : AffectedPredecessors(name, request.dag, all_affected)) {
      step.depends_on.push_back(step_ids.at(pred));
    }

    auto group           = groups.find(name);
    step.parallel_group  = group == groups.end() ? 0 : group->second;
    step.reason          = BuildReason(name, request, directly_changed);
    step.contract_violations = StepViolations(name, request);
    step.diff_detail     = StepDiff(name, request, directly_changed);

    plan.steps.push_back(std::move(step));
  }

  // 6. summary
  auto& summary       = plan.summary;
  summary.total_steps = static_cast<int>(plan.steps.size());

  double total_cost = 0.0;
  for (const auto& step : plan.steps) {
    total_cost += step.estimated_cost_usd;
    summary.contract_violations_count += static_cast<int>(step.contract_violations.size());
    summary.breaking_contract_violations += static_cast<int>(
        std::count_if(step.contract_violations.begin(), step.contract_violations.end(),
                      [](const model::StepViolation& v) { return v.severity == model::ToString(model::Severity::kBreaking); }));
  }
  summary.estimated_cost_usd       = RoundUsd(total_cost);
  summary.models_changed           = affected_sorted;
  summary.cosmetic_changes_skipped = std::vector<std::string>(cosmetic.begin(), cosmetic.end());

  // 7. identity
  plan.plan_id = ComputePlanId(request.base, request.target, plan.steps);

  span.SetAttribute("plan.id", plan.plan_id);
  span.SetAttribute("plan.steps", static_cast<std::int64_t>(summary.total_steps));
  MODELPLAN_LOG_INFO("Plan generated", {StringField("plan_id", plan.plan_id), IntField("steps", summary.total_steps),
                                        DoubleField("estimated_cost_usd", summary.estimated_cost_usd),
                                        IntField("cosmetic_skipped", static_cast<std::int64_t>(cosmetic.size()))});
  return plan;
}

// ------------------------------------------------------------
// Planning primitives
// ------------------------------------------------------------

std::map<std::string, int> AssignParallelGroups(const std::vector<std::string>& affected_sorted,
                                                const graph::DependencyGraph& dag) {
  std::map<std::string, int> groups;
  if (affected_sorted.empty()) {
    return groups;
  }

  const auto subgraph = dag.Subgraph(std::set<std::string>(affected_sorted.begin(), affected_sorted.end()));

  std::vector<std::string> order;
  try {
    order = subgraph.TopologicalSort();
  } catch (const util::CycleError& e) {
    MODELPLAN_LOG_WARN("Cycle detected in affected subgraph; assigning sequential groups",
                       {StringField("error", e.what())});
    for (std::size_t i = 0; i < affected_sorted.size(); ++i) {
      groups[affected_sorted[i]] = static_cast<int>(i);
    }
    return groups;
  }

  std::map<std::string, int> longest_path;
  for (const auto& node : order) {
    int layer = 0;
    for (const auto& pred : subgraph.Predecessors(node)) {
      auto it = longest_path.find(pred);
      if (it != longest_path.end()) {
        layer = std::max(layer, it->second + 1);
      }
    }
    longest_path[node] = layer;
  }

  // Models missing from the DAG stay in layer 0.
  for (const auto& name : affected_sorted) {
    auto it      = longest_path.find(name);
    groups[name] = it == longest_path.end() ? 0 : it->second;
  }
  return groups;
}

DateRange ComputeIncrementalRange(const std::string& model_name, const WatermarkMap& watermarks,
                                  const std::set<std::string>& upstream_affected, int default_lookback_days,
                                  util::Date as_of_date) {
  util::Date start;

  auto own = watermarks.find(model_name);
  if (own != watermarks.end()) {
    start = own->second.range_end;
  } else {
    start = as_of_date.SubtractDays(default_lookback_days);
  }

  // Reprocess at least as far back as any upstream that is being reprocessed.
  for (const auto& upstream : upstream_affected) {
    auto it = watermarks.find(upstream);
    if (it != watermarks.end() && it->second.range_start < start) {
      start = it->second.range_start;
    }
  }

  const auto end = as_of_date;
  if (start > end) {
    start = end;
  }

  return {start, end};
}

double RoundUsd(double value) {
  return std::round(value * 1e6) / 1e6;
}

std::string ComputeStepId(const std::string& model_name, const std::string& base, const std::string& target) {
  return util::Sha256Hex(model_name + ":" + base + ":" + target);
}

std::string ComputePlanId(const std::string& base, const std::string& target, const std::vector<PlanStep>& steps) {
  util::Sha256 hasher;
  hasher.Update(base);
  hasher.Update(target);
  for (const auto& step : steps) {
    hasher.Update(step.step_id);
  }
  return hasher.HexDigest();
}

} // namespace modelplan::planner
