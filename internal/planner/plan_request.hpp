#pragma once

#include <map>
#include <optional>
#include <string>

#include "internal/contracts/schema_validator.hpp"
#include "internal/graph/dependency_graph.hpp"
#include "internal/model/diff.hpp"
#include "internal/model/model_definition.hpp"
#include "internal/util/date.hpp"

namespace modelplan::planner {

// Inclusive date span already materialized for an incremental model.
struct Watermark {
  util::Date range_start;
  util::Date range_end;
};

struct RunStats {
  // Unset when the model has history but no runtime average yet.
  std::optional<double> avg_runtime_seconds;
};

using WatermarkMap = std::map<std::string, Watermark>;
using RunStatsMap  = std::map<std::string, RunStats>;
using SqlByModel   = std::map<std::string, std::string>;

/*
  Everything one planning invocation reads.

  The caller assembles this from the loaders and state stores (reading
  watermarks and run statistics consistently) and the planner treats it
  as an immutable snapshot.
*/
struct PlanRequest {
  model::ModelMap        models; // target snapshot
  model::DiffResult      diff;
  graph::DependencyGraph dag;
  WatermarkMap           watermarks;
  RunStatsMap            run_stats;

  std::string base;   // base snapshot id, e.g. a commit ref
  std::string target; // target snapshot id

  // Reference date for all date arithmetic. Required.
  std::optional<util::Date> as_of_date;

  // Base-snapshot SQL per model; enables cosmetic-change filtering.
  std::optional<SqlByModel> base_sql;

  std::optional<contracts::ContractValidationResult> contract_results;
  std::optional<model::AstDiffMap>                   ast_diffs;
};

} // namespace modelplan::planner
