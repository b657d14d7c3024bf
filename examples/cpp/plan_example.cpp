#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/graph/dependency_graph.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/planner/interval_planner.hpp"
#include "internal/planner/plan_serializer.hpp"
#include "internal/util/errors.hpp"

namespace {

using modelplan::model::ModelDefinition;
using modelplan::model::ModelKind;

ModelDefinition MakeModel(const std::string& name, ModelKind kind, const std::string& sql,
                          std::vector<std::string> dependencies = {}) {
  ModelDefinition model;
  model.name         = name;
  model.kind         = kind;
  model.raw_sql      = sql;
  model.dependencies = std::move(dependencies);
  return model;
}

} // namespace

int main(int argc, char** argv) {
  // Optional YAML config path; defaults apply otherwise.
  modelplan::runtime::config::RuntimeConfig runtime_config;
  try {
    if (argc > 1) {
      runtime_config = modelplan::config::ConfigLoader::LoadFromYaml(argv[1]);
    }
    modelplan::observability::InitializeLogging(runtime_config.logging());
  } catch (const std::exception& e) {
    std::cerr << "Failed to load config: " << e.what() << '\n';
    return 1;
  }
  modelplan::observability::InitializeTracing(runtime_config.observability());

  modelplan::planner::PlanRequest request;
  request.base       = "main@3f2a1c0";
  request.target     = "feature@9b41d77";
  request.as_of_date = modelplan::util::Date::Parse("2024-06-30");

  auto add = [&](ModelDefinition model) { request.models[model.name] = std::move(model); };
  add(MakeModel("staging.orders", ModelKind::kIncrementalByTimeRange,
                "SELECT order_id, customer_id, amount, order_date FROM raw.orders"));
  add(MakeModel("staging.customers", ModelKind::kFullRefresh, "SELECT customer_id, region FROM raw.customers"));
  add(MakeModel("analytics.daily_revenue", ModelKind::kAppendOnly,
                "SELECT order_date, SUM(amount) AS revenue FROM staging.orders GROUP BY order_date",
                {"staging.orders"}));
  add(MakeModel("analytics.customer_ltv", ModelKind::kMergeByKey,
                "SELECT c.customer_id, SUM(o.amount) AS ltv FROM staging.orders o "
                "JOIN staging.customers c ON o.customer_id = c.customer_id GROUP BY c.customer_id",
                {"staging.customers", "staging.orders"}));

  request.dag                  = modelplan::graph::BuildDependencyGraph(request.models);
  request.diff.modified_models = {"staging.orders", "staging.customers"};

  // staging.customers only changed formatting
  request.base_sql = modelplan::planner::SqlByModel{
      {"staging.orders", "SELECT order_id, amount, order_date FROM raw.orders"},
      {"staging.customers", "select customer_id, region\nfrom raw.customers"},
  };

  request.watermarks["staging.orders"]          = {modelplan::util::Date::Parse("2024-01-01"),
                                                   modelplan::util::Date::Parse("2024-06-29")};
  request.watermarks["analytics.daily_revenue"] = {modelplan::util::Date::Parse("2024-03-01"),
                                                   modelplan::util::Date::Parse("2024-06-29")};
  request.run_stats["analytics.customer_ltv"].avg_runtime_seconds = 1250.0;

  try {
    const modelplan::planner::IntervalPlanner planner(
        modelplan::config::ToPlannerConfig(runtime_config.planner()));

    const auto plan = planner.GeneratePlan(request);
    std::cout << modelplan::planner::SerializePlan(plan) << '\n';
  } catch (const modelplan::util::InvalidArgument& e) {
    std::cerr << "Planning failed: " << e.what() << '\n';
    modelplan::observability::ShutdownLogging();
    modelplan::observability::ShutdownTracing();
    return 1;
  }

  modelplan::observability::ShutdownLogging();
  modelplan::observability::ShutdownTracing();
  return 0;
}
