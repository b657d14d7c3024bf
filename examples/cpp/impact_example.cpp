#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/graph/dependency_graph.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/simulation/impact_analyzer.hpp"
#include "internal/util/errors.hpp"

namespace {

using modelplan::model::ModelDefinition;
using modelplan::simulation::ChangeAction;
using modelplan::simulation::ColumnChange;

void PrintAffected(const std::string& label, const std::vector<modelplan::simulation::AffectedModel>& models) {
  for (const auto& affected : models) {
    std::cout << "  " << label << ' ' << affected.model_name << " [" << modelplan::model::ToString(affected.severity)
              << "]";
    for (const auto& column : affected.columns_affected) {
      std::cout << ' ' << column;
    }
    std::cout << '\n';
  }
}

} // namespace

int main(int argc, char** argv) {
  // Optional YAML config path; defaults apply otherwise.
  modelplan::runtime::config::RuntimeConfig runtime_config;
  modelplan::simulation::SimulationConfig   simulation_config;
  try {
    if (argc > 1) {
      runtime_config = modelplan::config::ConfigLoader::LoadFromYaml(argv[1]);
    }
    simulation_config = modelplan::config::ToSimulationConfig(runtime_config.simulation());
    modelplan::observability::InitializeLogging(runtime_config.logging());
  } catch (const std::exception& e) {
    std::cerr << "Failed to load config: " << e.what() << '\n';
    return 1;
  }
  modelplan::observability::InitializeTracing(runtime_config.observability());

  modelplan::model::ModelMap models;

  auto add = [&](const std::string& name, const std::string& sql, std::vector<std::string> deps) {
    ModelDefinition model;
    model.name         = name;
    model.raw_sql      = sql;
    model.dependencies = std::move(deps);
    models[name]       = std::move(model);
  };

  add("orders", "SELECT order_id, customer_id, amount FROM raw.orders", {});
  add("revenue", "SELECT customer_id, SUM(amount) AS revenue FROM orders GROUP BY customer_id", {"orders"});
  add("churn", "SELECT customer_id FROM revenue WHERE revenue < 10", {"revenue"});

  auto& revenue         = models["revenue"];
  revenue.contract_mode = modelplan::model::ContractMode::kStrict;
  revenue.contract_columns = {{"customer_id", "BIGINT", false}, {"amount", "DECIMAL", true}};

  const auto dag = modelplan::graph::BuildDependencyGraph(models);
  const modelplan::simulation::ImpactAnalyzer analyzer(
      models, dag.ToUpstreamAdjacency(), simulation_config);

  try {
    ColumnChange drop;
    drop.action      = ChangeAction::kRemove;
    drop.column_name = "amount";

    auto report = analyzer.SimulateColumnChange("orders", {drop});
    std::cout << report.summary << '\n';
    PrintAffected("direct", report.directly_affected);
    PrintAffected("transitive", report.transitively_affected);
    for (const auto& violation : report.contract_violations) {
      std::cout << "  contract: " << violation.message << '\n';
    }

    report = analyzer.SimulateTypeChange("orders", "customer_id", "BIGINT", "STRING");
    std::cout << report.summary << '\n';

    const auto removal = analyzer.SimulateModelRemoval("orders");
    std::cout << removal.summary << '\n';
  } catch (const modelplan::util::GraphIntegrityError& e) {
    std::cerr << "Graph integrity error at '" << e.model_name() << "': " << e.what() << '\n';
    modelplan::observability::ShutdownLogging();
    modelplan::observability::ShutdownTracing();
    return 1;
  }

  modelplan::observability::ShutdownLogging();
  modelplan::observability::ShutdownTracing();
  return 0;
}
