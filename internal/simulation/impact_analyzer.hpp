#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/graph/dependency_graph.hpp"
#include "internal/model/model_definition.hpp"
#include "internal/simulation/impact_types.hpp"
#include "internal/simulation/simulation_config.hpp"
#include "internal/sql/sql_toolkit.hpp"

namespace modelplan::simulation {

// name -> upstream model names
using UpstreamAdjacency = std::map<std::string, std::vector<std::string>>;

/*
  What-if impact analysis over the model graph.

  Walks downstream of a hypothetical change breadth first, visiting
  children in name order, and reports which models reference the changed
  columns, which contracts would break, and which models would lose their
  last upstream. Nothing is executed and no input is modified.

  The dependency graph is built once at construction; afterwards the
  analyzer is read-only and the Simulate* calls may run concurrently.
*/
class ImpactAnalyzer {
 public:
  // A null toolkit selects BasicSqlToolkit. Throws util::InvalidArgument
  // on an invalid config.
  ImpactAnalyzer(model::ModelMap models, UpstreamAdjacency dag, SimulationConfig config = {},
                 std::shared_ptr<const sql::SqlToolkit> toolkit = nullptr);

  // Unknown source models yield an empty report with an explanatory
  // summary. Throws util::GraphIntegrityError when a cycle is reachable
  // from the source or the walk goes deeper than max_depth.
  ImpactReport SimulateColumnChange(const std::string& source_model, const std::vector<ColumnChange>& changes) const;

  // Every downstream model is BREAKING; models left without upstream are
  // reported as orphaned. Same failure semantics as SimulateColumnChange.
  ModelRemovalReport SimulateModelRemoval(const std::string& model_name) const;

  ImpactReport SimulateTypeChange(const std::string& source_model, const std::string& column_name,
                                  const std::string& old_type, const std::string& new_type) const;

  const SimulationConfig& config() const {
    return config_;
  }

 private:
  using Visitor = std::function<void(const std::string& model_name, std::uint32_t depth)>;

  // Breadth-first walk below source; each model is visited once, at its
  // shortest distance. Throws util::GraphIntegrityError before visiting
  // anything when the reachable graph has a cycle or is deeper than
  // max_depth.
  void WalkDownstream(const std::string& source, const Visitor& visit) const;

  std::vector<ContractViolation> CheckContracts(const model::ModelDefinition& definition,
                                                const std::vector<ColumnChange>& changes) const;

  std::set<std::string> ReferencedColumns(const model::ModelDefinition& definition) const;

  model::ModelMap                        models_;
  UpstreamAdjacency                      dag_;
  graph::DependencyGraph                 graph_;
  SimulationConfig                       config_;
  std::shared_ptr<const sql::SqlToolkit> toolkit_;
};

// Lower-cased names touched by the changes, including rename targets.
std::set<std::string> ChangedColumnNames(const std::vector<ColumnChange>& changes);

// Severity of merely referencing a changed column (no contract involved).
model::Severity ClassifyChangeSeverity(const std::vector<ColumnChange>& changes);

} // namespace modelplan::simulation
