#include "internal/simulation/impact_analyzer.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using modelplan::model::ColumnContract;
using modelplan::model::ContractMode;
using modelplan::model::ModelDefinition;
using modelplan::model::ModelMap;
using modelplan::model::Severity;
using modelplan::simulation::ChangeAction;
using modelplan::simulation::ColumnChange;
using modelplan::simulation::ImpactAnalyzer;
using modelplan::simulation::ReferenceType;
using modelplan::simulation::SimulationConfig;
using modelplan::simulation::UpstreamAdjacency;
using modelplan::util::GraphIntegrityError;

using Names = std::vector<std::string>;

ModelDefinition MakeModel(const std::string& name, const std::string& sql) {
  ModelDefinition model;
  model.name    = name;
  model.raw_sql = sql;
  return model;
}

/*
  orders ---> revenue ---> exec_report
     |                        ^
     +------> customers ------+
  audit (depends on orders and raw.audit_log)
*/
struct Project {
  ModelMap          models;
  UpstreamAdjacency dag;
};

Project MakeProject() {
  Project project;

  project.models["orders"]    = MakeModel("orders", "SELECT order_id, customer_id, amount, status FROM raw.orders");
  project.models["revenue"]   = MakeModel("revenue", "SELECT order_id, SUM(amount) AS revenue FROM orders GROUP BY order_id");
  project.models["customers"] = MakeModel("customers", "SELECT DISTINCT customer_id FROM orders");
  project.models["exec_report"] =
      MakeModel("exec_report", "SELECT r.revenue, c.customer_id FROM revenue r JOIN customers c ON r.order_id = c.customer_id");
  project.models["audit"] = MakeModel("audit", "SELECT status FROM orders");

  auto& contracted            = project.models["revenue"];
  contracted.contract_mode    = ContractMode::kStrict;
  contracted.contract_columns = {{"amount", "DECIMAL", false}, {"order_id", "BIGINT", false}};

  project.dag["orders"]      = {};
  project.dag["revenue"]     = {"orders"};
  project.dag["customers"]   = {"orders"};
  project.dag["exec_report"] = {"customers", "revenue"};
  project.dag["audit"]       = {"orders", "raw.audit_log"};
  return project;
}

ImpactAnalyzer MakeAnalyzer(SimulationConfig config = {}) {
  auto project = MakeProject();
  return ImpactAnalyzer(project.models, project.dag, config);
}

ColumnChange Change(ChangeAction action, const std::string& column) {
  ColumnChange change;
  change.action      = action;
  change.column_name = column;
  return change;
}

Names ModelNames(const std::vector<modelplan::simulation::AffectedModel>& affected) {
  Names names;
  for (const auto& model : affected) {
    names.push_back(model.model_name);
  }
  return names;
}

void TestUnknownSourceIsSoftFailure() {
  const auto report = MakeAnalyzer().SimulateColumnChange("nonexistent.model", {Change(ChangeAction::kRemove, "x")});
  assert(report.directly_affected.empty());
  assert(report.transitively_affected.empty());
  assert(report.summary == "Model 'nonexistent.model' not found.");

  const auto removal = MakeAnalyzer().SimulateModelRemoval("nonexistent.model");
  assert(removal.directly_affected.empty());
  assert(!removal.summary.empty());
}

void TestRemovingContractedColumnIsBreaking() {
  const auto report = MakeAnalyzer().SimulateColumnChange("orders", {Change(ChangeAction::kRemove, "amount")});

  assert(ModelNames(report.directly_affected) == (Names{"audit", "customers", "revenue"}));
  assert(ModelNames(report.transitively_affected) == (Names{"exec_report"}));

  const auto& revenue = report.directly_affected[2];
  assert(revenue.reference_type == ReferenceType::kDirect);
  assert(revenue.columns_affected == (Names{"amount"}));
  assert(revenue.contract_violations.size() == 1);
  assert(revenue.contract_violations[0].violation_type == "COLUMN_REMOVED");
  assert(revenue.severity == Severity::kBreaking);

  // downstream but not referencing the column
  assert(report.directly_affected[0].severity == Severity::kInfo);
  assert(report.transitively_affected[0].reference_type == ReferenceType::kTransitive);

  assert(report.breaking_count == 1);
  assert(report.warning_count == 0);
  assert(report.contract_violations.size() == 1);
  assert(report.summary ==
         "Simulating REMOVE 'amount' on 'orders': 3 direct and 1 transitive models affected. 1 BREAKING impact(s).");
}

void TestRenameChecksBothNames() {
  ColumnChange rename = Change(ChangeAction::kRename, "status");
  rename.new_name     = "order_status";

  const auto report = MakeAnalyzer().SimulateColumnChange("orders", {rename});
  const auto& audit = report.directly_affected[0];
  assert(audit.model_name == "audit");
  assert(audit.columns_affected == (Names{"status"}));
  assert(audit.contract_violations.empty());
  assert(audit.severity == Severity::kBreaking);
}

void TestTypeChangeSeverityFollowsMatrix() {
  auto analyzer = MakeAnalyzer();

  // contract declares DECIMAL; STRING is not a safe conversion
  auto report = analyzer.SimulateTypeChange("orders", "amount", "DECIMAL", "STRING");
  assert(report.directly_affected[2].contract_violations[0].violation_type == "TYPE_CHANGED");
  assert(report.breaking_count == 1);

  // BIGINT contract accepts BIGINT; referencing models see a warning only
  report = analyzer.SimulateTypeChange("orders", "order_id", "INT", "BIGINT");
  assert(report.breaking_count == 0);
  assert(report.warning_count == 2); // revenue, exec_report
  assert(report.directly_affected[2].contract_violations.empty());
  assert(report.directly_affected[2].severity == Severity::kWarning);

  // narrowing without a contract is still breaking for referencing models
  report = analyzer.SimulateTypeChange("orders", "customer_id", "BIGINT", "INT");
  assert(report.directly_affected[1].model_name == "customers");
  assert(report.directly_affected[1].severity == Severity::kBreaking);
}

void TestAddingColumnHasNoContractImpact() {
  const auto report = MakeAnalyzer().SimulateColumnChange("revenue", {Change(ChangeAction::kAdd, "margin")});
  assert(ModelNames(report.directly_affected) == (Names{"exec_report"}));
  assert(report.breaking_count == 0);
  assert(report.warning_count == 0);
  assert(report.summary.find("1 direct and 0 transitive") != std::string::npos);

  const auto leaf = MakeAnalyzer().SimulateColumnChange("exec_report", {Change(ChangeAction::kAdd, "x")});
  assert(leaf.summary.find("No downstream impact detected.") != std::string::npos);
}

void TestModelRemovalDetectsOrphans() {
  const auto report = MakeAnalyzer().SimulateModelRemoval("orders");

  assert(ModelNames(report.directly_affected) == (Names{"audit", "customers", "revenue"}));
  assert(ModelNames(report.transitively_affected) == (Names{"exec_report"}));
  assert(report.orphaned_models == (Names{"customers", "revenue"}));
  assert(report.breaking_count == 4);
  for (const auto& affected : report.directly_affected) {
    assert(affected.severity == Severity::kBreaking);
  }
  assert(report.summary ==
         "Removing 'orders' would affect 3 direct and 1 transitive models. "
         "2 model(s) would be orphaned: customers, revenue.");
}

void TestCycleFailsLoudly() {
  ModelMap models;
  models["a"] = MakeModel("a", "SELECT id FROM b");
  models["b"] = MakeModel("b", "SELECT id FROM a");

  UpstreamAdjacency dag;
  dag["a"] = {"b"};
  dag["b"] = {"a"};

  SimulationConfig config;
  config.max_depth = 1;
  ImpactAnalyzer analyzer(models, dag, config);

  bool threw = false;
  try {
    (void)analyzer.SimulateModelRemoval("a");
  } catch (const GraphIntegrityError& e) {
    threw = true;
    assert(e.model_name() == "a");
    assert(e.max_depth() == 1);
  }
  assert(threw && "traversal beyond max_depth must raise");

  threw = false;
  try {
    (void)analyzer.SimulateColumnChange("a", {Change(ChangeAction::kRemove, "id")});
  } catch (const GraphIntegrityError&) {
    threw = true;
  }
  assert(threw);
}

void TestCycleThroughSourceFailsWithDefaultDepth() {
  ModelMap models;
  models["a"] = MakeModel("a", "SELECT id FROM b");
  models["b"] = MakeModel("b", "SELECT id FROM a");

  UpstreamAdjacency dag;
  dag["a"] = {"b"};
  dag["b"] = {"a"};

  ImpactAnalyzer analyzer(models, dag);

  bool threw = false;
  try {
    (void)analyzer.SimulateModelRemoval("a");
  } catch (const GraphIntegrityError& e) {
    threw = true;
    assert(e.model_name() == "a");
    assert(e.max_depth() == SimulationConfig{}.max_depth);
  }
  assert(threw && "a model must not be reported as affected by its own removal");

  threw = false;
  try {
    (void)analyzer.SimulateColumnChange("b", {Change(ChangeAction::kRemove, "id")});
  } catch (const GraphIntegrityError& e) {
    threw = true;
    assert(e.model_name() == "b");
  }
  assert(threw);
}

void TestCycleBelowSourceFails() {
  ModelMap models;
  models["src"] = MakeModel("src", "SELECT id FROM raw.src");
  models["x"]   = MakeModel("x", "SELECT id FROM src JOIN y USING (id)");
  models["y"]   = MakeModel("y", "SELECT id FROM x");

  UpstreamAdjacency dag;
  dag["src"] = {};
  dag["x"]   = {"src", "y"};
  dag["y"]   = {"x"};

  ImpactAnalyzer analyzer(models, dag);

  bool threw = false;
  try {
    (void)analyzer.SimulateColumnChange("src", {Change(ChangeAction::kRemove, "id")});
  } catch (const GraphIntegrityError& e) {
    threw = true;
    assert(e.model_name() == "x");
  }
  assert(threw);
}

void TestSharedDescendantIsNotMistakenForCycle() {
  // s ---> a ---> d, and s ---> d directly
  ModelMap models;
  models["s"] = MakeModel("s", "SELECT id FROM raw.s");
  models["a"] = MakeModel("a", "SELECT id FROM s");
  models["d"] = MakeModel("d", "SELECT a.id FROM a JOIN s ON a.id = s.id");

  UpstreamAdjacency dag;
  dag["s"] = {};
  dag["a"] = {"s"};
  dag["d"] = {"a", "s"};

  SimulationConfig config;
  config.max_depth = 1;
  ImpactAnalyzer analyzer(models, dag, config);

  const auto report = analyzer.SimulateModelRemoval("s");
  assert(ModelNames(report.directly_affected) == (Names{"a", "d"}));
  assert(report.transitively_affected.empty());
  assert(report.orphaned_models == (Names{"a"}));
}

void TestChainDeeperThanMaxDepthFails() {
  ModelMap models;
  models["a"] = MakeModel("a", "SELECT id FROM raw.a");
  models["b"] = MakeModel("b", "SELECT id FROM a");
  models["c"] = MakeModel("c", "SELECT id FROM b");

  UpstreamAdjacency dag;
  dag["a"] = {};
  dag["b"] = {"a"};
  dag["c"] = {"b"};

  SimulationConfig config;
  config.max_depth = 1;
  ImpactAnalyzer analyzer(models, dag, config);

  bool threw = false;
  try {
    (void)analyzer.SimulateModelRemoval("a");
  } catch (const GraphIntegrityError& e) {
    threw = true;
    assert(e.model_name() == "c");
    assert(e.max_depth() == 1);
  }
  assert(threw);
}

void TestKeywordNamedColumnsAreReferenced() {
  ModelMap models;
  models["orders"] = MakeModel("orders", "SELECT date, year, amount FROM raw.orders");
  models["daily"]  = MakeModel("daily", "SELECT date, SUM(amount) AS total FROM orders GROUP BY date");

  UpstreamAdjacency dag;
  dag["orders"] = {};
  dag["daily"]  = {"orders"};

  ImpactAnalyzer analyzer(models, dag);

  const auto report = analyzer.SimulateColumnChange("orders", {Change(ChangeAction::kRemove, "date")});
  assert(report.directly_affected.size() == 1);

  const auto& daily = report.directly_affected.front();
  assert(daily.model_name == "daily");
  assert(daily.columns_affected == (Names{"date"}));
  assert(daily.severity == Severity::kBreaking);
  assert(report.breaking_count == 1);
}

void TestInvalidConfigIsRejected() {
  SimulationConfig config;
  config.max_depth = 0;

  bool threw = false;
  try {
    MakeAnalyzer(config);
  } catch (const modelplan::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestUnknownSourceIsSoftFailure();
  TestRemovingContractedColumnIsBreaking();
  TestRenameChecksBothNames();
  TestTypeChangeSeverityFollowsMatrix();
  TestAddingColumnHasNoContractImpact();
  TestModelRemovalDetectsOrphans();
  TestCycleFailsLoudly();
  TestCycleThroughSourceFailsWithDefaultDepth();
  TestCycleBelowSourceFails();
  TestSharedDescendantIsNotMistakenForCycle();
  TestChainDeeperThanMaxDepthFails();
  TestKeywordNamedColumnsAreReferenced();
  TestInvalidConfigIsRejected();

  std::cout << "modelplan_unit_impact_analyzer: pass\n";
  return 0;
}
