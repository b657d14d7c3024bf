#include "internal/planner/plan_serializer.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using modelplan::model::DateRange;
using modelplan::model::Plan;
using modelplan::model::PlanStep;
using modelplan::model::RunType;
using modelplan::planner::DeserializePlan;
using modelplan::planner::SerializePlan;
using modelplan::planner::ValidatePlanJson;
using modelplan::util::Date;
using modelplan::util::ParseError;

Plan SamplePlan() {
  Plan plan;
  plan.plan_id = "plan-1";
  plan.base    = "base";
  plan.target  = "target";

  PlanStep full;
  full.step_id            = "step-orders";
  full.model              = "orders";
  full.run_type           = RunType::kFullRefresh;
  full.reason             = "SQL logic changed";
  full.estimated_cost_usd = 0.21;
  full.diff_detail        = modelplan::model::StepDiffDetail{"MODIFIED", {"amount"}, {}, {}};

  PlanStep incremental;
  incremental.step_id     = "step-revenue";
  incremental.model       = "revenue";
  incremental.run_type    = RunType::kIncremental;
  incremental.input_range = DateRange{Date::Parse("2024-01-01"), Date::Parse("2024-01-31")};
  incremental.depends_on  = {"step-orders"};
  incremental.parallel_group = 1;
  incremental.reason      = "downstream of orders";
  incremental.contract_violations.push_back(
      {"amount", "TYPE_CHANGED", "BREAKING", "DECIMAL", "STRING", "type changed"});

  plan.steps = {full, incremental};

  plan.summary.total_steps                  = 2;
  plan.summary.estimated_cost_usd           = 0.42;
  plan.summary.models_changed               = {"orders", "revenue"};
  plan.summary.contract_violations_count    = 1;
  plan.summary.breaking_contract_violations = 1;
  return plan;
}

void TestSerializedShape() {
  const auto json = SerializePlan(SamplePlan());

  // proto field names, defaults printed, dates as ISO strings
  assert(json.find("\"plan_id\": \"plan-1\"") != std::string::npos);
  assert(json.find("\"run_type\": \"INCREMENTAL\"") != std::string::npos);
  assert(json.find("\"start\": \"2024-01-01\"") != std::string::npos);
  assert(json.find("\"cosmetic_changes_skipped\": []") != std::string::npos);
  assert(json.find("\"parallel_group\": 0") != std::string::npos);

  // keys follow field order
  assert(json.find("\"plan_id\"") < json.find("\"summary\""));
  assert(json.find("\"summary\"") < json.find("\"steps\""));

  assert(SerializePlan(SamplePlan()) == json);
}

void TestDeserializeRestoresPlan() {
  const auto plan = DeserializePlan(SerializePlan(SamplePlan()));

  assert(plan.plan_id == "plan-1");
  assert(plan.steps.size() == 2);

  const auto* full = plan.FindStep("orders");
  assert(full->run_type == RunType::kFullRefresh);
  assert(!full->input_range);
  assert(full->diff_detail && full->diff_detail->columns_added.size() == 1);

  const auto* incremental = plan.FindStep("revenue");
  assert(incremental->run_type == RunType::kIncremental);
  assert(incremental->input_range->end.ToString() == "2024-01-31");
  assert(incremental->depends_on.size() == 1);
  assert(incremental->contract_violations[0].violation_type == "TYPE_CHANGED");
  assert(!incremental->diff_detail);
  assert(plan.summary.breaking_contract_violations == 1);
}

void TestMalformedJsonThrows() {
  bool threw = false;
  try {
    (void)DeserializePlan("{\"plan_id\": ");
  } catch (const ParseError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)DeserializePlan("{\"plan_id\": \"p\", \"unexpected\": 1}");
  } catch (const ParseError&) {
    threw = true;
  }
  assert(threw && "unknown keys must be rejected");
}

void TestValidateReportsEveryProblem() {
  assert(ValidatePlanJson(SerializePlan(SamplePlan())).empty());
  assert(ValidatePlanJson("not json").size() == 1);

  const std::string bad = R"({
    "plan_id": "p",
    "summary": {"total_steps": 1},
    "steps": [{
      "step_id": "s",
      "model": "m",
      "run_type": "SOMETIMES",
      "input_range": {"start": "2024-02-01", "end": "2024-01-01"}
    }]
  })";

  const auto errors = ValidatePlanJson(bad);
  assert(errors.size() == 2);
  assert(errors[0].find("steps.0.run_type") == 0);
  assert(errors[1].find("steps.0.input_range") == 0);

  bool threw = false;
  try {
    (void)DeserializePlan(bad);
  } catch (const ParseError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSerializedShape();
  TestDeserializeRestoresPlan();
  TestMalformedJsonThrows();
  TestValidateReportsEveryProblem();

  std::cout << "modelplan_unit_plan_serializer: pass\n";
  return 0;
}
