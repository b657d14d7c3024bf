#include "plan_serializer.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace modelplan::planner {

namespace {

using ProtoPlan = modelplan::plan::Plan;

template <typename Container>
void CopyStrings(const Container& from, google::protobuf::RepeatedPtrField<std::string>* to) {
  for (const auto& item : from) {
    *to->Add() = item;
  }
}

std::vector<std::string> ToVector(const google::protobuf::RepeatedPtrField<std::string>& from) {
  return std::vector<std::string>(from.begin(), from.end());
}

util::Date ParseDateField(const std::string& text, const std::string& where) {
  try {
    return util::Date::Parse(text);
  } catch (const util::InvalidArgument& e) {
    throw util::ParseError(where + ": " + e.what());
  }
}

// Collects every structural problem instead of stopping at the first one.
std::vector<std::string> CheckProto(const ProtoPlan& proto) {
  std::vector<std::string> errors;

  if (proto.plan_id().empty()) {
    errors.push_back("plan_id: must not be empty");
  }

  for (int i = 0; i < proto.steps_size(); ++i) {
    const auto&       step  = proto.steps(i);
    const std::string where = "steps." + std::to_string(i);

    if (step.step_id().empty()) {
      errors.push_back(where + ".step_id: must not be empty");
    }
    if (step.model().empty()) {
      errors.push_back(where + ".model: must not be empty");
    }

    try {
      model::ParseRunType(step.run_type());
    } catch (const util::InvalidArgument& e) {
      errors.push_back(where + ".run_type: " + e.what());
    }

    if (step.parallel_group() < 0) {
      errors.push_back(where + ".parallel_group: must be >= 0");
    }

    if (step.has_input_range()) {
      try {
        auto start = util::Date::Parse(step.input_range().start());
        auto end   = util::Date::Parse(step.input_range().end());
        if (start > end) {
          errors.push_back(where + ".input_range: start is after end");
        }
      } catch (const util::InvalidArgument& e) {
        errors.push_back(where + ".input_range: " + e.what());
      }
    }
  }

  if (proto.summary().total_steps() != proto.steps_size()) {
    errors.push_back("summary.total_steps: does not match the number of steps");
  }

  return errors;
}

ProtoPlan ParseJson(const std::string& json) {
  ProtoPlan proto;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &proto, options);
  if (!status.ok()) {
    throw util::ParseError("Invalid plan JSON: " + std::string(status.message()));
  }
  return proto;
}

} // namespace

// ------------------------------------------------------------
// Message conversion
// ------------------------------------------------------------

ProtoPlan ToProto(const model::Plan& plan) {
  ProtoPlan proto;
  proto.set_plan_id(plan.plan_id);
  proto.set_base(plan.base);
  proto.set_target(plan.target);

  auto* summary = proto.mutable_summary();
  summary->set_total_steps(plan.summary.total_steps);
  summary->set_estimated_cost_usd(plan.summary.estimated_cost_usd);
  CopyStrings(plan.summary.models_changed, summary->mutable_models_changed());
  CopyStrings(plan.summary.cosmetic_changes_skipped, summary->mutable_cosmetic_changes_skipped());
  summary->set_contract_violations_count(plan.summary.contract_violations_count);
  summary->set_breaking_contract_violations(plan.summary.breaking_contract_violations);

  for (const auto& step : plan.steps) {
    auto* out = proto.add_steps();
    out->set_step_id(step.step_id);
    out->set_model(step.model);
    out->set_run_type(std::string(model::ToString(step.run_type)));

    if (step.input_range) {
      out->mutable_input_range()->set_start(step.input_range->start.ToString());
      out->mutable_input_range()->set_end(step.input_range->end.ToString());
    }

    CopyStrings(step.depends_on, out->mutable_depends_on());
    out->set_parallel_group(step.parallel_group);
    out->set_reason(step.reason);
    out->set_estimated_compute_seconds(step.estimated_compute_seconds);
    out->set_estimated_cost_usd(step.estimated_cost_usd);

    for (const auto& v : step.contract_violations) {
      auto* violation = out->add_contract_violations();
      violation->set_column_name(v.column_name);
      violation->set_violation_type(v.violation_type);
      violation->set_severity(v.severity);
      violation->set_expected(v.expected);
      violation->set_actual(v.actual);
      violation->set_message(v.message);
    }

    if (step.diff_detail) {
      auto* detail = out->mutable_diff_detail();
      detail->set_change_type(step.diff_detail->change_type);
      CopyStrings(step.diff_detail->columns_added, detail->mutable_columns_added());
      CopyStrings(step.diff_detail->columns_removed, detail->mutable_columns_removed());
      CopyStrings(step.diff_detail->columns_modified, detail->mutable_columns_modified());
    }
  }

  return proto;
}

model::Plan FromProto(const ProtoPlan& proto) {
  auto errors = CheckProto(proto);
  if (!errors.empty()) {
    throw util::ParseError("Invalid plan: " + errors.front());
  }

  model::Plan plan;
  plan.plan_id = proto.plan_id();
  plan.base    = proto.base();
  plan.target  = proto.target();

  const auto& summary                       = proto.summary();
  plan.summary.total_steps                  = summary.total_steps();
  plan.summary.estimated_cost_usd           = summary.estimated_cost_usd();
  plan.summary.models_changed               = ToVector(summary.models_changed());
  plan.summary.cosmetic_changes_skipped     = ToVector(summary.cosmetic_changes_skipped());
  plan.summary.contract_violations_count    = summary.contract_violations_count();
  plan.summary.breaking_contract_violations = summary.breaking_contract_violations();

  plan.steps.reserve(proto.steps_size());
  for (const auto& in : proto.steps()) {
    model::PlanStep step;
    step.step_id  = in.step_id();
    step.model    = in.model();
    step.run_type = model::ParseRunType(in.run_type());

    if (in.has_input_range()) {
      step.input_range = model::DateRange{ParseDateField(in.input_range().start(), step.model),
                                          ParseDateField(in.input_range().end(), step.model)};
    }

    step.depends_on                = ToVector(in.depends_on());
    step.parallel_group            = in.parallel_group();
    step.reason                    = in.reason();
    step.estimated_compute_seconds = in.estimated_compute_seconds();
    step.estimated_cost_usd        = in.estimated_cost_usd();

    for (const auto& v : in.contract_violations()) {
      step.contract_violations.push_back(
          {v.column_name(), v.violation_type(), v.severity(), v.expected(), v.actual(), v.message()});
    }

    if (in.has_diff_detail()) {
      model::StepDiffDetail detail;
      detail.change_type      = in.diff_detail().change_type();
      detail.columns_added    = ToVector(in.diff_detail().columns_added());
      detail.columns_removed  = ToVector(in.diff_detail().columns_removed());
      detail.columns_modified = ToVector(in.diff_detail().columns_modified());
      step.diff_detail        = std::move(detail);
    }

    plan.steps.push_back(std::move(step));
  }

  return plan;
}

// ------------------------------------------------------------
// JSON
// ------------------------------------------------------------

std::string SerializePlan(const model::Plan& plan) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToProto(plan), &json, options);
  if (!status.ok()) {
    throw util::ParseError("Failed to serialize plan: " + std::string(status.message()));
  }
  return json;
}

model::Plan DeserializePlan(const std::string& json) {
  return FromProto(ParseJson(json));
}

std::vector<std::string> ValidatePlanJson(const std::string& json) {
  ProtoPlan proto;
  try {
    proto = ParseJson(json);
  } catch (const util::ParseError& e) {
    return {e.what()};
  }
  return CheckProto(proto);
}

} // namespace modelplan::planner
