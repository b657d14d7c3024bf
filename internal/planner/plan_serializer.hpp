#pragma once

#include <string>
#include <vector>

#include "internal/model/plan.hpp"
#include "plan/plan.pb.h"

namespace modelplan::planner {

/*
  Plan <-> JSON.

  Goes through the modelplan.plan.Plan message: keys appear in field
  order, default values are printed, and the planner already fills every
  repeated field in sorted order, so equal plans give equal bytes.
*/

modelplan::plan::Plan ToProto(const model::Plan& plan);

// Throws util::ParseError on a structurally invalid message.
model::Plan FromProto(const modelplan::plan::Plan& proto);

std::string SerializePlan(const model::Plan& plan);

// Throws util::ParseError.
model::Plan DeserializePlan(const std::string& json);

// Empty when the document is a valid plan.
std::vector<std::string> ValidatePlanJson(const std::string& json);

} // namespace modelplan::planner
