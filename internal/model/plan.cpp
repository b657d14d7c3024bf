#include "plan.hpp"

#include "internal/util/errors.hpp"

namespace modelplan::model {

std::string_view ToString(RunType type) {
  switch (type) {
    case RunType::kFullRefresh:
      return "FULL_REFRESH";
    case RunType::kIncremental:
      return "INCREMENTAL";
  }
  return "FULL_REFRESH";
}

RunType ParseRunType(std::string_view text) {
  if (text == "FULL_REFRESH")
    return RunType::kFullRefresh;
  if (text == "INCREMENTAL")
    return RunType::kIncremental;

  throw util::InvalidArgument("unknown run type: " + std::string(text));
}

const PlanStep* Plan::FindStep(std::string_view model_name) const {
  for (const auto& step : steps) {
    if (step.model == model_name) {
      return &step;
    }
  }
  return nullptr;
}

} // namespace modelplan::model
