#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/planner/planner_config.hpp"
#include "internal/simulation/simulation_config.hpp"

namespace modelplan::config {

/*
  Loads RuntimeConfig from a YAML file or string.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Throws util::ParseError.
*/
class ConfigLoader {
 public:
  static modelplan::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static modelplan::runtime::config::RuntimeConfig ParseYaml(const std::string& yaml_text);
};

// Unset fields keep the struct defaults. Throw util::InvalidArgument on
// out-of-range values.
planner::PlannerConfig       ToPlannerConfig(const modelplan::runtime::config::PlannerConfig& proto);
simulation::SimulationConfig ToSimulationConfig(const modelplan::runtime::config::SimulationConfig& proto);

} // namespace modelplan::config
