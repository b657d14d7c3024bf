#include "simulation_config.hpp"

#include "internal/util/errors.hpp"

namespace modelplan::simulation {

void SimulationConfig::Validate() const {
  if (max_depth < 1) {
    throw util::InvalidArgument("simulation config: max_depth must be >= 1");
  }
}

} // namespace modelplan::simulation
