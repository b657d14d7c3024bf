#pragma once

#include <cstdint>

namespace modelplan::simulation {

struct SimulationConfig {
  // Deepest downstream level a traversal may reach before it is treated
  // as a graph-integrity failure. >= 1.
  std::uint32_t max_depth = 100;

  // Throws util::InvalidArgument.
  void Validate() const;
};

} // namespace modelplan::simulation
