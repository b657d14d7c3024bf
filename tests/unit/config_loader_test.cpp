#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using modelplan::config::ConfigLoader;
using modelplan::util::InvalidArgument;
using modelplan::util::ParseError;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "modelplan_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full", R"(planner:
  default_lookback_days: 7
  cost_per_compute_second: 0.0012
  skip_cosmetic_changes: false
  default_estimated_seconds: 120
simulation:
  max_depth: 25
logging:
  level: "debug"
  pattern: "[%l] %v"
  sink: "stdout"
observability:
  tracing_enabled: false
  service_name: "modelplan-ci"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().sink() == "stdout");
  assert(config.observability().service_name() == "modelplan-ci");

  const auto planner = modelplan::config::ToPlannerConfig(config.planner());
  assert(planner.default_lookback_days == 7);
  assert(planner.cost_per_compute_second == 0.0012);
  assert(!planner.skip_cosmetic_changes);
  assert(planner.default_estimated_seconds == 120.0);

  const auto simulation = modelplan::config::ToSimulationConfig(config.simulation());
  assert(simulation.max_depth == 25);
}

void TestOmittedFieldsKeepDefaults() {
  const auto config = ConfigLoader::ParseYaml("planner:\n  default_lookback_days: 14\n");

  const auto planner = modelplan::config::ToPlannerConfig(config.planner());
  assert(planner.default_lookback_days == 14);
  assert(planner.cost_per_compute_second == 0.0007);
  assert(planner.skip_cosmetic_changes);
  assert(planner.default_estimated_seconds == 300.0);

  assert(modelplan::config::ToSimulationConfig(config.simulation()).max_depth == 100);
  assert(modelplan::config::ToPlannerConfig(ConfigLoader::ParseYaml("").planner()).default_lookback_days == 30);
}

void TestQuotedScalarsStayStrings() {
  const auto config = ConfigLoader::ParseYaml("logging:\n  level: \"true\"\n  pattern: \"%v\"\n");
  assert(config.logging().level() == "true");
  assert(config.logging().pattern() == "%v");
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::ParseYaml("planner:\n  lookback: 3\n");
  } catch (const ParseError&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsParseError() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/modelplan.yaml");
  } catch (const ParseError&) {
    threw = true;
  }
  assert(threw);
}

void TestOutOfRangeValuesAreRejected() {
  const auto config = ConfigLoader::ParseYaml("planner:\n  default_lookback_days: 0\nsimulation:\n  max_depth: 0\n");

  bool threw = false;
  try {
    (void)modelplan::config::ToPlannerConfig(config.planner());
  } catch (const InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)modelplan::config::ToSimulationConfig(config.simulation());
  } catch (const InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestOmittedFieldsKeepDefaults();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsParseError();
  TestOutOfRangeValuesAreRejected();

  std::cout << "modelplan_unit_config_loader: pass\n";
  return 0;
}
