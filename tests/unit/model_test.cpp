#include <cassert>
#include <iostream>

#include "internal/model/diff.hpp"
#include "internal/model/model_definition.hpp"
#include "internal/model/plan.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace modelplan::model;
using modelplan::util::InvalidArgument;

template <typename Fn>
bool ThrowsInvalidArgument(Fn fn) {
  try {
    fn();
  } catch (const InvalidArgument&) {
    return true;
  }
  return false;
}

void TestEnumTokens() {
  assert(ParseModelKind("INCREMENTAL_BY_TIME_RANGE") == ModelKind::kIncrementalByTimeRange);
  assert(ToString(ModelKind::kMergeByKey) == "MERGE_BY_KEY");
  assert(ParseContractMode("WARN") == ContractMode::kWarn);
  assert(ParseRunType("INCREMENTAL") == RunType::kIncremental);
  assert(ToString(ChangeType::kCosmeticOnly) == "COSMETIC_ONLY");

  assert(ThrowsInvalidArgument([] { ParseModelKind("SNAPSHOT"); }));
  assert(ThrowsInvalidArgument([] { ParseContractMode("strict"); }));
  assert(ThrowsInvalidArgument([] { ParseRunType(""); }));
}

void TestEffectiveSqlPrefersCleanSql() {
  ModelDefinition model;
  model.raw_sql = "-- header\nSELECT 1";
  assert(model.EffectiveSql() == model.raw_sql);

  model.clean_sql = "SELECT 1";
  assert(model.EffectiveSql() == "SELECT 1");
}

void TestDiffSetsMustBeDisjoint() {
  DiffResult diff;
  diff.added_models    = {"a"};
  diff.modified_models = {"b"};
  diff.removed_models  = {"c"};
  diff.Validate();
  assert(diff.IsAdded("a") && !diff.IsAdded("b"));
  assert(diff.IsModified("b"));

  diff.removed_models.insert("b");
  assert(ThrowsInvalidArgument([&] { diff.Validate(); }));
}

} // namespace

int main() {
  TestEnumTokens();
  TestEffectiveSqlPrefersCleanSql();
  TestDiffSetsMustBeDisjoint();

  std::cout << "modelplan_unit_model: pass\n";
  return 0;
}
