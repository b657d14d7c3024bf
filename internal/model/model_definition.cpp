#include "model_definition.hpp"

#include "internal/util/errors.hpp"

namespace modelplan::model {

std::string_view ToString(ModelKind kind) {
  switch (kind) {
    case ModelKind::kFullRefresh:
      return "FULL_REFRESH";
    case ModelKind::kIncrementalByTimeRange:
      return "INCREMENTAL_BY_TIME_RANGE";
    case ModelKind::kAppendOnly:
      return "APPEND_ONLY";
    case ModelKind::kMergeByKey:
      return "MERGE_BY_KEY";
  }
  return "UNKNOWN";
}

std::string_view ToString(ContractMode mode) {
  switch (mode) {
    case ContractMode::kDisabled:
      return "DISABLED";
    case ContractMode::kWarn:
      return "WARN";
    case ContractMode::kStrict:
      return "STRICT";
  }
  return "UNKNOWN";
}

ModelKind ParseModelKind(std::string_view text) {
  if (text == "FULL_REFRESH")
    return ModelKind::kFullRefresh;
  if (text == "INCREMENTAL_BY_TIME_RANGE")
    return ModelKind::kIncrementalByTimeRange;
  if (text == "APPEND_ONLY")
    return ModelKind::kAppendOnly;
  if (text == "MERGE_BY_KEY")
    return ModelKind::kMergeByKey;

  throw util::InvalidArgument("unknown model kind: " + std::string(text));
}

ContractMode ParseContractMode(std::string_view text) {
  if (text == "DISABLED")
    return ContractMode::kDisabled;
  if (text == "WARN")
    return ContractMode::kWarn;
  if (text == "STRICT")
    return ContractMode::kStrict;

  throw util::InvalidArgument("unknown contract mode: " + std::string(text));
}

} // namespace modelplan::model
