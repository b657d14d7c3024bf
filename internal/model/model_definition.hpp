#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace modelplan::model {

/*
  Incremental strategy of a SQL model.

  Values outside this list can arrive from newer loaders; the planner
  treats anything it does not recognize as a full refresh.
*/
enum class ModelKind {
  kFullRefresh,
  kIncrementalByTimeRange,
  kAppendOnly,
  kMergeByKey,
};

enum class ContractMode {
  kDisabled,
  kWarn,
  kStrict,
};

struct ColumnContract {
  std::string name;
  std::string data_type; // STRING, INT, BIGINT, TIMESTAMP, ...
  bool        nullable = true;
};

/*
  A named SQL transformation unit, produced by the loading layer.

  Read-only once handed to the planner or the impact analyzer.
*/
struct ModelDefinition {
  std::string name; // canonical dotted name, e.g. analytics.orders_daily
  ModelKind   kind = ModelKind::kFullRefresh;

  std::string raw_sql;
  std::string clean_sql; // ref() resolved, header stripped

  ContractMode                contract_mode = ContractMode::kDisabled;
  std::vector<ColumnContract> contract_columns;

  // resolved upstream model names
  std::vector<std::string> dependencies;

  // columns produced by the SELECT, when the loader extracted them
  std::vector<std::string> output_columns;

  const std::string& EffectiveSql() const {
    return clean_sql.empty() ? raw_sql : clean_sql;
  }
};

// Ordered by name so every iteration over the model set is deterministic.
using ModelMap = std::map<std::string, ModelDefinition>;

std::string_view ToString(ModelKind kind);
std::string_view ToString(ContractMode mode);

// Throw util::InvalidArgument on unknown tokens.
ModelKind    ParseModelKind(std::string_view text);
ContractMode ParseContractMode(std::string_view text);

} // namespace modelplan::model
