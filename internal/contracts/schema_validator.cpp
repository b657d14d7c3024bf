#include "schema_validator.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <tuple>

#include "internal/contracts/type_compat.hpp"

namespace modelplan::contracts {

namespace {

using model::Severity;

std::string Lower(const std::string& value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

template <typename Value>
const Value* FindCaseInsensitive(const std::map<std::string, Value>& values, const std::string& key_lower) {
  for (const auto& [key, value] : values) {
    if (Lower(key) == key_lower) {
      return &value;
    }
  }
  return nullptr;
}

void SortViolations(std::vector<ContractViolation>& violations) {
  std::sort(violations.begin(), violations.end(), [](const ContractViolation& a, const ContractViolation& b) {
    return std::tie(a.model_name, a.column_name, a.violation_type) < std::tie(b.model_name, b.column_name, b.violation_type);
  });
}

} // namespace

// ------------------------------------------------------------
// ContractValidationResult
// ------------------------------------------------------------

bool ContractValidationResult::HasBreakingViolations() const {
  return BreakingCount() > 0;
}

int ContractValidationResult::BreakingCount() const {
  return static_cast<int>(std::count_if(violations.begin(), violations.end(),
                                        [](const ContractViolation& v) { return v.severity == Severity::kBreaking; }));
}

int ContractValidationResult::WarningCount() const {
  return static_cast<int>(std::count_if(violations.begin(), violations.end(),
                                        [](const ContractViolation& v) { return v.severity == Severity::kWarning; }));
}

int ContractValidationResult::InfoCount() const {
  return static_cast<int>(std::count_if(violations.begin(), violations.end(),
                                        [](const ContractViolation& v) { return v.severity == Severity::kInfo; }));
}

std::vector<ContractViolation> ContractValidationResult::ViolationsForModel(const std::string& model_name) const {
  std::vector<ContractViolation> out;
  for (const auto& v : violations) {
    if (v.model_name == model_name) {
      out.push_back(v);
    }
  }
  return out;
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

std::string NormalizeContractType(const std::string& data_type) {
  static const std::map<std::string, std::string> kAliases = {
      {"INTEGER", "INT"},         {"BIGINTEGER", "BIGINT"}, {"LONG", "BIGINT"},
      {"SHORT", "SMALLINT"},      {"TINYINT", "SMALLINT"},  {"REAL", "FLOAT"},
      {"DOUBLE PRECISION", "DOUBLE"}, {"VARCHAR", "STRING"}, {"TEXT", "STRING"},
      {"CHAR", "STRING"},         {"NVARCHAR", "STRING"},   {"DATETIME", "TIMESTAMP"},
      {"BOOL", "BOOLEAN"},        {"NUMERIC", "DECIMAL"},   {"NUMBER", "DECIMAL"},
  };

  auto normalized = NormalizeTypeToken(data_type);
  auto it         = kAliases.find(normalized);
  return it == kAliases.end() ? normalized : it->second;
}

ContractValidationResult ValidateSchemaContract(const model::ModelDefinition& model, const ObservedSchema& observed) {
  ContractValidationResult result;
  if (model.contract_mode == model::ContractMode::kDisabled) {
    return result;
  }

  result.models_checked = 1;
  if (model.contract_columns.empty()) {
    return result;
  }

  const auto& columns = observed.columns ? *observed.columns : model.output_columns;

  std::set<std::string> columns_lower;
  for (const auto& column : columns) {
    columns_lower.insert(Lower(column));
  }

  std::set<std::string> contracted_lower;
  for (const auto& contract : model.contract_columns) {
    const auto col_lower = Lower(contract.name);
    contracted_lower.insert(col_lower);

    if (!columns_lower.count(col_lower)) {
      result.violations.push_back({model.name, contract.name, "COLUMN_REMOVED", Severity::kBreaking,
                                   contract.name + ": " + contract.data_type, "(missing)",
                                   "Contracted column '" + contract.name + "' (type: " + contract.data_type +
                                       ") is missing from model output."});
      continue;
    }

    if (observed.types) {
      if (const auto* actual_type = FindCaseInsensitive(*observed.types, col_lower)) {
        if (NormalizeContractType(contract.data_type) != NormalizeContractType(*actual_type)) {
          result.violations.push_back({model.name, contract.name, "TYPE_CHANGED", Severity::kBreaking, contract.data_type,
                                       *actual_type,
                                       "Column '" + contract.name + "' type changed: contract declares " +
                                           contract.data_type + ", actual is " + *actual_type + "."});
        }
      }
    }

    // Looser-than-declared is the only direction that breaks readers.
    if (observed.nullability) {
      const auto* actual_nullable = FindCaseInsensitive(*observed.nullability, col_lower);
      if (actual_nullable && !contract.nullable && *actual_nullable) {
        result.violations.push_back({model.name, contract.name, "NULLABLE_TIGHTENED", Severity::kBreaking, "NOT NULL",
                                     "NULLABLE",
                                     "Column '" + contract.name +
                                         "' is declared NOT NULL in contract but is nullable in actual output."});
      }
    }
  }

  std::vector<std::string> sorted_columns(columns.begin(), columns.end());
  std::sort(sorted_columns.begin(), sorted_columns.end());
  for (const auto& column : sorted_columns) {
    if (!contracted_lower.count(Lower(column))) {
      result.violations.push_back({model.name, column, "COLUMN_ADDED", Severity::kInfo, "(not in contract)", column,
                                   "Column '" + column + "' exists in output but is not declared in the schema contract."});
    }
  }

  SortViolations(result.violations);
  return result;
}

ContractValidationResult ValidateSchemaContracts(const model::ModelMap& models, const std::map<std::string, ObservedSchema>& observed) {
  ContractValidationResult aggregate;

  for (const auto& [name, definition] : models) {
    if (definition.contract_mode == model::ContractMode::kDisabled) {
      continue;
    }

    auto it     = observed.find(name);
    auto single = ValidateSchemaContract(definition, it == observed.end() ? ObservedSchema{} : it->second);

    aggregate.models_checked += single.models_checked;
    aggregate.violations.insert(aggregate.violations.end(), single.violations.begin(), single.violations.end());
  }

  SortViolations(aggregate.violations);
  return aggregate;
}

} // namespace modelplan::contracts
