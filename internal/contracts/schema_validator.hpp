#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/model_definition.hpp"
#include "internal/model/severity.hpp"

namespace modelplan::contracts {

struct ContractViolation {
  std::string     model_name;
  std::string     column_name;
  std::string     violation_type; // COLUMN_REMOVED, TYPE_CHANGED, NULLABLE_TIGHTENED, COLUMN_ADDED
  model::Severity severity = model::Severity::kInfo;
  std::string     expected;
  std::string     actual;
  std::string     message;
};

/*
  Violations across one or more models, sorted by
  (model_name, column_name, violation_type).
*/
struct ContractValidationResult {
  std::vector<ContractViolation> violations;
  int                            models_checked = 0;

  bool HasBreakingViolations() const;
  int  BreakingCount() const;
  int  WarningCount() const;
  int  InfoCount() const;

  std::vector<ContractViolation> ViolationsForModel(const std::string& model_name) const;
};

/*
  What the warehouse (or the SQL parser) reports a model actually produces.

  Each part is optional; checks that need a missing part are skipped.
  Without columns the model's declared output_columns are used.
*/
struct ObservedSchema {
  std::optional<std::vector<std::string>>   columns;
  std::optional<std::map<std::string, std::string>> types;
  std::optional<std::map<std::string, bool>> nullability;
};

// Canonical alias folding: INTEGER -> INT, VARCHAR -> STRING, ...
std::string NormalizeContractType(const std::string& data_type);

ContractValidationResult ValidateSchemaContract(const model::ModelDefinition& model, const ObservedSchema& observed = {});

// Models are visited in name order; disabled contracts are skipped.
ContractValidationResult ValidateSchemaContracts(const model::ModelMap& models,
                                                 const std::map<std::string, ObservedSchema>& observed = {});

} // namespace modelplan::contracts
