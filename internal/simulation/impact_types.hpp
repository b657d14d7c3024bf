#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/severity.hpp"

namespace modelplan::simulation {

enum class ChangeAction {
  kAdd,
  kRemove,
  kRename,
  kTypeChange,
};

std::string_view ToString(ChangeAction action);
ChangeAction     ParseChangeAction(std::string_view text); // throws util::InvalidArgument

// One hypothetical column change on a source model.
struct ColumnChange {
  ChangeAction               action = ChangeAction::kAdd;
  std::string                column_name;
  std::optional<std::string> new_name; // RENAME
  std::optional<std::string> old_type; // TYPE_CHANGE
  std::optional<std::string> new_type; // TYPE_CHANGE
};

// Violation of a downstream model's declared contract by a simulated change.
struct ContractViolation {
  std::string     model_name;
  std::string     column_name;
  std::string     violation_type; // COLUMN_REMOVED, COLUMN_RENAMED, TYPE_CHANGED
  model::Severity severity = model::Severity::kBreaking;
  std::string     message;
};

enum class ReferenceType {
  kDirect,     // depth 1
  kTransitive, // depth > 1
};

std::string_view ToString(ReferenceType type);

struct AffectedModel {
  std::string                    model_name;
  ReferenceType                  reference_type = ReferenceType::kDirect;
  std::vector<std::string>       columns_affected; // sorted
  std::vector<ContractViolation> contract_violations;
  model::Severity                severity = model::Severity::kInfo;
};

/*
  Outcome of a column-change simulation.

  Affected models appear in breadth-first order: by depth, then by name
  within each parent's children.
*/
struct ImpactReport {
  std::string                    source_model;
  std::vector<ColumnChange>      column_changes;
  std::vector<AffectedModel>     directly_affected;
  std::vector<AffectedModel>     transitively_affected;
  std::vector<ContractViolation> contract_violations;
  int                            breaking_count = 0;
  int                            warning_count  = 0;
  std::vector<std::string>       orphaned_models;
  std::string                    summary;
};

struct ModelRemovalReport {
  std::string                removed_model;
  std::vector<AffectedModel> directly_affected;
  std::vector<AffectedModel> transitively_affected;
  std::vector<std::string>   orphaned_models; // sorted
  int                        breaking_count = 0;
  std::string                summary;
};

} // namespace modelplan::simulation
