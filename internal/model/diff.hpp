#pragma once

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace modelplan::model {

enum class ChangeType {
  kAdded,
  kRemoved,
  kModified,
  kCosmeticOnly,
  kNoChange,
};

std::string_view ToString(ChangeType type);

/*
  Column-level detail for one directly changed model, produced by the
  SQL AST comparator.
*/
struct AstDiffDetail {
  ChangeType               change_type = ChangeType::kModified;
  std::vector<std::string> changed_columns;
  std::vector<std::string> added_columns;
  std::vector<std::string> removed_columns;
  std::vector<std::string> changed_expressions;
};

using AstDiffMap = std::map<std::string, AstDiffDetail>;

/*
  Structural diff between the base and target snapshots.

  The three sets must be disjoint. Models in none of them are unchanged.
*/
struct DiffResult {
  std::set<std::string> added_models;
  std::set<std::string> modified_models;
  std::set<std::string> removed_models;

  bool IsAdded(const std::string& name) const {
    return added_models.count(name) > 0;
  }

  bool IsModified(const std::string& name) const {
    return modified_models.count(name) > 0;
  }

  // Throws util::InvalidArgument naming the first model found in two sets.
  void Validate() const;
};

} // namespace modelplan::model
