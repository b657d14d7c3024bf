#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace modelplan::sql {

/*
  Outcome of comparing two versions of a model's SQL.

  parsed == false means either side failed to parse; callers must then
  treat the change as semantic.
*/
struct SqlDiffOutcome {
  bool parsed        = false;
  bool identical     = false;
  bool cosmetic_only = false;

  bool IsCosmetic() const {
    return parsed && (identical || cosmetic_only);
  }
};

/*
  SQL collaborator used by the planner and the impact analyzer.

  Failures are reported through the return values, never thrown.
*/
class SqlToolkit {
 public:
  virtual ~SqlToolkit() = default;

  virtual SqlDiffOutcome Diff(std::string_view old_sql, std::string_view new_sql) const = 0;

  // Lower-cased column names referenced by the statement; nullopt when the
  // statement cannot be parsed.
  virtual std::optional<std::set<std::string>> ExtractColumns(std::string_view sql) const = 0;
};

} // namespace modelplan::sql
