#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/sql/sql_toolkit.hpp"

namespace modelplan::sql {

struct SqlToken {
  enum class Kind {
    kWord,       // keyword or bare identifier
    kQuotedName, // `backtick quoted`
    kString,     // 'literal' or "literal"
    kNumber,
    kSymbol,
  };

  Kind        kind;
  std::string text;
};

// Drops whitespace and comments. nullopt on unterminated strings, quoted
// names or block comments, and on unbalanced parentheses.
std::optional<std::vector<SqlToken>> TokenizeSql(std::string_view sql);

/*
  Token-level SQL toolkit for the Databricks dialect.

  Two statements are cosmetically equal when their token streams match
  with keywords and identifiers compared case-insensitively. Column
  extraction is lexical: identifiers that are not keywords, function
  names, table references, or aliases.
*/
class BasicSqlToolkit : public SqlToolkit {
 public:
  SqlDiffOutcome Diff(std::string_view old_sql, std::string_view new_sql) const override;

  std::optional<std::set<std::string>> ExtractColumns(std::string_view sql) const override;

  // Canonical single-line rendering used for cosmetic comparison.
  static std::optional<std::string> Canonicalize(std::string_view sql);
};

} // namespace modelplan::sql
