#include "basic_sql_toolkit.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace modelplan::sql {

namespace {

using Kind = SqlToken::Kind;

std::string Upper(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

std::string Lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool IsWordStart(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool IsWordChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

const std::set<std::string>& Keywords() {
  static const std::set<std::string> kKeywords = {
      "ALL",       "AND",       "ANTI",     "AS",        "ASC",       "BETWEEN",  "BY",        "CASE",
      "CAST",      "CROSS",     "CURRENT_DATE",          "CURRENT_TIMESTAMP",    "DESC",      "DISTINCT",
      "ELSE",      "END",       "EXCEPT",   "EXISTS",    "FALSE",     "FOLLOWING","FROM",      "FULL",
      "GROUP",     "HAVING",    "ILIKE",    "IN",        "INNER",     "INTERSECT","INTERVAL",  "IS",
      "JOIN",      "LATERAL",   "LEFT",     "LIKE",      "LIMIT",     "NATURAL",  "NOT",       "NULL",
      "NULLS",     "OFFSET",    "ON",       "OR",        "ORDER",     "OUTER",    "OVER",      "PARTITION",
      "PRECEDING", "QUALIFY",   "RIGHT",    "RLIKE",     "SELECT",    "SEMI",     "THEN",      "TRUE",
      "UNBOUNDED", "UNION",     "USING",    "VALUES",    "WHEN",      "WHERE",    "WINDOW",    "WITH",
  };
  return kKeywords;
}

// Type names and interval units, plus a few window frame words. They act
// as keywords only in some positions and are valid column names elsewhere.
const std::set<std::string>& ContextualKeywords() {
  static const std::set<std::string> kContextual = {
      "BIGINT",    "BINARY",    "BOOLEAN",  "CHAR",      "DATE",      "DECIMAL",  "DOUBLE",    "FLOAT",
      "INT",       "INTEGER",   "SMALLINT", "STRING",    "TIMESTAMP", "TINYINT",  "VARCHAR",
      "DAY",       "DAYS",      "HOUR",     "HOURS",     "MINUTE",    "MONTH",    "MONTHS",    "SECOND",
      "WEEK",      "YEAR",      "YEARS",
      "CURRENT",   "FIRST",     "LAST",     "RANGE",     "ROW",       "ROWS",
  };
  return kContextual;
}

bool IsWordAt(const std::vector<SqlToken>& tokens, std::size_t i, const char* word) {
  return i < tokens.size() && tokens[i].kind == Kind::kWord && Upper(tokens[i].text) == word;
}

bool IsKindAt(const std::vector<SqlToken>& tokens, std::size_t i, Kind kind) {
  return i < tokens.size() && tokens[i].kind == kind;
}

// EXTRACT(YEAR FROM ts): the unit right after "EXTRACT (".
bool IsExtractUnit(const std::vector<SqlToken>& tokens, std::size_t i) {
  return i >= 2 && tokens[i - 1].kind == Kind::kSymbol && tokens[i - 1].text == "(" &&
         IsWordAt(tokens, i - 2, "EXTRACT");
}

/*
  Decides whether a contextual word is acting as a keyword here:

    DATE '2024-01-01'            typed literal
    x::DATE                      cast shorthand
    INTERVAL 3 DAY               interval unit after a number or string
    EXTRACT(YEAR FROM ts)        extract unit
    ROWS BETWEEN ... CURRENT ROW window frame
    NULLS FIRST                  null ordering

  CAST(x AS DATE) needs no rule: whatever follows AS is never a column.
*/
bool IsContextualKeyword(const std::vector<SqlToken>& tokens, std::size_t i) {
  const auto upper = Upper(tokens[i].text);
  const bool after_cast_op =
      i > 0 && tokens[i - 1].kind == Kind::kSymbol && tokens[i - 1].text == "::";

  if (upper == "FIRST" || upper == "LAST") {
    return i > 0 && IsWordAt(tokens, i - 1, "NULLS");
  }
  if (upper == "ROWS" || upper == "RANGE") {
    return IsWordAt(tokens, i + 1, "BETWEEN") || IsWordAt(tokens, i + 1, "UNBOUNDED") ||
           IsWordAt(tokens, i + 1, "CURRENT") || IsKindAt(tokens, i + 1, Kind::kNumber);
  }
  if (upper == "CURRENT") {
    return IsWordAt(tokens, i + 1, "ROW");
  }
  if (upper == "ROW") {
    return i > 0 && IsWordAt(tokens, i - 1, "CURRENT");
  }
  if (after_cast_op || IsKindAt(tokens, i + 1, Kind::kString) || IsExtractUnit(tokens, i)) {
    return true;
  }
  // interval units follow their quantity
  return i > 0 && (tokens[i - 1].kind == Kind::kNumber || tokens[i - 1].kind == Kind::kString);
}

bool IsKeyword(const std::vector<SqlToken>& tokens, std::size_t i) {
  const auto& token = tokens[i];
  if (token.kind != Kind::kWord) {
    return false;
  }
  const auto upper = Upper(token.text);
  if (Keywords().count(upper)) {
    return true;
  }
  return ContextualKeywords().count(upper) > 0 && IsContextualKeyword(tokens, i);
}

bool IsName(const std::vector<SqlToken>& tokens, std::size_t i) {
  const auto& token = tokens[i];
  return (token.kind == Kind::kWord && !IsKeyword(tokens, i)) || token.kind == Kind::kQuotedName;
}

bool IsSymbol(const std::vector<SqlToken>& tokens, std::size_t i, const char* symbol) {
  return i < tokens.size() && tokens[i].kind == Kind::kSymbol && tokens[i].text == symbol;
}

// Clauses after which a bare name is no longer a table reference.
bool EndsFromClause(const std::string& upper) {
  static const std::set<std::string> kEnders = {"WHERE", "GROUP",  "ORDER", "LIMIT",  "HAVING", "ON",
                                                "UNION", "SELECT", "USING", "QUALIFY", "WINDOW", "EXCEPT",
                                                "INTERSECT"};
  return kEnders.count(upper) > 0;
}

} // namespace

// ------------------------------------------------------------
// Tokenizer
// ------------------------------------------------------------

std::optional<std::vector<SqlToken>> TokenizeSql(std::string_view sql) {
  std::vector<SqlToken> tokens;
  std::size_t           pos   = 0;
  int                   depth = 0;

  while (pos < sql.size()) {
    const char c = sql[pos];

    if (std::isspace(static_cast<unsigned char>(c))) {
      ++pos;
      continue;
    }

    // -- line comment
    if (c == '-' && pos + 1 < sql.size() && sql[pos + 1] == '-') {
      while (pos < sql.size() && sql[pos] != '\n') {
        ++pos;
      }
      continue;
    }

    // /* block comment */
    if (c == '/' && pos + 1 < sql.size() && sql[pos + 1] == '*') {
      auto close = sql.find("*/", pos + 2);
      if (close == std::string_view::npos) {
        return std::nullopt;
      }
      pos = close + 2;
      continue;
    }

    if (IsWordStart(c)) {
      auto start = pos;
      while (pos < sql.size() && IsWordChar(sql[pos])) {
        ++pos;
      }
      tokens.push_back({Kind::kWord, std::string(sql.substr(start, pos - start))});
      continue;
    }

    if (std::isdigit(static_cast<unsigned char>(c))) {
      auto start = pos;
      while (pos < sql.size() && (std::isalnum(static_cast<unsigned char>(sql[pos])) || sql[pos] == '.')) {
        ++pos;
      }
      tokens.push_back({Kind::kNumber, std::string(sql.substr(start, pos - start))});
      continue;
    }

    if (c == '\'' || c == '"' || c == '`') {
      const char  quote = c;
      std::string text;
      ++pos;
      bool closed = false;
      while (pos < sql.size()) {
        const char ch = sql[pos];
        if (ch == '\\' && quote != '`' && pos + 1 < sql.size()) {
          text.push_back(ch);
          text.push_back(sql[pos + 1]);
          pos += 2;
          continue;
        }
        if (ch == quote) {
          // doubled quote is an escaped quote
          if (pos + 1 < sql.size() && sql[pos + 1] == quote) {
            text.push_back(ch);
            pos += 2;
            continue;
          }
          ++pos;
          closed = true;
          break;
        }
        text.push_back(ch);
        ++pos;
      }
      if (!closed) {
        return std::nullopt;
      }
      tokens.push_back({quote == '`' ? Kind::kQuotedName : Kind::kString, std::move(text)});
      continue;
    }

    if (c == '(') {
      ++depth;
    } else if (c == ')') {
      if (--depth < 0) {
        return std::nullopt;
      }
    }

    // two-character operators
    if (pos + 1 < sql.size()) {
      const std::string_view pair = sql.substr(pos, 2);
      if (pair == "<=" || pair == ">=" || pair == "<>" || pair == "!=" || pair == "||" || pair == "::") {
        tokens.push_back({Kind::kSymbol, std::string(pair)});
        pos += 2;
        continue;
      }
    }

    tokens.push_back({Kind::kSymbol, std::string(1, c)});
    ++pos;
  }

  if (depth != 0) {
    return std::nullopt;
  }
  return tokens;
}

// ------------------------------------------------------------
// Cosmetic comparison
// ------------------------------------------------------------

std::optional<std::string> BasicSqlToolkit::Canonicalize(std::string_view sql) {
  auto tokens = TokenizeSql(sql);
  if (!tokens) {
    return std::nullopt;
  }

  // A trailing statement terminator carries no meaning.
  while (!tokens->empty() && tokens->back().kind == Kind::kSymbol && tokens->back().text == ";") {
    tokens->pop_back();
  }

  std::string canonical;
  for (const auto& token : *tokens) {
    if (!canonical.empty()) {
      canonical.push_back(' ');
    }
    switch (token.kind) {
      case Kind::kWord:
        canonical += Upper(token.text);
        break;
      case Kind::kQuotedName:
        canonical += "`" + Upper(token.text) + "`";
        break;
      case Kind::kString:
        canonical += "'" + token.text + "'";
        break;
      case Kind::kNumber:
      case Kind::kSymbol:
        canonical += token.text;
        break;
    }
  }
  return canonical;
}

SqlDiffOutcome BasicSqlToolkit::Diff(std::string_view old_sql, std::string_view new_sql) const {
  SqlDiffOutcome outcome;

  auto old_canonical = Canonicalize(old_sql);
  auto new_canonical = Canonicalize(new_sql);
  if (!old_canonical || !new_canonical) {
    return outcome;
  }

  outcome.parsed        = true;
  outcome.identical     = old_sql == new_sql;
  outcome.cosmetic_only = !outcome.identical && *old_canonical == *new_canonical;
  return outcome;
}

// ------------------------------------------------------------
// Column extraction
// ------------------------------------------------------------

std::optional<std::set<std::string>> BasicSqlToolkit::ExtractColumns(std::string_view sql) const {
  auto parsed = TokenizeSql(sql);
  if (!parsed) {
    return std::nullopt;
  }
  const auto& tokens = *parsed;

  std::set<std::string> columns;

  bool              in_from       = false;
  bool              expect_table  = false;
  bool              expect_alias  = false;
  bool              next_is_alias = false;
  std::vector<bool> from_stack;

  std::size_t i = 0;
  while (i < tokens.size()) {
    const auto& token = tokens[i];

    if (IsKeyword(tokens, i)) {
      const auto upper = Upper(token.text);
      expect_alias     = false;
      if (upper == "FROM" && i > 0 && IsExtractUnit(tokens, i - 1)) {
        // EXTRACT(unit FROM ts) reads a column, not a table
      } else if (upper == "FROM" || upper == "JOIN") {
        in_from      = true;
        expect_table = true;
      } else if (EndsFromClause(upper)) {
        in_from      = false;
        expect_table = false;
      }
      next_is_alias = upper == "AS";
      ++i;
      continue;
    }

    if (token.kind == Kind::kSymbol) {
      if (token.text == "(") {
        from_stack.push_back(in_from);
        in_from      = false;
        expect_table = false;
      } else if (token.text == ")") {
        in_from = !from_stack.empty() && from_stack.back();
        if (!from_stack.empty()) {
          from_stack.pop_back();
        }
        // "FROM (subquery) alias"
        expect_alias = in_from;
      } else if (token.text == "," && in_from) {
        expect_table = true;
        expect_alias = false;
      }
      next_is_alias = false;
      ++i;
      continue;
    }

    if (!IsName(tokens, i)) {
      next_is_alias = false;
      ++i;
      continue;
    }

    // Collect a dotted reference: a.b.c or a.*
    std::string last = token.text;
    std::size_t j    = i + 1;
    bool        star = false;
    while (IsSymbol(tokens, j, ".") && j + 1 < tokens.size()) {
      const auto& part = tokens[j + 1];
      if (part.kind == Kind::kSymbol && part.text == "*") {
        star = true;
        j += 2;
        break;
      }
      if (part.kind != Kind::kWord && part.kind != Kind::kQuotedName) {
        break;
      }
      last = part.text;
      j += 2;
    }

    const bool is_function = IsSymbol(tokens, j, "(");
    const bool is_cte_name = IsWordAt(tokens, j, "AS") && IsSymbol(tokens, j + 1, "(");

    if (is_function || is_cte_name || star) {
      // not a column
    } else if (next_is_alias) {
      next_is_alias = false;
    } else if (expect_table) {
      expect_table = false;
      expect_alias = true;
    } else if (expect_alias) {
      expect_alias = false;
    } else {
      columns.insert(Lower(last));
    }

    next_is_alias = false;
    i             = j;
  }

  return columns;
}

} // namespace modelplan::sql
