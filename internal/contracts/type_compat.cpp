#include "type_compat.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

namespace modelplan::contracts {

namespace {

using TypePair = std::pair<std::string, std::string>;

// Widening conversions only. Identity pairs are handled before lookup.
const std::set<TypePair>& SafeConversions() {
  static const std::set<TypePair> kSafe = {
      // integer / floating widening
      {"TINYINT", "SMALLINT"},
      {"TINYINT", "INT"},
      {"TINYINT", "BIGINT"},
      {"SMALLINT", "INT"},
      {"SMALLINT", "BIGINT"},
      {"INT", "BIGINT"},
      {"INT", "FLOAT"},
      {"INT", "DOUBLE"},
      {"BIGINT", "DOUBLE"},
      {"FLOAT", "DOUBLE"},
      // string widening
      {"VARCHAR", "STRING"},
      {"CHAR", "STRING"},
      {"CHAR", "VARCHAR"},
      // no data loss
      {"DATE", "TIMESTAMP"},
  };
  return kSafe;
}

} // namespace

std::string NormalizeTypeToken(std::string_view type) {
  auto begin = type.begin();
  auto end   = type.end();
  while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) {
    ++begin;
  }
  while (end != begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
    --end;
  }

  std::string normalized(begin, end);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return normalized;
}

bool IsTypeCompatible(std::string_view old_type, std::string_view new_type) {
  auto old_norm = NormalizeTypeToken(old_type);
  auto new_norm = NormalizeTypeToken(new_type);
  if (old_norm == new_norm) {
    return true;
  }
  return SafeConversions().count({std::move(old_norm), std::move(new_norm)}) > 0;
}

} // namespace modelplan::contracts
