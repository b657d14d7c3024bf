#pragma once

#include <string>
#include <string_view>

namespace modelplan::contracts {

// Upper-cases and trims a warehouse type token.
std::string NormalizeTypeToken(std::string_view type);

/*
  Whether changing a column from old_type to new_type is safe for readers.

  Directional: INT -> BIGINT is safe, BIGINT -> INT is not. Pairs missing
  from the allow-list are treated as breaking.
*/
bool IsTypeCompatible(std::string_view old_type, std::string_view new_type);

} // namespace modelplan::contracts
