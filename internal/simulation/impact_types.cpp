#include "impact_types.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace modelplan::simulation {

std::string_view ToString(ChangeAction action) {
  switch (action) {
    case ChangeAction::kAdd:
      return "ADD";
    case ChangeAction::kRemove:
      return "REMOVE";
    case ChangeAction::kRename:
      return "RENAME";
    case ChangeAction::kTypeChange:
      return "TYPE_CHANGE";
  }
  return "ADD";
}

ChangeAction ParseChangeAction(std::string_view text) {
  if (text == "ADD")
    return ChangeAction::kAdd;
  if (text == "REMOVE")
    return ChangeAction::kRemove;
  if (text == "RENAME")
    return ChangeAction::kRename;
  if (text == "TYPE_CHANGE")
    return ChangeAction::kTypeChange;

  throw util::InvalidArgument("unknown change action: " + std::string(text));
}

std::string_view ToString(ReferenceType type) {
  return type == ReferenceType::kDirect ? "direct" : "transitive";
}

} // namespace modelplan::simulation
