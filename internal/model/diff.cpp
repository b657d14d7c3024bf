#include "diff.hpp"

#include "internal/util/errors.hpp"

namespace modelplan::model {

std::string_view ToString(ChangeType type) {
  switch (type) {
    case ChangeType::kAdded:
      return "ADDED";
    case ChangeType::kRemoved:
      return "REMOVED";
    case ChangeType::kModified:
      return "MODIFIED";
    case ChangeType::kCosmeticOnly:
      return "COSMETIC_ONLY";
    case ChangeType::kNoChange:
      return "NO_CHANGE";
  }
  return "MODIFIED";
}

void DiffResult::Validate() const {
  for (const auto& name : added_models) {
    if (modified_models.count(name) || removed_models.count(name)) {
      throw util::InvalidArgument("diff result lists model '" + name + "' as added and as modified or removed");
    }
  }
  for (const auto& name : modified_models) {
    if (removed_models.count(name)) {
      throw util::InvalidArgument("diff result lists model '" + name + "' as both modified and removed");
    }
  }
}

} // namespace modelplan::model
