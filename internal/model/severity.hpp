#pragma once

#include <string_view>

namespace modelplan::model {

// Ordered from least to most severe; std::max picks the worst.
enum class Severity {
  kInfo    = 0,
  kWarning = 1,
  kBreaking = 2,
};

constexpr std::string_view ToString(Severity severity) {
  switch (severity) {
    case Severity::kInfo:
      return "INFO";
    case Severity::kWarning:
      return "WARNING";
    case Severity::kBreaking:
      return "BREAKING";
  }
  return "INFO";
}

} // namespace modelplan::model
