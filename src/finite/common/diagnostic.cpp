#include <string_view>

#include "finite/common/diagnostic/diagnostic.hpp"

namespace fnt {

auto ToString(ErrorCode code) -> std::string_view {
  switch (code) {
    case ErrorCode::kMalformedArc:
      return "malformed-arc";
    case ErrorCode::kUnresolvedReference:
      return "unresolved-reference";
    case ErrorCode::kUnboundVariable:
      return "unbound-variable";
    case ErrorCode::kAlreadyFrozen:
      return "already-frozen";
    case ErrorCode::kNotFrozen:
      return "not-frozen";
    case ErrorCode::kOverlayUnavailable:
      return "overlay-unavailable";
  }
  return "unknown";
}

}  // namespace fnt
