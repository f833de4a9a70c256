#include "squink/types.h"

#include <optional>
#include <string_view>

namespace squink {

std::optional<Direction> DirectionBetween(const Coord& from, const Coord& to) {
  for (Direction d : kAllDirections) {
    if (from.Neighbor(d) == to) {
      return d;
    }
  }
  return std::nullopt;
}

std::string_view PhaseName(Phase phase) {
  switch (phase) {
    case Phase::kForming:
      return "forming";
    case Phase::kActive:
      return "active";
    case Phase::kFinished:
      return "finished";
  }
  return "unknown";
}

}  // namespace squink
