#include "squink/corner_strategy.h"

#include <array>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"

#include "squink/error.h"

namespace squink {
namespace {

constexpr std::array kSweepOrder = {Direction::kLeft, Direction::kUp,
                                    Direction::kRight, Direction::kDown};

std::optional<Coord> BottomRightMostUnclaimed(const GameState& state) {
  for (int32_t y = state.height - 1; y >= 0; --y) {
    for (int32_t x = state.width - 1; x >= 0; --x) {
      if (!state.OwnerAt(Coord{x, y}).has_value()) {
        return Coord{x, y};
      }
    }
  }
  return std::nullopt;
}

// Horizontal first. `to` must differ from `from`.
Move StepToward(const Coord& from, const Coord& to) {
  DCHECK(!(from == to));
  if (to.x != from.x) {
    return Move::Toward(from, to.x < from.x ? Direction::kLeft
                                            : Direction::kRight);
  }
  return Move::Toward(from, to.y < from.y ? Direction::kUp : Direction::kDown);
}

int64_t Distance(const Coord& a, const Coord& b) {
  return std::llabs(static_cast<int64_t>(a.x) - b.x) +
         std::llabs(static_cast<int64_t>(a.y) - b.y);
}

}  // namespace

absl::StatusOr<Move> CornerStrategy::Decide(const GameState& state,
                                            PlayerId self) {
  absl::StatusOr<const PlayerSnapshot*> me = FindSelf(state, self);
  if (!me.ok()) {
    return me.status();
  }
  Coord position = (*me)->position;
  if (state.LegalDirections(position).empty()) {
    return MakeError(ErrorKind::kNoLegalMove,
                     absl::StrCat(self, " is boxed in at ", position));
  }
  if (!sweeping_) {
    if (target_.has_value() && *target_ == position) {
      sweeping_ = true;
    } else {
      // Someone may have painted the target while we were on the way.
      if (!target_.has_value() || state.OwnerAt(*target_).has_value()) {
        target_ = BottomRightMostUnclaimed(state);
      }
      if (!target_.has_value() || *target_ == position) {
        sweeping_ = true;
      } else {
        return StepToward(position, *target_);
      }
    }
    VLOG(1) << self << " starts sweeping from " << position;
  }
  return Sweep(state, self, position);
}

Move CornerStrategy::Sweep(const GameState& state, PlayerId self,
                           const Coord& position) {
  for (Direction d : kSweepOrder) {
    Coord next = position.Neighbor(d);
    if (state.Contains(next) && !state.OwnerAt(next).has_value()) {
      return Move{next};
    }
  }
  for (Direction d : kSweepOrder) {
    Coord next = position.Neighbor(d);
    if (state.Contains(next) && state.OwnerAt(next) != self) {
      return Move{next};
    }
  }
  std::optional<Coord> closest;
  int64_t best = std::numeric_limits<int64_t>::max();
  for (int32_t y = 0; y < state.height; ++y) {
    for (int32_t x = 0; x < state.width; ++x) {
      Coord c{x, y};
      if (c == position || state.OwnerAt(c) == self) {
        continue;
      }
      if (int64_t d = Distance(position, c); d < best) {
        best = d;
        closest = c;
      }
    }
  }
  if (closest.has_value()) {
    return StepToward(position, *closest);
  }
  // Everything is ours, keep moving to stay in the game.
  for (Direction d : kSweepOrder) {
    if (state.Contains(position.Neighbor(d))) {
      return Move::Toward(position, d);
    }
  }
  LOG(FATAL) << "No neighbour on the grid, checked by the caller";
  return Move{position};
}

}  // namespace squink
