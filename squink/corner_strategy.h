#ifndef SQUINK_CORNER_STRATEGY_H
#define SQUINK_CORNER_STRATEGY_H

#include <optional>
#include <string_view>

#include "absl/status/statusor.h"

#include "squink/game_state.h"
#include "squink/strategy.h"
#include "squink/types.h"

namespace squink {

// Runs to the bottom-right-most unclaimed cell, then sweeps back toward the
// top-left:
//  1. an unclaimed neighbour, checked left, up, right, down;
//  2. otherwise a neighbour owned by someone else, same order;
//  3. otherwise a step toward the closest cell it does not own, ties going
//     to the top-left-most one;
//  4. otherwise any neighbour.
// Horizontal steps always come before vertical ones, so the same board gives
// the same moves on every run.
class CornerStrategy : public Strategy {
 public:
  absl::StatusOr<Move> Decide(const GameState& state, PlayerId self) override;
  std::string_view name() const override { return "corner"; }

  bool sweeping() const { return sweeping_; }

 private:
  Move Sweep(const GameState& state, PlayerId self, const Coord& position);

  std::optional<Coord> target_;
  bool sweeping_ = false;
};

}  // namespace squink

#endif  // SQUINK_CORNER_STRATEGY_H
