#ifndef SQUINK_RANDOM_STRATEGY_H
#define SQUINK_RANDOM_STRATEGY_H

#include <cstdint>
#include <random>
#include <string_view>

#include "absl/status/statusor.h"

#include "squink/game_state.h"
#include "squink/strategy.h"
#include "squink/types.h"

namespace squink {

// Picks uniformly among the neighbouring cells that are on the grid.
class RandomStrategy : public Strategy {
 public:
  // Seed 0 draws the seed from std::random_device.
  explicit RandomStrategy(uint32_t seed);

  absl::StatusOr<Move> Decide(const GameState& state, PlayerId self) override;
  std::string_view name() const override { return "random"; }

 private:
  std::mt19937 gen_;
};

}  // namespace squink

#endif  // SQUINK_RANDOM_STRATEGY_H
