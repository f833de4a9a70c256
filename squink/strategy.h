#ifndef SQUINK_STRATEGY_H
#define SQUINK_STRATEGY_H

#include <cstdint>
#include <memory>
#include <string_view>

#include "absl/status/statusor.h"

#include "squink/game_state.h"
#include "squink/types.h"

namespace squink {

// Decision logic of one player. A strategy only proposes moves; the engine
// validates and applies them. Implementations may keep private state between
// calls but must not hold on to the GameState.
class Strategy {
 public:
  virtual ~Strategy() = default;

  // Fails with NoLegalMove when `self` cannot move anywhere and with
  // UnknownPlayer when `self` is not in `state`.
  virtual absl::StatusOr<Move> Decide(const GameState& state,
                                      PlayerId self) = 0;

  virtual std::string_view name() const = 0;
};

// Steps forward: right when it can, otherwise down, left, up.
class BaseStrategy : public Strategy {
 public:
  absl::StatusOr<Move> Decide(const GameState& state, PlayerId self) override;
  std::string_view name() const override { return "base"; }
};

enum class StrategyKind : uint8_t { kBase, kRandom, kCorner };

std::string_view StrategyKindName(StrategyKind kind);

absl::StatusOr<StrategyKind> ParseStrategyKind(std::string_view name);

// `seed` only matters for strategies that draw random numbers.
std::unique_ptr<Strategy> MakeStrategy(StrategyKind kind, uint32_t seed);

// Looks `self` up in `state`.
absl::StatusOr<const PlayerSnapshot*> FindSelf(const GameState& state,
                                               PlayerId self);

}  // namespace squink

#endif  // SQUINK_STRATEGY_H
