#include "squink/strategy.h"

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"

#include "squink/corner_strategy.h"
#include "squink/error.h"
#include "squink/random_strategy.h"

namespace squink {
namespace {

constexpr std::array kForwardOrder = {Direction::kRight, Direction::kDown,
                                      Direction::kLeft, Direction::kUp};

constexpr std::array<std::pair<StrategyKind, std::string_view>, 3>
    kStrategyNames = {{{StrategyKind::kBase, "base"},
                       {StrategyKind::kRandom, "random"},
                       {StrategyKind::kCorner, "corner"}}};

}  // namespace

absl::StatusOr<const PlayerSnapshot*> FindSelf(const GameState& state,
                                               PlayerId self) {
  const PlayerSnapshot* player = state.FindPlayer(self);
  if (player == nullptr) {
    return MakeError(ErrorKind::kUnknownPlayer, absl::StrCat(self));
  }
  return player;
}

absl::StatusOr<Move> BaseStrategy::Decide(const GameState& state,
                                          PlayerId self) {
  absl::StatusOr<const PlayerSnapshot*> me = FindSelf(state, self);
  if (!me.ok()) {
    return me.status();
  }
  Coord position = (*me)->position;
  for (Direction d : kForwardOrder) {
    if (state.Contains(position.Neighbor(d))) {
      return Move::Toward(position, d);
    }
  }
  return MakeError(ErrorKind::kNoLegalMove,
                   absl::StrCat(self, " is boxed in at ", position));
}

std::string_view StrategyKindName(StrategyKind kind) {
  for (const auto& [k, name] : kStrategyNames) {
    if (k == kind) {
      return name;
    }
  }
  return "unknown";
}

absl::StatusOr<StrategyKind> ParseStrategyKind(std::string_view name) {
  std::string lower = absl::AsciiStrToLower(name);
  for (const auto& [kind, known] : kStrategyNames) {
    if (known == lower) {
      return kind;
    }
  }
  return MakeError(ErrorKind::kInvalidConfig,
                   absl::StrCat("unknown strategy \"", name,
                                "\", expected base, random or corner"));
}

std::unique_ptr<Strategy> MakeStrategy(StrategyKind kind, uint32_t seed) {
  switch (kind) {
    case StrategyKind::kBase:
      return std::make_unique<BaseStrategy>();
    case StrategyKind::kRandom:
      return std::make_unique<RandomStrategy>(seed);
    case StrategyKind::kCorner:
      return std::make_unique<CornerStrategy>();
  }
  return nullptr;
}

}  // namespace squink
