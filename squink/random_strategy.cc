#include "squink/random_strategy.h"

#include <cstdint>
#include <random>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"

#include "squink/error.h"

namespace squink {

RandomStrategy::RandomStrategy(uint32_t seed) {
  if (seed == 0) {
    std::random_device rd;
    seed = rd();
  }
  gen_.seed(seed);
}

absl::StatusOr<Move> RandomStrategy::Decide(const GameState& state,
                                            PlayerId self) {
  absl::StatusOr<const PlayerSnapshot*> me = FindSelf(state, self);
  if (!me.ok()) {
    return me.status();
  }
  Coord position = (*me)->position;
  std::vector<Direction> legal = state.LegalDirections(position);
  if (legal.empty()) {
    return MakeError(ErrorKind::kNoLegalMove,
                     absl::StrCat(self, " is boxed in at ", position));
  }
  std::uniform_int_distribution<size_t> pick(0, legal.size() - 1);
  return Move::Toward(position, legal[pick(gen_)]);
}

}  // namespace squink
