#ifndef SQUINK_MATCH_H
#define SQUINK_MATCH_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "absl/functional/any_invocable.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "squink/game.h"
#include "squink/game_client.h"
#include "squink/game_config.h"
#include "squink/game_state.h"
#include "squink/strategy.h"
#include "squink/turn_driver.h"
#include "squink/types.h"

namespace squink {

struct MatchConfig {
  GameConfig game;
  // One player per entry, registered in this order with ids 1, 2, ...
  std::vector<StrategyKind> strategies;
  // Player i gets PlayerSeed(seed, i). 0 leaves every player to
  // std::random_device.
  uint32_t seed = 1;
};

// Seed for the strategy of the player at `player_index`. Counts up from
// `seed` and wraps around past 0, which would mean "unseeded".
uint32_t PlayerSeed(uint32_t seed, size_t player_index);

struct RetiredPlayer {
  PlayerId player;
  absl::Status reason;
};

struct MatchReport {
  GameState final_state;
  std::vector<PlayerId> winners;
  std::vector<RetiredPlayer> retired;
};

// Plays a whole game in-process on the calling thread: registers every
// player under "<strategy>-<id>", counts the forming rounds down, starts the game and steps each
// player's driver once per round until the game is over. Players whose
// driver fails are retired; a round they leave open is closed with a tick.
class Match {
 public:
  static absl::StatusOr<std::unique_ptr<Match>> Create(
      const MatchConfig& config);

  // `on_round` sees the game after every closed round.
  absl::StatusOr<MatchReport> Play(
      absl::AnyInvocable<void(const GameState&)> on_round = nullptr);

  Game& game() { return *game_; }

 private:
  Match(std::unique_ptr<Game> game, const MatchConfig& config);

  absl::Status Prepare();
  absl::Status PlayRound(std::vector<RetiredPlayer>& retired);

  std::unique_ptr<Game> game_;
  MatchConfig config_;
  LocalGameClient client_;
  std::vector<std::unique_ptr<Strategy>> strategies_;
  std::vector<TurnDriver> drivers_;
  std::vector<bool> live_;
};

}  // namespace squink

#endif  // SQUINK_MATCH_H
