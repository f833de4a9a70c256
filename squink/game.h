#ifndef SQUINK_GAME_H
#define SQUINK_GAME_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"

#include "squink/event_hub.h"
#include "squink/game_config.h"
#include "squink/game_event.h"
#include "squink/game_state.h"
#include "squink/grid.h"
#include "squink/types.h"

namespace squink {

// The game engine. Owns the grid and the roster and moves the game through
// Forming -> Active -> Finished.
//
// Every mutating call is serialized on one exclusive lock; queries share a
// reader lock and hand out copies. Events produced by a call are queued
// under the lock, so listeners see them in the order the state changed, and
// delivered after it is released.
//
// Turn order: within a round every player moves exactly once, in any order.
// The round closes when the last player moved or when Tick() fires.
class Game {
 public:
  static absl::StatusOr<std::unique_ptr<Game>> Create(const GameConfig& config);

  Game(const Game&) = delete;
  Game& operator=(const Game&) = delete;

  // `name` must be kMinNameSize to kMaxNameSize bytes and unique within the
  // game.
  absl::Status RegisterPlayer(PlayerId id, std::string_view name,
                              uint64_t payment);

  // External clock. Counts the forming countdown down while Forming and
  // closes the current round while Active.
  absl::Status Tick();

  absl::Status StartGame();

  absl::StatusOr<TurnOutcome> SubmitTurn(PlayerId player, const Move& move);

  GameState QueryState() const;
  absl::StatusOr<std::optional<PlayerId>> CellAt(const Coord& c) const;
  absl::StatusOr<uint64_t> Score(PlayerId player) const;
  Phase phase() const;
  const GameConfig& config() const { return config_; }

  // Highest scoring players once the game is finished. Ties are all
  // reported.
  absl::StatusOr<std::vector<PlayerId>> Winners() const;

  void AddListener(GameListener* listener) { hub_.Subscribe(listener); }
  void RemoveListener(GameListener* listener) { hub_.Unsubscribe(listener); }

 private:
  struct Player {
    PlayerId id;
    std::string name;
    Coord position;
    uint64_t score = 0;
    bool has_moved = false;
  };

  Game(const GameConfig& config, Grid grid);

  // Bookkeeping for a claim made by `player`.
  void ApplyClaim(Player& player, const ClaimResult& claim)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
  void CloseRound(std::vector<GameEvent>& events)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
  void Finish(std::vector<GameEvent>& events)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
  void CheckScoresLocked() const ABSL_SHARED_LOCKS_REQUIRED(mu_);

  const GameConfig config_;
  EventHub hub_;

  mutable absl::Mutex mu_;
  Phase phase_ ABSL_GUARDED_BY(mu_) = Phase::kForming;
  Grid grid_ ABSL_GUARDED_BY(mu_);
  std::vector<Player> players_ ABSL_GUARDED_BY(mu_);
  absl::flat_hash_map<PlayerId, size_t> index_ ABSL_GUARDED_BY(mu_);
  absl::flat_hash_set<std::string> names_ ABSL_GUARDED_BY(mu_);
  uint32_t forming_rounds_remaining_ ABSL_GUARDED_BY(mu_);
  uint32_t rounds_remaining_ ABSL_GUARDED_BY(mu_);
  uint32_t rounds_played_ ABSL_GUARDED_BY(mu_) = 0;
  size_t moved_this_round_ ABSL_GUARDED_BY(mu_) = 0;
  uint64_t pot_ ABSL_GUARDED_BY(mu_) = 0;
};

}  // namespace squink

#endif  // SQUINK_GAME_H
