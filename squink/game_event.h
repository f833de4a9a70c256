#ifndef SQUINK_GAME_EVENT_H
#define SQUINK_GAME_EVENT_H

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "squink/types.h"

namespace squink {

enum class PaintEffect : uint8_t {
  kPainted,       // The cell was unclaimed.
  kRepainted,     // The cell belonged to another player.
  kAlreadyOwned,  // The mover already owned it, nothing changed.
};

// What an accepted move did.
struct TurnOutcome {
  PlayerId player;
  Coord target;
  PaintEffect effect = PaintEffect::kPainted;
  std::optional<PlayerId> previous_owner;
  // Round (0-based) the move was played in.
  uint32_t round = 0;
  bool round_completed = false;
  bool game_finished = false;
};

struct PlayerRegistered {
  PlayerId player;
  std::string name;
  Coord start;
};
struct GameStarted {
  uint32_t players;
};
struct TurnTaken {
  TurnOutcome outcome;
};
struct RoundCompleted {
  uint32_t rounds_played;
  uint32_t rounds_remaining;
  // Players that did not move before the round was closed by a tick.
  std::vector<PlayerId> skipped;
};
struct GameEnded {
  std::vector<PlayerId> winners;
};

using GameEvent = std::variant<PlayerRegistered, GameStarted, TurnTaken,
                               RoundCompleted, GameEnded>;

class GameListener {
 public:
  virtual ~GameListener() = default;
  virtual void OnGameEvent(const GameEvent& event) = 0;
};

}  // namespace squink

#endif  // SQUINK_GAME_EVENT_H
