#ifndef SQUINK_GAME_CLIENT_H
#define SQUINK_GAME_CLIENT_H

#include "absl/status/statusor.h"

#include "squink/game.h"
#include "squink/game_event.h"
#include "squink/game_state.h"
#include "squink/types.h"

namespace squink {

// How a driver reaches the engine. Implementations that go over a wire
// report channel failures as absl::StatusCode::kUnavailable without an
// ErrorKind; everything else is the engine's verdict.
class GameClient {
 public:
  virtual ~GameClient() = default;

  virtual absl::StatusOr<GameState> QueryState() = 0;
  virtual absl::StatusOr<TurnOutcome> SubmitTurn(PlayerId player,
                                                 const Move& move) = 0;
};

// Calls an in-process engine directly. Never fails transiently.
class LocalGameClient : public GameClient {
 public:
  explicit LocalGameClient(Game* game) : game_(game) {}

  absl::StatusOr<GameState> QueryState() override;
  absl::StatusOr<TurnOutcome> SubmitTurn(PlayerId player,
                                         const Move& move) override;

 private:
  Game* game_;
};

}  // namespace squink

#endif  // SQUINK_GAME_CLIENT_H
