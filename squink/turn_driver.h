#ifndef SQUINK_TURN_DRIVER_H
#define SQUINK_TURN_DRIVER_H

#include <cstddef>
#include <cstdint>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"

#include "squink/game_client.h"
#include "squink/game_state.h"
#include "squink/strategy.h"
#include "squink/types.h"

namespace squink {

struct TurnDriverOptions {
  // Pause before retrying after a transient failure.
  absl::Duration retry_delay = absl::Milliseconds(100);
  // Pause between polls while the game is forming or the player already
  // moved this round.
  absl::Duration poll_interval = absl::Milliseconds(50);
};

enum class StepResult : uint8_t {
  kSubmitted,  // A move for this player was accepted.
  kWaiting,    // Nothing to do yet.
  kFinished,   // The game is over.
};

// Plays one player: asks its strategy for a move whenever the player may
// move and hands the move to the engine.
//
// Transient failures are retried without limit. Before resubmitting, the
// driver looks at the game again, so a move that reached the engine before
// the channel failed is never sent twice. Engine rejections and NoLegalMove
// end the iteration and are returned as is.
class TurnDriver {
 public:
  TurnDriver(GameClient* client, PlayerId player, Strategy* strategy,
             TurnDriverOptions options = {});

  absl::StatusOr<StepResult> Step();

  // Steps until the game is finished. Returns the first failure that is not
  // transient.
  absl::Status Run();

  PlayerId player() const { return player_; }
  size_t turns_submitted() const { return turns_submitted_; }
  size_t retries() const { return retries_; }

 private:
  absl::StatusOr<GameState> QueryWithRetry();
  absl::StatusOr<StepResult> SubmitWithRetry(const Move& move,
                                             uint32_t round);

  GameClient* client_;
  PlayerId player_;
  Strategy* strategy_;
  TurnDriverOptions options_;
  size_t turns_submitted_ = 0;
  size_t retries_ = 0;
};

}  // namespace squink

#endif  // SQUINK_TURN_DRIVER_H
