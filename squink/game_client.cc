#include "squink/game_client.h"

#include "absl/status/statusor.h"

namespace squink {

absl::StatusOr<GameState> LocalGameClient::QueryState() {
  return game_->QueryState();
}

absl::StatusOr<TurnOutcome> LocalGameClient::SubmitTurn(PlayerId player,
                                                        const Move& move) {
  return game_->SubmitTurn(player, move);
}

}  // namespace squink
