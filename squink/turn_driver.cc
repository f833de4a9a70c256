#include "squink/turn_driver.h"

#include <cstdint>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"

#include "squink/error.h"

namespace squink {

TurnDriver::TurnDriver(GameClient* client, PlayerId player,
                       Strategy* strategy, TurnDriverOptions options)
    : client_(client),
      player_(player),
      strategy_(strategy),
      options_(options) {}

absl::StatusOr<StepResult> TurnDriver::Step() {
  absl::StatusOr<GameState> state = QueryWithRetry();
  if (!state.ok()) {
    return state.status();
  }
  switch (state->phase) {
    case Phase::kFinished:
      return StepResult::kFinished;
    case Phase::kForming:
      return StepResult::kWaiting;
    case Phase::kActive:
      break;
  }
  const PlayerSnapshot* me = state->FindPlayer(player_);
  if (me == nullptr) {
    return MakeError(ErrorKind::kUnknownPlayer,
                     absl::StrCat(player_, " is not in the game"));
  }
  if (me->has_moved) {
    return StepResult::kWaiting;
  }
  absl::StatusOr<Move> move = strategy_->Decide(*state, player_);
  if (!move.ok()) {
    LOG(WARNING) << player_ << " (" << strategy_->name()
                 << ") has no move: " << move.status();
    return move.status();
  }
  return SubmitWithRetry(*move, state->rounds_played);
}

absl::Status TurnDriver::Run() {
  while (true) {
    absl::StatusOr<StepResult> result = Step();
    if (!result.ok()) {
      LOG(ERROR) << player_ << " stops: " << result.status();
      return result.status();
    }
    switch (*result) {
      case StepResult::kFinished:
        LOG(INFO) << player_ << " done after " << turns_submitted_
                  << " turns, " << retries_ << " retries";
        return absl::OkStatus();
      case StepResult::kWaiting:
        absl::SleepFor(options_.poll_interval);
        break;
      case StepResult::kSubmitted:
        break;
    }
  }
}

absl::StatusOr<GameState> TurnDriver::QueryWithRetry() {
  while (true) {
    absl::StatusOr<GameState> state = client_->QueryState();
    if (state.ok() || !IsTransient(state.status())) {
      return state;
    }
    ++retries_;
    LOG(WARNING) << "Querying the game failed for " << player_
                 << ", retrying: " << state.status();
    absl::SleepFor(options_.retry_delay);
  }
}

absl::StatusOr<StepResult> TurnDriver::SubmitWithRetry(const Move& move,
                                                       uint32_t round) {
  while (true) {
    absl::StatusOr<TurnOutcome> outcome = client_->SubmitTurn(player_, move);
    if (outcome.ok()) {
      ++turns_submitted_;
      VLOG(1) << player_ << " " << move << " accepted";
      return StepResult::kSubmitted;
    }
    if (!IsTransient(outcome.status())) {
      LOG(ERROR) << player_ << " " << move
                 << " rejected: " << outcome.status();
      return outcome.status();
    }
    ++retries_;
    LOG(WARNING) << player_ << " " << move
                 << " did not go through: " << outcome.status();
    absl::SleepFor(options_.retry_delay);

    // The move may have been applied before the channel broke.
    absl::StatusOr<GameState> state = QueryWithRetry();
    if (!state.ok()) {
      return state.status();
    }
    if (state->phase == Phase::kFinished) {
      return StepResult::kFinished;
    }
    if (state->rounds_played != round) {
      // Landed and closed the round, or the round was closed without us.
      // Either way the move belongs to a round that is gone.
      return StepResult::kWaiting;
    }
    const PlayerSnapshot* me = state->FindPlayer(player_);
    if (me != nullptr && me->has_moved) {
      ++turns_submitted_;
      return StepResult::kSubmitted;
    }
  }
}

}  // namespace squink
