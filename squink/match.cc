#include "squink/match.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/functional/any_invocable.h"
#include "absl/log/log.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"

namespace squink {

uint32_t PlayerSeed(uint32_t seed, size_t player_index) {
  if (seed == 0) {
    return 0;
  }
  constexpr uint64_t kNonZeroSeeds = std::numeric_limits<uint32_t>::max();
  return static_cast<uint32_t>(
      (uint64_t{seed} - 1 + player_index % kNonZeroSeeds) % kNonZeroSeeds + 1);
}

// static
absl::StatusOr<std::unique_ptr<Match>> Match::Create(
    const MatchConfig& config) {
  absl::StatusOr<std::unique_ptr<Game>> game = Game::Create(config.game);
  if (!game.ok()) {
    return game.status();
  }
  return absl::WrapUnique(new Match(std::move(game).value(), config));
}

Match::Match(std::unique_ptr<Game> game, const MatchConfig& config)
    : game_(std::move(game)), config_(config), client_(game_.get()) {
  // Everything runs on this thread, no reason to wait between steps.
  TurnDriverOptions options{.retry_delay = absl::ZeroDuration(),
                            .poll_interval = absl::ZeroDuration()};
  strategies_.reserve(config_.strategies.size());
  drivers_.reserve(config_.strategies.size());
  for (size_t i = 0; i < config_.strategies.size(); ++i) {
    strategies_.push_back(
        MakeStrategy(config_.strategies[i], PlayerSeed(config_.seed, i)));
    drivers_.emplace_back(&client_, PlayerId{i + 1}, strategies_.back().get(),
                          options);
  }
  live_.assign(drivers_.size(), true);
}

absl::StatusOr<MatchReport> Match::Play(
    absl::AnyInvocable<void(const GameState&)> on_round) {
  if (absl::Status status = Prepare(); !status.ok()) {
    return status;
  }
  std::vector<RetiredPlayer> retired;
  while (game_->phase() == Phase::kActive) {
    if (absl::Status status = PlayRound(retired); !status.ok()) {
      return status;
    }
    if (on_round != nullptr) {
      on_round(game_->QueryState());
    }
  }
  absl::StatusOr<std::vector<PlayerId>> winners = game_->Winners();
  if (!winners.ok()) {
    return winners.status();
  }
  MatchReport report{.final_state = game_->QueryState(),
                     .winners = std::move(winners).value(),
                     .retired = std::move(retired)};
  LOG(INFO) << "Final board:\n" << absl::StrCat(report.final_state);
  return report;
}

absl::Status Match::Prepare() {
  for (size_t i = 0; i < drivers_.size(); ++i) {
    std::string name =
        absl::StrCat(strategies_[i]->name(), "-", drivers_[i].player().value);
    if (absl::Status status = game_->RegisterPlayer(drivers_[i].player(), name,
                                                    config_.game.buy_in);
        !status.ok()) {
      return status;
    }
    LOG(INFO) << drivers_[i].player() << " plays " << strategies_[i]->name();
  }
  while (game_->QueryState().forming_rounds_remaining > 0) {
    if (absl::Status status = game_->Tick(); !status.ok()) {
      return status;
    }
  }
  return game_->StartGame();
}

absl::Status Match::PlayRound(std::vector<RetiredPlayer>& retired) {
  uint32_t round = game_->QueryState().rounds_played;
  for (size_t i = 0; i < drivers_.size(); ++i) {
    if (!live_[i]) {
      continue;
    }
    absl::StatusOr<StepResult> result = drivers_[i].Step();
    if (!result.ok()) {
      LOG(WARNING) << "Retiring " << drivers_[i].player() << ": "
                   << result.status();
      live_[i] = false;
      retired.push_back(RetiredPlayer{.player = drivers_[i].player(),
                                      .reason = result.status()});
      continue;
    }
    if (*result == StepResult::kFinished) {
      return absl::OkStatus();
    }
  }
  GameState state = game_->QueryState();
  if (state.phase == Phase::kActive && state.rounds_played == round) {
    // Somebody retired and left the round open.
    return game_->Tick();
  }
  return absl::OkStatus();
}

}  // namespace squink
