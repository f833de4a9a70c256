#include "squink/game.h"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <numeric>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/substitute.h"
#include "absl/synchronization/mutex.h"

#include "squink/error.h"

namespace squink {
namespace {

absl::Status PhaseError(Phase phase, std::string_view operation) {
  switch (phase) {
    case Phase::kForming:
      return MakeError(ErrorKind::kGameNotActive,
                       absl::StrCat(operation, " needs a started game"));
    case Phase::kActive:
      return MakeError(ErrorKind::kAlreadyStarted,
                       absl::StrCat(operation, " is only allowed while forming"));
    case Phase::kFinished:
      return MakeError(ErrorKind::kGameFinished,
                       absl::StrCat(operation, " after the game ended"));
  }
  return absl::InternalError("unknown phase");
}

}  // namespace

// static
absl::StatusOr<std::unique_ptr<Game>> Game::Create(const GameConfig& config) {
  if (absl::Status status = ValidateGameConfig(config); !status.ok()) {
    return status;
  }
  absl::StatusOr<Grid> grid = Grid::Create(config.width, config.height);
  if (!grid.ok()) {
    return grid.status();
  }
  LOG(INFO) << "New game: " << config;
  return absl::WrapUnique(new Game(config, std::move(grid).value()));
}

Game::Game(const GameConfig& config, Grid grid)
    : config_(config),
      grid_(std::move(grid)),
      forming_rounds_remaining_(config.forming_rounds),
      rounds_remaining_(config.rounds) {}

absl::Status Game::RegisterPlayer(PlayerId id, std::string_view name,
                                  uint64_t payment) {
  std::vector<GameEvent> events;
  {
    absl::MutexLock lock(&mu_);
    if (phase_ != Phase::kForming) {
      return PhaseError(phase_, "registration");
    }
    if (name.size() < kMinNameSize || name.size() > kMaxNameSize) {
      return MakeError(ErrorKind::kInvalidName,
                       absl::Substitute("\"$0\" is $1 bytes, expected $2 to $3",
                                        absl::CEscape(name), name.size(),
                                        kMinNameSize, kMaxNameSize));
    }
    if (payment < config_.buy_in) {
      return MakeError(ErrorKind::kInsufficientBuyIn,
                       absl::Substitute("$0 paid $1, buy-in is $2", id,
                                        payment, config_.buy_in));
    }
    if (index_.contains(id)) {
      return MakeError(ErrorKind::kAlreadyRegistered, absl::StrCat(id));
    }
    if (players_.size() >= config_.max_players ||
        players_.size() >= grid_.size()) {
      return MakeError(ErrorKind::kGameFull,
                       absl::Substitute("$0 players already registered",
                                        players_.size()));
    }
    if (names_.contains(name)) {
      return MakeError(ErrorKind::kNameTaken,
                       absl::StrCat("\"", name, "\""));
    }
    // Reverse row-major from the bottom-right corner keeps starting cells
    // distinct for as many players as there are cells.
    Coord start = grid_.CoordAt(grid_.size() - 1 - players_.size());
    index_.emplace(id, players_.size());
    players_.push_back(
        Player{.id = id, .name = std::string(name), .position = start});
    names_.emplace(name);
    pot_ += payment;
    LOG(INFO) << absl::Substitute("Registered $0 as $1 at $2, pot $3", id,
                                  name, start, pot_);
    events.push_back(PlayerRegistered{
        .player = id, .name = std::string(name), .start = start});
    hub_.Enqueue(events);
  }
  hub_.Drain();
  return absl::OkStatus();
}

absl::Status Game::Tick() {
  std::vector<GameEvent> events;
  {
    absl::MutexLock lock(&mu_);
    switch (phase_) {
      case Phase::kForming:
        if (forming_rounds_remaining_ > 0) {
          --forming_rounds_remaining_;
        }
        VLOG(1) << "Forming rounds remaining: " << forming_rounds_remaining_;
        break;
      case Phase::kActive:
        CloseRound(events);
        break;
      case Phase::kFinished:
        return PhaseError(phase_, "tick");
    }
    hub_.Enqueue(events);
  }
  hub_.Drain();
  return absl::OkStatus();
}

absl::Status Game::StartGame() {
  std::vector<GameEvent> events;
  {
    absl::MutexLock lock(&mu_);
    if (phase_ != Phase::kForming) {
      return PhaseError(phase_, "start");
    }
    if (forming_rounds_remaining_ > 0) {
      return MakeError(ErrorKind::kNotYetFormed,
                       absl::Substitute("$0 forming rounds remaining",
                                        forming_rounds_remaining_));
    }
    if (players_.empty()) {
      return MakeError(ErrorKind::kNoPlayers, "nobody registered");
    }
    for (Player& player : players_) {
      absl::StatusOr<ClaimResult> claim =
          grid_.Claim(player.position, player.id, 0);
      CHECK_OK(claim.status()) << "starting cells are always on the grid";
      ApplyClaim(player, *claim);
    }
    CheckScoresLocked();
    phase_ = Phase::kActive;
    LOG(INFO) << "Game started with " << players_.size() << " players, "
              << rounds_remaining_ << " rounds";
    events.push_back(
        GameStarted{.players = static_cast<uint32_t>(players_.size())});
    if (rounds_remaining_ == 0) {
      Finish(events);
    }
    hub_.Enqueue(events);
  }
  hub_.Drain();
  return absl::OkStatus();
}

absl::StatusOr<TurnOutcome> Game::SubmitTurn(PlayerId player_id,
                                             const Move& move) {
  std::vector<GameEvent> events;
  TurnOutcome outcome;
  {
    absl::MutexLock lock(&mu_);
    if (phase_ != Phase::kActive) {
      return PhaseError(phase_, "turn");
    }
    auto it = index_.find(player_id);
    if (it == index_.end()) {
      return MakeError(ErrorKind::kUnknownPlayer, absl::StrCat(player_id));
    }
    Player& player = players_[it->second];
    if (player.has_moved) {
      return MakeError(
          ErrorKind::kTurnAlreadySubmitted,
          absl::Substitute("$0 already moved in round $1", player_id,
                           rounds_played_));
    }
    if (!move.target.IsAdjacentTo(player.position)) {
      return MakeError(ErrorKind::kIllegalMove,
                       absl::Substitute("$0 is not next to $1", move.target,
                                        player.position));
    }
    if (!grid_.Contains(move.target)) {
      return MakeError(ErrorKind::kOutOfBounds,
                       absl::Substitute("$0 is outside of $1x$2", move.target,
                                        grid_.width(), grid_.height()));
    }
    absl::StatusOr<ClaimResult> claim =
        grid_.Claim(move.target, player_id, rounds_played_);
    if (!claim.ok()) {
      return claim.status();
    }
    player.position = move.target;
    player.has_moved = true;
    ApplyClaim(player, *claim);
    ++moved_this_round_;
    CheckScoresLocked();

    outcome = TurnOutcome{
        .player = player_id,
        .target = move.target,
        .effect = !claim->changed                   ? PaintEffect::kAlreadyOwned
                  : claim->previous_owner.has_value() ? PaintEffect::kRepainted
                                                      : PaintEffect::kPainted,
        .previous_owner = claim->previous_owner,
        .round = rounds_played_,
    };
    VLOG(1) << absl::Substitute("$0 moved to $1, score $2", player_id,
                                move.target, player.score);

    std::vector<GameEvent> round_events;
    if (moved_this_round_ == players_.size()) {
      CloseRound(round_events);
      outcome.round_completed = true;
    }
    outcome.game_finished = phase_ == Phase::kFinished;
    events.push_back(TurnTaken{.outcome = outcome});
    events.insert(events.end(), std::make_move_iterator(round_events.begin()),
                  std::make_move_iterator(round_events.end()));
    hub_.Enqueue(events);
  }
  hub_.Drain();
  return outcome;
}

GameState Game::QueryState() const {
  absl::ReaderMutexLock lock(&mu_);
  GameState state{
      .phase = phase_,
      .width = grid_.width(),
      .height = grid_.height(),
      .buy_in = config_.buy_in,
      .pot = pot_,
      .forming_rounds_remaining = forming_rounds_remaining_,
      .rounds_remaining = rounds_remaining_,
      .rounds_played = rounds_played_,
      .cells = {grid_.cells().begin(), grid_.cells().end()},
  };
  state.players.reserve(players_.size());
  for (const Player& p : players_) {
    state.players.push_back(PlayerSnapshot{.id = p.id,
                                           .name = p.name,
                                           .position = p.position,
                                           .score = p.score,
                                           .has_moved = p.has_moved});
  }
  return state;
}

absl::StatusOr<std::optional<PlayerId>> Game::CellAt(const Coord& c) const {
  absl::ReaderMutexLock lock(&mu_);
  return grid_.CellAt(c);
}

absl::StatusOr<uint64_t> Game::Score(PlayerId player) const {
  absl::ReaderMutexLock lock(&mu_);
  auto it = index_.find(player);
  if (it == index_.end()) {
    return MakeError(ErrorKind::kUnknownPlayer, absl::StrCat(player));
  }
  return players_[it->second].score;
}

Phase Game::phase() const {
  absl::ReaderMutexLock lock(&mu_);
  return phase_;
}

absl::StatusOr<std::vector<PlayerId>> Game::Winners() const {
  absl::ReaderMutexLock lock(&mu_);
  if (phase_ != Phase::kFinished) {
    return MakeError(ErrorKind::kGameNotFinished,
                     absl::StrCat("game is ", PhaseName(phase_)));
  }
  return HighestScoring(players_);
}

void Game::ApplyClaim(Player& player, const ClaimResult& claim) {
  if (!claim.changed) {
    return;
  }
  if (claim.previous_owner.has_value()) {
    auto it = index_.find(*claim.previous_owner);
    CHECK(it != index_.end()) << "cell owned by unknown " << *claim.previous_owner;
    Player& previous = players_[it->second];
    CHECK_GT(previous.score, 0u);
    --previous.score;
  }
  ++player.score;
}

void Game::CloseRound(std::vector<GameEvent>& events) {
  CHECK_GT(rounds_remaining_, 0u);
  std::vector<PlayerId> skipped;
  for (Player& player : players_) {
    if (!player.has_moved) {
      skipped.push_back(player.id);
    }
    player.has_moved = false;
  }
  moved_this_round_ = 0;
  ++rounds_played_;
  --rounds_remaining_;
  if (!skipped.empty()) {
    LOG(INFO) << "Round " << rounds_played_ << " closed, skipped: "
              << absl::StrJoin(skipped, ", ",
                               [](std::string* out, PlayerId id) {
                                 absl::StrAppend(out, id);
                               });
  } else {
    LOG(INFO) << "Round " << rounds_played_ << " complete, "
              << rounds_remaining_ << " remaining";
  }
  events.push_back(RoundCompleted{.rounds_played = rounds_played_,
                                  .rounds_remaining = rounds_remaining_,
                                  .skipped = std::move(skipped)});
  if (rounds_remaining_ == 0) {
    Finish(events);
  }
}

void Game::Finish(std::vector<GameEvent>& events) {
  phase_ = Phase::kFinished;
  std::vector<PlayerId> winners = HighestScoring(players_);
  LOG(INFO) << "Game finished after " << rounds_played_ << " rounds, "
            << grid_.claimed_count() << "/" << grid_.size()
            << " cells painted, leading: "
            << absl::StrJoin(winners, ", ", [](std::string* out, PlayerId id) {
                 absl::StrAppend(out, id);
               });
  events.push_back(GameEnded{.winners = std::move(winners)});
}

void Game::CheckScoresLocked() const {
  DCHECK_EQ(std::accumulate(players_.begin(), players_.end(), uint64_t{0},
                            [](uint64_t sum, const Player& p) {
                              return sum + p.score;
                            }),
            grid_.claimed_count());
}

}  // namespace squink
