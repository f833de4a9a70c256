#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <utility>
#include <vector>

#include <benchmark/benchmark.h>

#include "absl/log/check.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"

#include "squink/corner_strategy.h"
#include "squink/game.h"
#include "squink/game_state.h"
#include "squink/match.h"
#include "squink/strategy.h"
#include "squink/types.h"

namespace {

std::unique_ptr<squink::Game> StartedGame(int32_t extent, size_t players,
                                          uint32_t rounds) {
  absl::StatusOr<std::unique_ptr<squink::Game>> game = squink::Game::Create(
      {.width = extent, .height = extent, .rounds = rounds});
  CHECK_OK(game.status());
  for (size_t i = 0; i < players; ++i) {
    CHECK_OK((*game)->RegisterPlayer(squink::PlayerId{i + 1},
                                     absl::StrCat("bench-", i + 1), 0));
  }
  CHECK_OK((*game)->StartGame());
  return std::move(game).value();
}

// One full round of accepted moves.
void BM_SubmitTurn(benchmark::State& state) {
  int32_t extent = state.range(0);
  size_t players = state.range(1);
  std::unique_ptr<squink::Game> game =
      StartedGame(extent, players, std::numeric_limits<uint32_t>::max());
  squink::BaseStrategy strategy;
  for (auto _ : state) {
    for (size_t i = 0; i < players; ++i) {
      squink::PlayerId id{i + 1};
      // Keeps the move choice out of the measurement as far as possible.
      state.PauseTiming();
      squink::GameState snapshot = game->QueryState();
      absl::StatusOr<squink::Move> move = strategy.Decide(snapshot, id);
      state.ResumeTiming();
      CHECK_OK(move.status());
      benchmark::DoNotOptimize(game->SubmitTurn(id, *move));
    }
  }
  state.SetItemsProcessed(state.iterations() * players);
}

void BM_QueryState(benchmark::State& state) {
  std::unique_ptr<squink::Game> game =
      StartedGame(state.range(0), state.range(1), 1);
  for (auto _ : state) {
    benchmark::DoNotOptimize(game->QueryState());
  }
}

void BM_CornerDecide(benchmark::State& state) {
  std::unique_ptr<squink::Game> game = StartedGame(state.range(0), 1, 1);
  squink::GameState snapshot = game->QueryState();
  for (auto _ : state) {
    squink::CornerStrategy strategy;
    benchmark::DoNotOptimize(strategy.Decide(snapshot, squink::PlayerId{1}));
  }
}

void BM_Match(benchmark::State& state) {
  int32_t extent = state.range(0);
  for (auto _ : state) {
    absl::StatusOr<std::unique_ptr<squink::Match>> match =
        squink::Match::Create(squink::MatchConfig{
            .game = {.width = extent, .height = extent, .rounds = 100},
            .strategies = {squink::StrategyKind::kBase,
                           squink::StrategyKind::kRandom,
                           squink::StrategyKind::kCorner,
                           squink::StrategyKind::kRandom}});
    CHECK_OK(match.status());
    benchmark::DoNotOptimize((*match)->Play());
  }
}

}  // namespace

BENCHMARK(BM_SubmitTurn)->Args({16, 4})->Args({64, 16})->Args({256, 80});
BENCHMARK(BM_QueryState)->Args({16, 4})->Args({256, 80})->Args({1024, 80});
BENCHMARK(BM_CornerDecide)->Arg(16)->Arg(256);
BENCHMARK(BM_Match)->Arg(16)->Arg(64);

int main(int argc, char** argv) {
  absl::InitializeLog();
  absl::SetStderrThreshold(absl::LogSeverity::kWarning);
  ::benchmark::Initialize(&argc, argv);
  ::benchmark::RunSpecifiedBenchmarks();
}
