#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"

#include "squink/game_config.h"
#include "squink/game_state.h"
#include "squink/match.h"
#include "squink/strategy.h"
#include "squink/types.h"

ABSL_FLAG(int32_t, width, 8, "Grid width");
ABSL_FLAG(int32_t, height, 8, "Grid height");
ABSL_FLAG(uint64_t, buy_in, 10, "Payment each player makes to register");
ABSL_FLAG(uint32_t, forming_rounds, 1, "Ticks before the game may start");
ABSL_FLAG(uint32_t, rounds, 20, "Rounds to play");
ABSL_FLAG(std::string, strategies, "base,random,corner",
          "Comma-separated strategy per player: base, random or corner");
ABSL_FLAG(uint32_t, seed, 1, "Random seed, 0 to pick one");
ABSL_FLAG(bool, render, false, "Print the board after every round");

namespace {

absl::StatusOr<std::vector<squink::StrategyKind>> ParseStrategies(
    std::string_view list) {
  std::vector<squink::StrategyKind> kinds;
  for (std::string_view name : absl::StrSplit(list, ',', absl::SkipEmpty())) {
    absl::StatusOr<squink::StrategyKind> kind = squink::ParseStrategyKind(
        absl::StripAsciiWhitespace(name));
    if (!kind.ok()) {
      return kind.status();
    }
    kinds.push_back(*kind);
  }
  return kinds;
}

}  // namespace

int main(int argc, char** argv) {
  auto args = absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();
  absl::SetStderrThreshold(absl::LogSeverity::kInfo);
  if (args.size() > 1) {
    std::cerr << "Unexpected arguments: "
              << absl::StrJoin(args.begin() + 1, args.end(), " ") << "\n";
    return 1;
  }
  absl::StatusOr<std::vector<squink::StrategyKind>> strategies =
      ParseStrategies(absl::GetFlag(FLAGS_strategies));
  if (!strategies.ok()) {
    LOG(ERROR) << strategies.status();
    return 1;
  }
  squink::MatchConfig config{
      .game = {.width = absl::GetFlag(FLAGS_width),
               .height = absl::GetFlag(FLAGS_height),
               .buy_in = absl::GetFlag(FLAGS_buy_in),
               .forming_rounds = absl::GetFlag(FLAGS_forming_rounds),
               .rounds = absl::GetFlag(FLAGS_rounds)},
      .strategies = *std::move(strategies),
      .seed = absl::GetFlag(FLAGS_seed)};
  absl::StatusOr<std::unique_ptr<squink::Match>> match =
      squink::Match::Create(config);
  if (!match.ok()) {
    LOG(ERROR) << "Bad configuration: " << match.status();
    return 1;
  }
  bool render = absl::GetFlag(FLAGS_render);
  absl::StatusOr<squink::MatchReport> report =
      (*match)->Play([render](const squink::GameState& state) {
        if (render) {
          std::cout << absl::StrCat(state) << "\n\n";
        }
      });
  if (!report.ok()) {
    LOG(ERROR) << "Match failed: " << report.status();
    return 1;
  }
  for (const squink::RetiredPlayer& retired : report->retired) {
    LOG(WARNING) << retired.player << " retired: " << retired.reason;
  }
  std::cout << absl::StrCat(report->final_state) << "\n";
  const squink::GameState& final_state = report->final_state;
  std::cout << "Winners: "
            << absl::StrJoin(report->winners, ", ",
                             [&final_state](std::string* out,
                                            squink::PlayerId id) {
                               const squink::PlayerSnapshot* player =
                                   final_state.FindPlayer(id);
                               absl::StrAppend(out, player->name, " (", id,
                                               ", score ", player->score, ")");
                             })
            << "\n";
  return 0;
}
