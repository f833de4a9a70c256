#include "squink/strategy.h"

#include <cstdint>
#include <memory>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/status/statusor.h"

#include "squink/error.h"
#include "squink/game_state.h"
#include "squink/random_strategy.h"
#include "squink/types.h"
#include "test/test_lib.h"

using squink::BaseStrategy;
using squink::Coord;
using squink::ErrorKind;
using squink::GameState;
using squink::Move;
using squink::PlayerId;
using squink::Strategy;
using squink::StrategyKind;
using squink::testing::BuildState;
using squink::testing::HasErrorKind;
using squink::testing::MovePlayer;

namespace {

constexpr PlayerId kSelf{1};

Coord DecideFrom(Strategy& strategy, GameState& state, const Coord& at) {
  MovePlayer(state, kSelf, at);
  absl::StatusOr<Move> move = strategy.Decide(state, kSelf);
  EXPECT_TRUE(move.ok()) << move.status();
  return move.ok() ? move->target : at;
}

}  // namespace

TEST(BaseStrategyTest, PrefersRightThenDownLeftUp) {
  GameState state = BuildState("1..", "...", "...");
  BaseStrategy strategy;
  EXPECT_EQ(DecideFrom(strategy, state, {0, 0}), (Coord{1, 0}));
  EXPECT_EQ(DecideFrom(strategy, state, {2, 0}), (Coord{2, 1}));
  EXPECT_EQ(DecideFrom(strategy, state, {2, 2}), (Coord{1, 2}));

  GameState column = BuildState(".", ".", "1");
  EXPECT_EQ(DecideFrom(strategy, column, {0, 2}), (Coord{0, 1}));
}

TEST(BaseStrategyTest, IgnoresOwnership) {
  GameState state = BuildState("12", "..");
  BaseStrategy strategy;
  EXPECT_EQ(DecideFrom(strategy, state, {0, 0}), (Coord{1, 0}));
}

TEST(BaseStrategyTest, Errors) {
  BaseStrategy strategy;
  GameState single = BuildState("1");
  EXPECT_THAT(strategy.Decide(single, kSelf),
              HasErrorKind(ErrorKind::kNoLegalMove));
  EXPECT_THAT(strategy.Decide(single, PlayerId{7}),
              HasErrorKind(ErrorKind::kUnknownPlayer));
}

TEST(StrategyTest, ParsesKinds) {
  EXPECT_EQ(squink::ParseStrategyKind("base").value(), StrategyKind::kBase);
  EXPECT_EQ(squink::ParseStrategyKind("Random").value(), StrategyKind::kRandom);
  EXPECT_EQ(squink::ParseStrategyKind("CORNER").value(), StrategyKind::kCorner);
  EXPECT_THAT(squink::ParseStrategyKind("greedy"),
              HasErrorKind(ErrorKind::kInvalidConfig));
  EXPECT_THAT(squink::ParseStrategyKind(""),
              HasErrorKind(ErrorKind::kInvalidConfig));
}

TEST(StrategyTest, Factory) {
  for (StrategyKind kind :
       {StrategyKind::kBase, StrategyKind::kRandom, StrategyKind::kCorner}) {
    std::unique_ptr<Strategy> strategy = squink::MakeStrategy(kind, 3);
    ASSERT_NE(strategy, nullptr);
    EXPECT_EQ(strategy->name(), squink::StrategyKindName(kind));
  }
}

TEST(RandomStrategyTest, OnlyLegalMove) {
  GameState state = BuildState("1.");
  for (uint32_t seed = 1; seed < 20; ++seed) {
    squink::RandomStrategy strategy(seed);
    EXPECT_EQ(DecideFrom(strategy, state, {0, 0}), (Coord{1, 0})) << seed;
  }
}

TEST(RandomStrategyTest, StaysOnGrid) {
  GameState state = BuildState("....", "....", "...1");
  squink::RandomStrategy strategy(42);
  Coord at{3, 2};
  for (int i = 0; i < 200; ++i) {
    Coord next = DecideFrom(strategy, state, at);
    ASSERT_TRUE(state.Contains(next)) << next;
    ASSERT_TRUE(next.IsAdjacentTo(at)) << at << " -> " << next;
    at = next;
  }
}

TEST(RandomStrategyTest, SameSeedSameMoves) {
  GameState state = BuildState(".....", ".....", "..1..", ".....", ".....");
  squink::RandomStrategy a(7);
  squink::RandomStrategy b(7);
  for (int i = 0; i < 50; ++i) {
    EXPECT_EQ(DecideFrom(a, state, {2, 2}), DecideFrom(b, state, {2, 2}));
  }
}

TEST(RandomStrategyTest, Errors) {
  squink::RandomStrategy strategy(1);
  GameState single = BuildState("1");
  EXPECT_THAT(strategy.Decide(single, kSelf),
              HasErrorKind(ErrorKind::kNoLegalMove));
  EXPECT_THAT(strategy.Decide(single, PlayerId{9}),
              HasErrorKind(ErrorKind::kUnknownPlayer));
}

TEST(GameStateTest, Leaders) {
  EXPECT_THAT(BuildState("112", "3..").Leaders(),
              ::testing::ElementsAre(PlayerId{1}));
  EXPECT_THAT(BuildState("21", "12").Leaders(),
              ::testing::ElementsAre(PlayerId{2}, PlayerId{1}));
  EXPECT_THAT(BuildState("...").Leaders(), ::testing::IsEmpty());
  // Zero scores still tie.
  GameState state = BuildState("..");
  MovePlayer(state, PlayerId{4}, {0, 0});
  MovePlayer(state, PlayerId{7}, {1, 0});
  EXPECT_THAT(state.Leaders(),
              ::testing::ElementsAre(PlayerId{4}, PlayerId{7}));
}

TEST(GameStateTest, HighestScoringTakesAnyRoster) {
  struct Entry {
    PlayerId id;
    uint64_t score;
  };
  std::vector<Entry> roster = {
      {PlayerId{3}, 1}, {PlayerId{1}, 5}, {PlayerId{2}, 5}, {PlayerId{9}, 4}};
  EXPECT_THAT(squink::HighestScoring(roster),
              ::testing::ElementsAre(PlayerId{1}, PlayerId{2}));
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  absl::InitializeLog();
  absl::SetStderrThreshold(absl::LogSeverity::kInfo);
  return RUN_ALL_TESTS();
}
