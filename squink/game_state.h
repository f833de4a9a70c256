#ifndef SQUINK_GAME_STATE_H
#define SQUINK_GAME_STATE_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/substitute.h"

#include "squink/grid.h"
#include "squink/types.h"

namespace squink {

struct PlayerSnapshot {
  PlayerId id;
  std::string name;
  Coord position;
  uint64_t score = 0;
  bool has_moved = false;

  friend bool operator==(const PlayerSnapshot& a,
                         const PlayerSnapshot& b) = default;

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const PlayerSnapshot& player) {
    sink.Append(absl::Substitute("$0 ($1) at $2 score $3$4", player.name,
                                 player.id, player.position, player.score,
                                 player.has_moved ? " (moved)" : ""));
  }
};

// Ids of the players sharing the highest score, in the order given. Works on
// any range of elements with `id` and `score` members.
template <typename Players>
std::vector<PlayerId> HighestScoring(const Players& players) {
  std::vector<PlayerId> leaders;
  uint64_t best = 0;
  for (const auto& p : players) {
    if (leaders.empty() || p.score > best) {
      leaders = {p.id};
      best = p.score;
    } else if (p.score == best) {
      leaders.push_back(p.id);
    }
  }
  return leaders;
}

// Copy of everything an observer may see. Strategies decide from this and
// nothing else.
struct GameState {
  Phase phase = Phase::kForming;
  int32_t width = 0;
  int32_t height = 0;
  uint64_t buy_in = 0;
  uint64_t pot = 0;
  uint32_t forming_rounds_remaining = 0;
  uint32_t rounds_remaining = 0;
  uint32_t rounds_played = 0;
  // Row-major, index is x + y * width.
  std::vector<Cell> cells;
  // Registration order.
  std::vector<PlayerSnapshot> players;

  bool Contains(const Coord& c) const {
    return c.x >= 0 && c.y >= 0 && c.x < width && c.y < height;
  }

  // nullopt for unclaimed and for off-grid cells.
  std::optional<PlayerId> OwnerAt(const Coord& c) const;

  const PlayerSnapshot* FindPlayer(PlayerId id) const;

  // Directions from `from` that stay on the grid, in kAllDirections order.
  std::vector<Direction> LegalDirections(const Coord& from) const;

  size_t ClaimedCount() const;

  // Players sharing the highest score, registration order.
  std::vector<PlayerId> Leaders() const { return HighestScoring(players); }

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const GameState& state) {
    sink.Append(absl::Substitute(
        "$0 $1x$2, forming $3, rounds played $4, remaining $5, pot $6\n",
        PhaseName(state.phase), state.width, state.height,
        state.forming_rounds_remaining, state.rounds_played,
        state.rounds_remaining, state.pot));
    for (int32_t y = 0; y < state.height; ++y) {
      std::vector<std::string> row;
      for (int32_t x = 0; x < state.width; ++x) {
        std::optional<PlayerId> owner = state.OwnerAt(Coord{x, y});
        row.push_back(owner.has_value() ? absl::StrCat(owner->value) : ".");
      }
      sink.Append(absl::StrCat(absl::StrJoin(row, " "), "\n"));
    }
    sink.Append(absl::StrJoin(state.players, "; ",
                              [](std::string* out, const PlayerSnapshot& p) {
                                absl::StrAppend(out, p);
                              }));
  }
};

}  // namespace squink

#endif  // SQUINK_GAME_STATE_H
