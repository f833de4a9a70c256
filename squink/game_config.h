#ifndef SQUINK_GAME_CONFIG_H
#define SQUINK_GAME_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <ostream>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/substitute.h"

namespace squink {

// Upper bound on the roster size, independent of the board size.
inline constexpr size_t kPlayerLimit = 80;

// Bounds on the byte length of a player's name.
inline constexpr size_t kMinNameSize = 3;
inline constexpr size_t kMaxNameSize = 16;

// Parameters fixed for the lifetime of a game.
struct GameConfig {
  int32_t width = 0;
  int32_t height = 0;
  uint64_t buy_in = 0;
  // Clock ticks that must pass before the game may be started.
  uint32_t forming_rounds = 0;
  uint32_t rounds = 0;
  size_t max_players = kPlayerLimit;

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const GameConfig& config) {
    sink.Append(absl::Substitute(
        "$0x$1 buy-in $2, $3 forming rounds, $4 rounds, up to $5 players",
        config.width, config.height, config.buy_in, config.forming_rounds,
        config.rounds, config.max_players));
  }

  friend std::ostream& operator<<(std::ostream& os, const GameConfig& config) {
    os << absl::StrCat(config);
    return os;
  }
};

absl::Status ValidateGameConfig(const GameConfig& config);

}  // namespace squink

#endif  // SQUINK_GAME_CONFIG_H
