#ifndef SQUINK_TYPES_H
#define SQUINK_TYPES_H

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/substitute.h"

namespace squink {

enum class Direction : uint8_t {
  kLeft = 0,
  kUp = 1,
  kRight = 2,
  kDown = 3,
};

inline constexpr std::array<Direction, 4> kAllDirections = {
    Direction::kLeft, Direction::kUp, Direction::kRight, Direction::kDown};

// (dx, dy) indexed by Direction. y grows downward.
inline constexpr std::array<std::pair<int, int>, 4> kDirectionDeltas = {
    {{-1, 0}, {0, -1}, {1, 0}, {0, 1}}};

inline constexpr std::array<std::string_view, 4> kDirectionNames = {
    "left", "up", "right", "down"};

inline std::string_view DirectionName(Direction d) {
  return kDirectionNames[static_cast<size_t>(d)];
}

struct Coord {
  int32_t x = 0;
  int32_t y = 0;

  Coord Neighbor(Direction d) const {
    auto [dx, dy] = kDirectionDeltas[static_cast<size_t>(d)];
    return Coord{x + dx, y + dy};
  }

  // True for the four cells sharing an edge with this one.
  bool IsAdjacentTo(const Coord& other) const {
    int64_t dx = static_cast<int64_t>(x) - other.x;
    int64_t dy = static_cast<int64_t>(y) - other.y;
    return (dx < 0 ? -dx : dx) + (dy < 0 ? -dy : dy) == 1;
  }

  friend bool operator==(const Coord& a, const Coord& b) = default;

  template <typename H>
  friend H AbslHashValue(H h, const Coord& c) {
    return H::combine(std::move(h), c.x, c.y);
  }

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const Coord& c) {
    sink.Append(absl::Substitute("($0,$1)", c.x, c.y));
  }

  friend std::ostream& operator<<(std::ostream& os, const Coord& c) {
    os << absl::StrCat(c);
    return os;
  }
};

// Opaque player identity picked by whoever registers the player.
struct PlayerId {
  uint64_t value = 0;

  friend auto operator<=>(const PlayerId& a, const PlayerId& b) = default;

  template <typename H>
  friend H AbslHashValue(H h, const PlayerId& id) {
    return H::combine(std::move(h), id.value);
  }

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const PlayerId& id) {
    sink.Append(absl::StrCat("player#", id.value));
  }

  friend std::ostream& operator<<(std::ostream& os, const PlayerId& id) {
    os << absl::StrCat(id);
    return os;
  }
};

// A request to move the player's cursor onto `target` and paint it.
struct Move {
  Coord target;

  static Move Toward(const Coord& position, Direction d) {
    return Move{position.Neighbor(d)};
  }

  friend bool operator==(const Move& a, const Move& b) = default;

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const Move& move) {
    sink.Append(absl::StrCat("move to ", move.target));
  }

  friend std::ostream& operator<<(std::ostream& os, const Move& move) {
    os << absl::StrCat(move);
    return os;
  }
};

// Which way `to` lies from `from` if the two are adjacent.
std::optional<Direction> DirectionBetween(const Coord& from, const Coord& to);

enum class Phase : uint8_t { kForming, kActive, kFinished };

std::string_view PhaseName(Phase phase);

inline std::ostream& operator<<(std::ostream& os, Phase phase) {
  return os << PhaseName(phase);
}

}  // namespace squink

#endif  // SQUINK_TYPES_H
