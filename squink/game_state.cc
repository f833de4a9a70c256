#include "squink/game_state.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace squink {

std::optional<PlayerId> GameState::OwnerAt(const Coord& c) const {
  if (!Contains(c)) {
    return std::nullopt;
  }
  size_t index = static_cast<size_t>(c.x) + static_cast<size_t>(c.y) * width;
  if (index >= cells.size()) {
    return std::nullopt;
  }
  return cells[index].owner;
}

const PlayerSnapshot* GameState::FindPlayer(PlayerId id) const {
  auto it = std::find_if(players.begin(), players.end(),
                         [id](const PlayerSnapshot& p) { return p.id == id; });
  return it == players.end() ? nullptr : &*it;
}

std::vector<Direction> GameState::LegalDirections(const Coord& from) const {
  std::vector<Direction> directions;
  for (Direction d : kAllDirections) {
    if (Contains(from.Neighbor(d))) {
      directions.push_back(d);
    }
  }
  return directions;
}

size_t GameState::ClaimedCount() const {
  return std::count_if(cells.begin(), cells.end(),
                       [](const Cell& cell) { return cell.owner.has_value(); });
}

}  // namespace squink
