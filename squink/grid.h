#ifndef SQUINK_GRID_H
#define SQUINK_GRID_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

#include "squink/types.h"

namespace squink {

struct Cell {
  std::optional<PlayerId> owner;
  // Round in which the current owner painted the cell.
  uint32_t claimed_at = 0;

  friend bool operator==(const Cell& a, const Cell& b) = default;
};

struct ClaimResult {
  bool changed = false;
  std::optional<PlayerId> previous_owner;
};

// Fixed-size board of cells. Knows nothing about the rules, the engine
// decides whether a claim is legal.
class Grid {
 public:
  static constexpr int32_t kMaxExtent = 1024;

  static absl::StatusOr<Grid> Create(int32_t width, int32_t height);

  int32_t width() const { return width_; }
  int32_t height() const { return height_; }
  size_t size() const { return cells_.size(); }
  size_t claimed_count() const { return claimed_; }
  std::span<const Cell> cells() const { return cells_; }

  bool Contains(const Coord& c) const {
    return c.x >= 0 && c.y >= 0 && c.x < width_ && c.y < height_;
  }

  Coord CoordAt(size_t index) const {
    return Coord{static_cast<int32_t>(index % width_),
                 static_cast<int32_t>(index / width_)};
  }

  absl::StatusOr<std::optional<PlayerId>> CellAt(const Coord& c) const;

  // Sets the owner unconditionally.
  absl::StatusOr<ClaimResult> Claim(const Coord& c, PlayerId player,
                                    uint32_t round);

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const Grid& grid) {
    std::vector<std::string> rows;
    rows.reserve(grid.height_);
    for (int32_t y = 0; y < grid.height_; ++y) {
      std::span<const Cell> row =
          std::span(grid.cells_).subspan(y * grid.width_, grid.width_);
      rows.push_back(
          absl::StrJoin(row, " ", [](std::string* out, const Cell& cell) {
            absl::StrAppend(out, cell.owner.has_value()
                                     ? absl::StrCat(cell.owner->value)
                                     : ".");
          }));
    }
    sink.Append(absl::StrJoin(rows, "\n"));
  }

 private:
  Grid(int32_t width, int32_t height)
      : width_(width), height_(height), cells_(width * height) {}

  size_t index(const Coord& c) const {
    return static_cast<size_t>(c.x) + static_cast<size_t>(c.y) * width_;
  }

  int32_t width_;
  int32_t height_;
  std::vector<Cell> cells_;
  size_t claimed_ = 0;
};

}  // namespace squink

#endif  // SQUINK_GRID_H
