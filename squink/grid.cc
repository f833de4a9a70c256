#include "squink/grid.h"

#include <cstdint>
#include <optional>

#include "absl/log/check.h"
#include "absl/status/statusor.h"
#include "absl/strings/substitute.h"

#include "squink/error.h"

namespace squink {

// static
absl::StatusOr<Grid> Grid::Create(int32_t width, int32_t height) {
  if (width < 1 || height < 1 || width > kMaxExtent || height > kMaxExtent) {
    return MakeError(ErrorKind::kInvalidDimensions,
                     absl::Substitute("$0x$1, each extent must be in [1, $2]",
                                      width, height, kMaxExtent));
  }
  return Grid(width, height);
}

absl::StatusOr<std::optional<PlayerId>> Grid::CellAt(const Coord& c) const {
  if (!Contains(c)) {
    return MakeError(ErrorKind::kOutOfBounds,
                     absl::Substitute("$0 is outside of $1x$2", c, width_,
                                      height_));
  }
  return cells_[index(c)].owner;
}

absl::StatusOr<ClaimResult> Grid::Claim(const Coord& c, PlayerId player,
                                        uint32_t round) {
  if (!Contains(c)) {
    return MakeError(ErrorKind::kOutOfBounds,
                     absl::Substitute("$0 is outside of $1x$2", c, width_,
                                      height_));
  }
  Cell& cell = cells_[index(c)];
  ClaimResult result{.changed = cell.owner != player,
                     .previous_owner = cell.owner};
  if (!result.changed) {
    return result;
  }
  if (!cell.owner.has_value()) {
    ++claimed_;
  }
  cell.owner = player;
  cell.claimed_at = round;
  DCHECK_LE(claimed_, cells_.size());
  return result;
}

}  // namespace squink
