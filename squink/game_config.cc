#include "squink/game_config.h"

#include "absl/status/status.h"
#include "absl/strings/substitute.h"

#include "squink/error.h"
#include "squink/grid.h"

namespace squink {

absl::Status ValidateGameConfig(const GameConfig& config) {
  if (config.width < 1 || config.height < 1 ||
      config.width > Grid::kMaxExtent || config.height > Grid::kMaxExtent) {
    return MakeError(
        ErrorKind::kInvalidDimensions,
        absl::Substitute("$0x$1, each extent must be in [1, $2]", config.width,
                         config.height, Grid::kMaxExtent));
  }
  if (config.max_players == 0) {
    return MakeError(ErrorKind::kInvalidConfig,
                     "a game needs room for at least one player");
  }
  return absl::OkStatus();
}

}  // namespace squink
