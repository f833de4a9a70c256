#ifndef SQUINK_ERROR_H
#define SQUINK_ERROR_H

#include <cstdint>
#include <optional>
#include <string_view>

#include "absl/status/status.h"

namespace squink {

// Every failure the engine and the strategies report. The kind travels
// inside the absl::Status as a payload, the status code is picked to match.
enum class ErrorKind : uint8_t {
  kInvalidDimensions,
  kInvalidConfig,
  kAlreadyStarted,
  kInvalidName,
  kInsufficientBuyIn,
  kAlreadyRegistered,
  kNameTaken,
  kGameFull,
  kNotYetFormed,
  kNoPlayers,
  kGameNotActive,
  kGameNotFinished,
  kUnknownPlayer,
  kTurnAlreadySubmitted,
  kIllegalMove,
  kOutOfBounds,
  kGameFinished,
  kNoLegalMove,
};

inline constexpr std::string_view kErrorKindPayloadUrl =
    "type.squink/squink.ErrorKind";

std::string_view ErrorKindName(ErrorKind kind);

absl::StatusCode ErrorKindCode(ErrorKind kind);

absl::Status MakeError(ErrorKind kind, std::string_view message);

// Returns nullopt for OK statuses and statuses not produced by MakeError,
// e.g. transport failures.
std::optional<ErrorKind> GetErrorKind(const absl::Status& status);

inline bool IsErrorKind(const absl::Status& status, ErrorKind kind) {
  return GetErrorKind(status) == kind;
}

// Failures of the channel between a driver and the engine. These are the
// only ones worth retrying.
inline bool IsTransient(const absl::Status& status) {
  return absl::IsUnavailable(status) && !GetErrorKind(status).has_value();
}

}  // namespace squink

#endif  // SQUINK_ERROR_H
