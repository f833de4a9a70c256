#include "squink/error.h"

#include <array>
#include <optional>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"

namespace squink {
namespace {

struct KindInfo {
  ErrorKind kind;
  std::string_view name;
  absl::StatusCode code;
};

constexpr std::array<KindInfo, 18> kKinds = {{
    {ErrorKind::kInvalidDimensions, "InvalidDimensions",
     absl::StatusCode::kInvalidArgument},
    {ErrorKind::kInvalidConfig, "InvalidConfig",
     absl::StatusCode::kInvalidArgument},
    {ErrorKind::kAlreadyStarted, "AlreadyStarted",
     absl::StatusCode::kFailedPrecondition},
    {ErrorKind::kInvalidName, "InvalidName",
     absl::StatusCode::kInvalidArgument},
    {ErrorKind::kInsufficientBuyIn, "InsufficientBuyIn",
     absl::StatusCode::kInvalidArgument},
    {ErrorKind::kAlreadyRegistered, "AlreadyRegistered",
     absl::StatusCode::kAlreadyExists},
    {ErrorKind::kNameTaken, "NameTaken", absl::StatusCode::kAlreadyExists},
    {ErrorKind::kGameFull, "GameFull", absl::StatusCode::kResourceExhausted},
    {ErrorKind::kNotYetFormed, "NotYetFormed",
     absl::StatusCode::kFailedPrecondition},
    {ErrorKind::kNoPlayers, "NoPlayers", absl::StatusCode::kFailedPrecondition},
    {ErrorKind::kGameNotActive, "GameNotActive",
     absl::StatusCode::kFailedPrecondition},
    {ErrorKind::kGameNotFinished, "GameNotFinished",
     absl::StatusCode::kFailedPrecondition},
    {ErrorKind::kUnknownPlayer, "UnknownPlayer", absl::StatusCode::kNotFound},
    {ErrorKind::kTurnAlreadySubmitted, "TurnAlreadySubmitted",
     absl::StatusCode::kFailedPrecondition},
    {ErrorKind::kIllegalMove, "IllegalMove",
     absl::StatusCode::kInvalidArgument},
    {ErrorKind::kOutOfBounds, "OutOfBounds", absl::StatusCode::kOutOfRange},
    {ErrorKind::kGameFinished, "GameFinished",
     absl::StatusCode::kFailedPrecondition},
    {ErrorKind::kNoLegalMove, "NoLegalMove", absl::StatusCode::kNotFound},
}};

const KindInfo& Info(ErrorKind kind) {
  return kKinds[static_cast<size_t>(kind)];
}

}  // namespace

std::string_view ErrorKindName(ErrorKind kind) { return Info(kind).name; }

absl::StatusCode ErrorKindCode(ErrorKind kind) { return Info(kind).code; }

absl::Status MakeError(ErrorKind kind, std::string_view message) {
  const KindInfo& info = Info(kind);
  absl::Status status(info.code, absl::StrCat(info.name, ": ", message));
  status.SetPayload(kErrorKindPayloadUrl, absl::Cord(info.name));
  return status;
}

std::optional<ErrorKind> GetErrorKind(const absl::Status& status) {
  if (status.ok()) {
    return std::nullopt;
  }
  std::optional<absl::Cord> payload = status.GetPayload(kErrorKindPayloadUrl);
  if (!payload.has_value()) {
    return std::nullopt;
  }
  std::string name(*payload);
  for (const KindInfo& info : kKinds) {
    if (info.name == name) {
      return info.kind;
    }
  }
  return std::nullopt;
}

}  // namespace squink
