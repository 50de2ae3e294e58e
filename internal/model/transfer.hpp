#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace fieldwake::model {

enum class TransferStatus : std::uint8_t {
  kReceiving = 1,
  kComplete  = 2,
  kFailed    = 3,
};

// Values match the downstream alert codes.
enum class FailureCode : std::uint8_t {
  kNone             = 0,
  kUploadFailed     = 1,
  kAssemblyFailed   = 2,
  kCompletionFailed = 3,
  kTransferExpired  = 4,
};

constexpr std::string_view ToString(TransferStatus status) {
  switch (status) {
    case TransferStatus::kReceiving:
      return "receiving";
    case TransferStatus::kComplete:
      return "complete";
    case TransferStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

constexpr std::string_view ToString(FailureCode code) {
  switch (code) {
    case FailureCode::kNone:
      return "none";
    case FailureCode::kUploadFailed:
      return "upload_failed";
    case FailureCode::kAssemblyFailed:
      return "assembly_failed";
    case FailureCode::kCompletionFailed:
      return "completion_failed";
    case FailureCode::kTransferExpired:
      return "transfer_expired";
  }
  return "unknown";
}

inline TransferStatus TransferStatusFromInt(int value) {
  if (value < 1 || value > 3) {
    throw util::InvalidState("unknown transfer status value " + std::to_string(value));
  }
  return static_cast<TransferStatus>(value);
}

inline FailureCode FailureCodeFromInt(int value) {
  if (value < 0 || value > 4) {
    throw util::InvalidState("unknown failure code value " + std::to_string(value));
  }
  return static_cast<FailureCode>(value);
}

} // namespace fieldwake::model
