#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace fieldwake::model {

/*
  Wake protocol lifecycle.

      hello_received -> ack_sent -> snap_sent -> metadata_received -> complete
            |
            +-> sleep_only            (unmapped / unapproved device)

  Any in-flight state may also move to failed.
*/
enum class ProtocolState : std::uint8_t {
  kHelloReceived    = 0,
  kAckSent          = 1,
  kSnapSent         = 2,
  kMetadataReceived = 3,
  kComplete         = 4,
  kSleepOnly        = 5,
  kFailed           = 6,
};

inline constexpr std::size_t kProtocolStateCount = 7;

namespace detail {

using Row = std::array<bool, kProtocolStateCount>;

// kTransitions[from][to]; columns in enum order:
//                       hello  ack    snap   meta   done   sleep  failed
inline constexpr std::array<Row, kProtocolStateCount> kTransitions{{
    /* hello_received */ {false, true, false, false, false, true, true},
    /* ack_sent       */ {false, false, true, false, false, false, true},
    /* snap_sent      */ {false, false, false, true, false, false, true},
    /* meta_received  */ {false, false, false, false, true, false, true},
    /* complete       */ {false, false, false, false, false, false, false},
    /* sleep_only     */ {false, false, false, false, false, false, false},
    /* failed         */ {false, false, false, false, false, false, false},
}};

} // namespace detail

constexpr bool CanTransition(ProtocolState from, ProtocolState to) {
  return detail::kTransitions[static_cast<std::size_t>(from)][static_cast<std::size_t>(to)];
}

constexpr bool IsTerminal(ProtocolState state) {
  return state == ProtocolState::kComplete || state == ProtocolState::kSleepOnly || state == ProtocolState::kFailed;
}

static_assert(CanTransition(ProtocolState::kHelloReceived, ProtocolState::kSleepOnly));
static_assert(!CanTransition(ProtocolState::kSnapSent, ProtocolState::kSleepOnly));
static_assert(!CanTransition(ProtocolState::kAckSent, ProtocolState::kSleepOnly));
static_assert(!CanTransition(ProtocolState::kHelloReceived, ProtocolState::kComplete));
static_assert(!CanTransition(ProtocolState::kComplete, ProtocolState::kFailed));
static_assert(CanTransition(ProtocolState::kMetadataReceived, ProtocolState::kComplete));

constexpr std::string_view ToString(ProtocolState state) {
  switch (state) {
    case ProtocolState::kHelloReceived:
      return "hello_received";
    case ProtocolState::kAckSent:
      return "ack_sent";
    case ProtocolState::kSnapSent:
      return "snap_sent";
    case ProtocolState::kMetadataReceived:
      return "metadata_received";
    case ProtocolState::kComplete:
      return "complete";
    case ProtocolState::kSleepOnly:
      return "sleep_only";
    case ProtocolState::kFailed:
      return "failed";
  }
  return "unknown";
}

inline ProtocolState ProtocolStateFromInt(int value) {
  if (value < 0 || value >= static_cast<int>(kProtocolStateCount)) {
    throw util::InvalidState("unknown protocol state value " + std::to_string(value));
  }
  return static_cast<ProtocolState>(value);
}

// Throws IllegalTransition when the edge is not in the table.
inline void RequireTransition(ProtocolState from, ProtocolState to) {
  if (!CanTransition(from, to)) {
    throw util::IllegalTransition("illegal wake transition " + std::string(ToString(from)) + " -> " + std::string(ToString(to)));
  }
}

} // namespace fieldwake::model
