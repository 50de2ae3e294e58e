#include "internal/model/protocol_state.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/model/transfer.hpp"
#include "internal/util/errors.hpp"

namespace {

using fieldwake::model::CanTransition;
using fieldwake::model::IsTerminal;
using fieldwake::model::ProtocolState;
using fieldwake::model::RequireTransition;

constexpr ProtocolState kAll[] = {ProtocolState::kHelloReceived, ProtocolState::kAckSent,  ProtocolState::kSnapSent, ProtocolState::kMetadataReceived,
                                  ProtocolState::kComplete,      ProtocolState::kSleepOnly, ProtocolState::kFailed};

void TestMainLifecycleEdges() {
  assert(CanTransition(ProtocolState::kHelloReceived, ProtocolState::kAckSent));
  assert(CanTransition(ProtocolState::kAckSent, ProtocolState::kSnapSent));
  assert(CanTransition(ProtocolState::kSnapSent, ProtocolState::kMetadataReceived));
  assert(CanTransition(ProtocolState::kMetadataReceived, ProtocolState::kComplete));

  // no skipping ahead, no going back
  assert(!CanTransition(ProtocolState::kHelloReceived, ProtocolState::kSnapSent));
  assert(!CanTransition(ProtocolState::kSnapSent, ProtocolState::kComplete));
  assert(!CanTransition(ProtocolState::kMetadataReceived, ProtocolState::kSnapSent));
}

void TestSleepOnlyOnlyFromHello() {
  for (auto from : kAll) {
    assert(CanTransition(from, ProtocolState::kSleepOnly) == (from == ProtocolState::kHelloReceived));
  }
}

void TestEveryInFlightStateMayFail() {
  for (auto from : kAll) {
    assert(CanTransition(from, ProtocolState::kFailed) == !IsTerminal(from));
  }
}

void TestTerminalStatesHaveNoExits() {
  for (auto from : kAll) {
    if (!IsTerminal(from)) continue;
    for (auto to : kAll) {
      assert(!CanTransition(from, to));
    }
  }
}

void TestRequireTransitionThrows() {
  RequireTransition(ProtocolState::kHelloReceived, ProtocolState::kAckSent);

  bool threw = false;
  try {
    RequireTransition(ProtocolState::kComplete, ProtocolState::kFailed);
  } catch (const fieldwake::util::IllegalTransition& e) {
    threw = std::string(e.what()).find("complete -> failed") != std::string::npos;
  }
  assert(threw);
}

void TestIntConversions() {
  assert(fieldwake::model::ProtocolStateFromInt(4) == ProtocolState::kComplete);
  assert(fieldwake::model::FailureCodeFromInt(4) == fieldwake::model::FailureCode::kTransferExpired);
  assert(fieldwake::model::TransferStatusFromInt(3) == fieldwake::model::TransferStatus::kFailed);

  bool threw = false;
  try {
    (void)fieldwake::model::ProtocolStateFromInt(7);
  } catch (const fieldwake::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestMainLifecycleEdges();
  TestSleepOnlyOnlyFromHello();
  TestEveryInFlightStateMayFail();
  TestTerminalStatesHaveNoExits();
  TestRequireTransitionThrows();
  TestIntConversions();

  std::cout << "fieldwake_unit_protocol_state: pass\n";
  return 0;
}
