#pragma once

#include <cstdint>
#include <string_view>

namespace hosting::model {

enum class ProxyState : std::uint8_t {
  kStopped   = 0,
  kStarting  = 1,
  kRunning   = 2,
  kReloading = 3,
  kFailed    = 4,
};

// Only these two states have no OS process behind them.
constexpr bool HasNoProcess(ProxyState state) {
  return state == ProxyState::kStopped || state == ProxyState::kFailed;
}

constexpr bool CanTransition(ProxyState from, ProxyState to) {
  if (from == to) {
    return true;
  }
  // stop() is always allowed and always ends in Stopped
  if (to == ProxyState::kStopped) {
    return true;
  }

  switch (from) {
    case ProxyState::kStopped:
    case ProxyState::kFailed:
      return to == ProxyState::kStarting;
    case ProxyState::kStarting:
      return to == ProxyState::kRunning || to == ProxyState::kFailed;
    case ProxyState::kRunning:
      // Starting covers the watchdog relaunch after an unexpected exit
      return to == ProxyState::kReloading || to == ProxyState::kStarting;
    case ProxyState::kReloading:
      return to == ProxyState::kRunning || to == ProxyState::kFailed;
  }
  return false;
}

constexpr std::string_view ToString(ProxyState state) {
  switch (state) {
    case ProxyState::kStopped:
      return "stopped";
    case ProxyState::kStarting:
      return "starting";
    case ProxyState::kRunning:
      return "running";
    case ProxyState::kReloading:
      return "reloading";
    case ProxyState::kFailed:
      return "failed";
  }
  return "unknown";
}

} // namespace hosting::model
