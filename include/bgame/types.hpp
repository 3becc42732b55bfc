#pragma once
#include <cstdint>
#include <string_view>

namespace bgame {

using PlayerId = uint64_t;
using LobbyId  = uint64_t;
using ClassId  = uint32_t;
using Value    = int64_t;   // quantities, money, costs
using Round    = int64_t;

// Sentinel for "outside the chain" (external demand sink / external supplier)
inline constexpr PlayerId kNoPlayer = 0;

enum class Resource : uint8_t {
  Money = 0,
  MagazineState = 1,
  Performance = 2,
  BackOrderValue = 3
};

enum class ActionTarget : uint8_t { EventTarget = 0, AllPlayers = 1 };

inline std::string_view to_string(Resource r) noexcept {
  switch (r) {
    case Resource::Money: return "Money";
    case Resource::MagazineState: return "MagazineState";
    case Resource::Performance: return "Performance";
    case Resource::BackOrderValue: return "BackOrderValue";
  }
  return "Unknown";
}

inline std::string_view to_string(ActionTarget t) noexcept {
  return (t == ActionTarget::EventTarget) ? "EventTarget" : "AllPlayers";
}

} // namespace bgame
