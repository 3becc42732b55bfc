#pragma once
#include <string>
#include <variant>
#include <vector>

#include "bgame/settings.hpp"
#include "bgame/types.hpp"

namespace bgame {

enum class MetByKind : uint8_t {
  SinglePlayer = 0,
  Average = 1,
  AllPlayers = 2,
  PlayerPercent = 3   // older lobby records only
};

struct MetBy {
  MetByKind kind{MetByKind::SinglePlayer};
  int64_t percent{0};   // PlayerPercent only

  friend bool operator==(const MetBy&, const MetBy&) = default;
};

// ---- conditions ----
struct RoundMet {
  Round round{};
  friend bool operator==(const RoundMet&, const RoundMet&) = default;
};

struct ValueExceed {
  Resource resource{Resource::Money};
  MetBy met_by{};
  Value value{};
  friend bool operator==(const ValueExceed&, const ValueExceed&) = default;
};

// Compares against the snapshot of the previous round
struct SingleChange {
  Resource resource{Resource::Money};
  Value value{};
  friend bool operator==(const SingleChange&, const SingleChange&) = default;
};

using EventCondition = std::variant<RoundMet, ValueExceed, SingleChange>;

// ---- actions ----
struct ShowMessage {
  std::string message{};
  ActionTarget target{ActionTarget::EventTarget};
  friend bool operator==(const ShowMessage&, const ShowMessage&) = default;
};

struct ChangeSettings {
  Settings new_settings{};
  friend bool operator==(const ChangeSettings&, const ChangeSettings&) = default;
};

struct AddResource {
  Resource resource{Resource::Money};
  ActionTarget target{ActionTarget::EventTarget};
  Value value{};
  friend bool operator==(const AddResource&, const AddResource&) = default;
};

using EventAction = std::variant<ShowMessage, ChangeSettings, AddResource>;

struct GameEvent {
  std::string name{};
  EventCondition condition{RoundMet{}};
  std::vector<EventAction> actions{};
  bool run_once{false};   // stored with the lobby; evaluation does not consult it

  friend bool operator==(const GameEvent&, const GameEvent&) = default;
};

} // namespace bgame
