#pragma once
#include <string>
#include <string_view>

#include <json/json.h>

#include "bgame/game_event.hpp"
#include "bgame/lobby.hpp"
#include "bgame/messages.hpp"
#include "bgame/order.hpp"
#include "bgame/player_state.hpp"
#include "bgame/settings.hpp"
#include "bgame/snapshot.hpp"
#include "bgame/status.hpp"

namespace bgame {

// ---- encode ----
Json::Value to_json(const Order& o);
Json::Value to_json(const OrderMap& m);
Json::Value to_json(const PlayerState& s);
Json::Value to_json(const PlayerStates& m);
Json::Value to_json(const GeneratedOrderStyle& s);
Json::Value to_json(const Settings& s);
Json::Value to_json(const Flow& f);
Json::Value to_json(const std::map<PlayerId, ClassId>& classes);
Json::Value to_json(const GameEvent& e);
Json::Value to_json(const std::vector<GameEvent>& events);
Json::Value to_json(const Lobby& l);
Json::Value to_json(const GameStateRow& r);
Json::Value to_json(const PlayerStats& s);
Json::Value to_json(const Status& s);
Json::Value to_json(const LobbyEvent& e);

// ---- decode ----
// Malformed shapes make jsoncpp throw Json::Exception; the parse_* entry points
// below are the boundary that turns that into a Status.
Order order_from_json(const Json::Value& v);
OrderMap order_map_from_json(const Json::Value& v);
PlayerState player_state_from_json(const Json::Value& v);
PlayerStates player_states_from_json(const Json::Value& v);
GeneratedOrderStyle style_from_json(const Json::Value& v);
Settings settings_from_json(const Json::Value& v);
Flow flow_from_json(const Json::Value& v);
std::map<PlayerId, ClassId> classes_from_json(const Json::Value& v);
GameEvent event_from_json(const Json::Value& v);
std::vector<GameEvent> events_from_json(const Json::Value& v);
Lobby lobby_from_json(const Json::Value& v);

Outcome<Json::Value> parse_json(std::string_view text);
std::string dump_json(const Json::Value& v);   // compact, single line

template <class T, class Fn>
Outcome<T> decode_json(std::string_view text, Fn&& fn) {
  auto parsed = parse_json(text);
  if (!parsed.ok()) return Outcome<T>::failure(parsed.status);
  try {
    return Outcome<T>::success(fn(parsed.value));
  } catch (const Json::Exception& e) {
    return Outcome<T>::failure(Status::error(ErrorKind::BadRequest, std::string("malformed json: ") + e.what()));
  }
}

} // namespace bgame
