#include "bgame/serialization.hpp"

#include <charconv>
#include <memory>
#include <type_traits>

namespace bgame {

namespace {

Json::Value i64(Value v) { return Json::Value(static_cast<Json::Int64>(v)); }
Json::Value id_json(PlayerId id) { return Json::Value(static_cast<Json::UInt64>(id)); }

std::string key_of(uint64_t id) { return std::to_string(id); }

uint64_t id_from_key(const std::string& key) {
  uint64_t out{};
  const auto res = std::from_chars(key.data(), key.data() + key.size(), out);
  if (res.ec != std::errc{} || res.ptr != key.data() + key.size()) {
    Json::throwRuntimeError("invalid id key '" + key + "'");
  }
  return out;
}

Json::Value values_json(const std::vector<Value>& vs) {
  Json::Value arr(Json::arrayValue);
  for (const Value v : vs) arr.append(i64(v));
  return arr;
}

std::vector<Value> values_from_json(const Json::Value& v) {
  std::vector<Value> out;
  out.reserve(v.size());
  for (const auto& x : v) out.push_back(x.asInt64());
  return out;
}

template <class T, class Enc>
Json::Value per_class_json(const PerClass<T>& m, Enc&& enc) {
  Json::Value obj(Json::objectValue);
  for (const auto& [cls, v] : m) obj[key_of(cls)] = enc(v);
  return obj;
}

template <class T, class Dec>
PerClass<T> per_class_from_json(const Json::Value& v, Dec&& dec) {
  PerClass<T> out;
  if (v.isNull()) return out;
  for (const auto& key : v.getMemberNames()) {
    out.emplace(static_cast<ClassId>(id_from_key(key)), dec(v[key]));
  }
  return out;
}

Json::Value resource_json(Resource r) { return Json::Value(std::string(to_string(r))); }

Resource resource_from_json(const Json::Value& v) {
  const std::string s = v.asString();
  if (s == "Money") return Resource::Money;
  if (s == "MagazineState") return Resource::MagazineState;
  if (s == "Performance") return Resource::Performance;
  if (s == "BackOrderValue") return Resource::BackOrderValue;
  Json::throwRuntimeError("unknown resource '" + s + "'");
}

ActionTarget target_from_json(const Json::Value& v) {
  const std::string s = v.asString();
  if (s == "EventTarget") return ActionTarget::EventTarget;
  if (s == "AllPlayers") return ActionTarget::AllPlayers;
  Json::throwRuntimeError("unknown action target '" + s + "'");
}

Json::Value met_by_json(const MetBy& m) {
  Json::Value o(Json::objectValue);
  switch (m.kind) {
    case MetByKind::SinglePlayer: o["type"] = "SinglePlayer"; break;
    case MetByKind::Average: o["type"] = "Average"; break;
    case MetByKind::AllPlayers: o["type"] = "AllPlayers"; break;
    case MetByKind::PlayerPercent:
      o["type"] = "PlayerPercent";
      o["percent"] = i64(m.percent);
      break;
  }
  return o;
}

MetBy met_by_from_json(const Json::Value& v) {
  // bare string form: "Average"
  const std::string t = v.isString() ? v.asString() : v["type"].asString();
  if (t == "SinglePlayer") return MetBy{MetByKind::SinglePlayer, 0};
  if (t == "Average") return MetBy{MetByKind::Average, 0};
  if (t == "AllPlayers") return MetBy{MetByKind::AllPlayers, 0};
  if (t == "PlayerPercent") return MetBy{MetByKind::PlayerPercent, v["percent"].asInt64()};
  Json::throwRuntimeError("unknown met_by '" + t + "'");
}

Json::Value condition_json(const EventCondition& c) {
  Json::Value o(Json::objectValue);
  std::visit([&](const auto& x) {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, RoundMet>) {
      o["type"] = "RoundMet";
      o["round"] = i64(x.round);
    } else if constexpr (std::is_same_v<T, ValueExceed>) {
      o["type"] = "ValueExceed";
      o["resource"] = resource_json(x.resource);
      o["met_by"] = met_by_json(x.met_by);
      o["value"] = i64(x.value);
    } else {
      o["type"] = "SingleChange";
      o["resource"] = resource_json(x.resource);
      o["value"] = i64(x.value);
    }
  }, c);
  return o;
}

EventCondition condition_from_json(const Json::Value& v) {
  const std::string t = v["type"].asString();
  if (t == "RoundMet") return RoundMet{v["round"].asInt64()};
  if (t == "ValueExceed") {
    return ValueExceed{resource_from_json(v["resource"]), met_by_from_json(v["met_by"]), v["value"].asInt64()};
  }
  if (t == "SingleChange") return SingleChange{resource_from_json(v["resource"]), v["value"].asInt64()};
  Json::throwRuntimeError("unknown event condition '" + t + "'");
}

Json::Value action_json(const EventAction& a) {
  Json::Value o(Json::objectValue);
  std::visit([&](const auto& x) {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, ShowMessage>) {
      o["type"] = "ShowMessage";
      o["message"] = x.message;
      o["target"] = std::string(to_string(x.target));
    } else if constexpr (std::is_same_v<T, ChangeSettings>) {
      o["type"] = "ChangeSettings";
      o["new_settings"] = to_json(x.new_settings);
    } else {
      o["type"] = "AddResource";
      o["resource"] = resource_json(x.resource);
      o["target"] = std::string(to_string(x.target));
      o["value"] = i64(x.value);
    }
  }, a);
  return o;
}

EventAction action_from_json(const Json::Value& v) {
  const std::string t = v["type"].asString();
  if (t == "ShowMessage") return ShowMessage{v["message"].asString(), target_from_json(v["target"])};
  if (t == "ChangeSettings") return ChangeSettings{settings_from_json(v["new_settings"])};
  if (t == "AddResource") {
    return AddResource{resource_from_json(v["resource"]), target_from_json(v["target"]), v["value"].asInt64()};
  }
  Json::throwRuntimeError("unknown event action '" + t + "'");
}

Json::Value orders_json(const std::deque<Order>& q) {
  Json::Value arr(Json::arrayValue);
  for (const auto& o : q) arr.append(to_json(o));
  return arr;
}

Json::Value game_update_json(const GameUpdate& u) {
  Json::Value o(Json::objectValue);
  o["player_states"] = to_json(u.player_states);
  o["round"] = i64(u.round);
  o["flow"] = to_json(u.flow);
  o["settings"] = to_json(u.settings);
  o["round_orders"] = to_json(u.round_orders);
  o["send_orders"] = to_json(u.send_orders);
  o["player_classes"] = to_json(u.player_classes);
  return o;
}

} // namespace

// ---------------- encode ----------------

Json::Value to_json(const Order& o) {
  Json::Value v(Json::objectValue);
  v["recipient"] = id_json(o.recipient);
  v["sender"] = id_json(o.sender);
  v["value"] = i64(o.value);
  v["cost"] = i64(o.cost);
  return v;
}

Json::Value to_json(const OrderMap& m) {
  Json::Value v(Json::objectValue);
  for (const auto& [id, o] : m) v[key_of(id)] = to_json(o);
  return v;
}

Json::Value to_json(const PlayerState& s) {
  Json::Value v(Json::objectValue);
  v["user_id"] = id_json(s.player_id);
  v["money"] = i64(s.money);
  v["spent_money"] = i64(s.spent_money);
  v["magazine_state"] = i64(s.magazine_state);
  v["performance"] = i64(s.performance);
  v["back_order_sum"] = i64(s.back_order_sum);
  v["incoming_orders"] = orders_json(s.incoming_orders);
  v["requested_orders"] = orders_json(s.requested_orders);

  Json::Value sent(Json::arrayValue);
  for (const auto& o : s.sent_orders) sent.append(to_json(o));
  v["sent_orders"] = sent;

  v["placed_order"] = to_json(s.placed_order);
  v["received_order"] = to_json(s.received_order);
  return v;
}

Json::Value to_json(const PlayerStates& m) {
  Json::Value v(Json::objectValue);
  for (const auto& [id, s] : m) v[key_of(id)] = to_json(s);
  return v;
}

Json::Value to_json(const GeneratedOrderStyle& s) {
  Json::Value v(Json::objectValue);
  std::visit([&](const auto& x) {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, DefaultStyle>) {
      v["type"] = "Default";
    } else if constexpr (std::is_same_v<T, LinearStyle>) {
      v["type"] = "Linear";
      v["start"] = i64(x.start);
      v["increase"] = i64(x.increase);
    } else if constexpr (std::is_same_v<T, MultiplicationStyle>) {
      v["type"] = "Multiplication";
      v["start"] = i64(x.start);
      v["increase"] = i64(x.increase);
    } else if constexpr (std::is_same_v<T, ExponentialStyle>) {
      v["type"] = "Exponential";
      v["start"] = i64(x.start);
      v["power"] = i64(x.power);
      v["modulator"] = i64(x.modulator);
    } else {
      v["type"] = "List";
      v["list"] = values_json(x.values);
    }
  }, s);
  return v;
}

Json::Value to_json(const Settings& s) {
  auto scalar = [](Value x) { return i64(x); };
  Json::Value v(Json::objectValue);
  v["start_money"] = per_class_json(s.start_money, scalar);
  v["start_magazine"] = per_class_json(s.start_magazine, scalar);
  v["resource_price"] = per_class_json(s.resource_price, scalar);
  v["fix_order_cost"] = per_class_json(s.fix_order_cost, scalar);
  v["magazine_cost"] = per_class_json(s.magazine_cost, scalar);
  v["incoming_start_queue"] = per_class_json(s.incoming_start_queue, values_json);
  v["requested_start_queue"] = per_class_json(s.requested_start_queue, values_json);
  v["resource_basic_price"] = i64(s.resource_basic_price);
  v["demand_style"] = to_json(s.demand_style);
  v["supply_style"] = to_json(s.supply_style);
  v["max_rounds"] = i64(s.max_rounds);
  return v;
}

Json::Value to_json(const Flow& f) {
  Json::Value v(Json::objectValue);
  Json::Value links(Json::objectValue);
  for (const auto& [from, to] : f.flow) links[key_of(from)] = id_json(to);
  v["flow"] = links;
  v["first_player"] = id_json(f.first_player);
  v["last_player"] = id_json(f.last_player);
  return v;
}

Json::Value to_json(const std::map<PlayerId, ClassId>& classes) {
  Json::Value v(Json::objectValue);
  for (const auto& [id, cls] : classes) v[key_of(id)] = Json::Value(static_cast<Json::UInt>(cls));
  return v;
}

Json::Value to_json(const GameEvent& e) {
  Json::Value v(Json::objectValue);
  v["name"] = e.name;
  v["condition"] = condition_json(e.condition);
  Json::Value actions(Json::arrayValue);
  for (const auto& a : e.actions) actions.append(action_json(a));
  v["actions"] = actions;
  v["run_once"] = e.run_once;
  return v;
}

Json::Value to_json(const std::vector<GameEvent>& events) {
  Json::Value v(Json::objectValue);
  Json::Value arr(Json::arrayValue);
  for (const auto& e : events) arr.append(to_json(e));
  v["events"] = arr;
  return v;
}

Json::Value to_json(const Lobby& l) {
  Json::Value v(Json::objectValue);
  v["id"] = id_json(l.id);
  v["name"] = l.name;
  v["max_players"] = Json::Value(static_cast<Json::Int>(l.max_players));
  v["owner_id"] = id_json(l.owner_id);
  v["started"] = l.started;
  v["settings"] = to_json(l.settings);
  v["events"] = to_json(l.events);
  v["player_classes"] = to_json(l.player_classes);
  return v;
}

Json::Value to_json(const GameStateRow& r) {
  Json::Value v(Json::objectValue);
  v["game_id"] = id_json(r.lobby);
  v["round"] = i64(r.round);
  v["user_states"] = to_json(r.user_states);
  v["round_orders"] = to_json(r.round_orders);
  v["send_orders"] = to_json(r.send_orders);
  v["players_classes"] = to_json(r.player_classes);
  v["flow"] = to_json(r.flow);
  v["demand"] = i64(r.demand);
  v["supply"] = i64(r.supply);
  return v;
}

Json::Value to_json(const PlayerStats& s) {
  Json::Value v(Json::objectValue);
  for (const auto& [name, per_player] : s) {
    Json::Value players(Json::objectValue);
    for (const auto& [id, series] : per_player) players[key_of(id)] = values_json(series);
    v[name] = players;
  }
  return v;
}

Json::Value to_json(const Status& s) {
  Json::Value v(Json::objectValue);
  v["kind"] = std::string(to_string(s.kind));
  v["error"] = s.detail;
  return v;
}

Json::Value to_json(const LobbyEvent& e) {
  Json::Value v(Json::objectValue);
  v["type"] = std::string(to_string(type_of(e)));

  std::visit([&](const auto& x) {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, GameStarted> || std::is_same_v<T, RoundStarted>) {
      v["update"] = game_update_json(x.update);
    } else if constexpr (std::is_same_v<T, SettingsChanged>) {
      v["settings"] = to_json(x.settings);
    } else if constexpr (std::is_same_v<T, PopUp>) {
      if (x.target) v["target"] = id_json(*x.target);
      v["message"] = x.message;
    } else if constexpr (std::is_same_v<T, ResourceGranted>) {
      if (x.target) v["target"] = id_json(*x.target);
      v["resource"] = resource_json(x.resource);
      v["value"] = i64(x.value);
    } else if constexpr (std::is_same_v<T, SubmissionAck> || std::is_same_v<T, PlayerDisconnected>) {
      v["player"] = id_json(x.player);
    } else if constexpr (std::is_same_v<T, PlayerError>) {
      v["player"] = id_json(x.player);
      v["error"] = to_json(x.error);
    } else if constexpr (std::is_same_v<T, LobbyError>) {
      v["error"] = to_json(x.error);
    } else if constexpr (std::is_same_v<T, GameEnded>) {
      v["player_states"] = to_json(x.end.player_states);
      v["stats"] = to_json(x.end.stats);
    } else if constexpr (std::is_same_v<T, ClassesUpdated>) {
      v["classes"] = to_json(x.classes);
    }
  }, e);
  return v;
}

// ---------------- decode ----------------

Order order_from_json(const Json::Value& v) {
  Order o{};
  o.recipient = v["recipient"].asUInt64();
  o.sender = v["sender"].asUInt64();
  o.value = v["value"].asInt64();
  o.cost = v["cost"].asInt64();
  return o;
}

OrderMap order_map_from_json(const Json::Value& v) {
  OrderMap out;
  if (v.isNull()) return out;
  for (const auto& key : v.getMemberNames()) out.emplace(id_from_key(key), order_from_json(v[key]));
  return out;
}

PlayerState player_state_from_json(const Json::Value& v) {
  PlayerState s{};
  s.player_id = v["user_id"].asUInt64();
  s.money = v["money"].asInt64();
  s.spent_money = v["spent_money"].asInt64();
  s.magazine_state = v["magazine_state"].asInt64();
  s.performance = v["performance"].asInt64();
  s.back_order_sum = v["back_order_sum"].asInt64();
  for (const auto& o : v["incoming_orders"]) s.incoming_orders.push_back(order_from_json(o));
  for (const auto& o : v["requested_orders"]) s.requested_orders.push_back(order_from_json(o));
  for (const auto& o : v["sent_orders"]) s.sent_orders.push_back(order_from_json(o));
  s.placed_order = order_from_json(v["placed_order"]);
  s.received_order = order_from_json(v["received_order"]);
  return s;
}

PlayerStates player_states_from_json(const Json::Value& v) {
  PlayerStates out;
  if (v.isNull()) return out;
  for (const auto& key : v.getMemberNames()) out.emplace(id_from_key(key), player_state_from_json(v[key]));
  return out;
}

GeneratedOrderStyle style_from_json(const Json::Value& v) {
  const std::string t = v.isString() ? v.asString() : v["type"].asString();
  if (t.empty() || t == "Default") return DefaultStyle{};
  if (t == "Linear") return LinearStyle{v["start"].asInt64(), v["increase"].asInt64()};
  if (t == "Multiplication") return MultiplicationStyle{v["start"].asInt64(), v["increase"].asInt64()};
  if (t == "Exponential") {
    return ExponentialStyle{v["start"].asInt64(), v["power"].asInt64(), v["modulator"].asInt64()};
  }
  if (t == "List") return ListStyle{values_from_json(v["list"])};
  Json::throwRuntimeError("unknown generation style '" + t + "'");
}

Settings settings_from_json(const Json::Value& v) {
  auto scalar = [](const Json::Value& x) { return x.asInt64(); };
  Settings s{};
  s.start_money = per_class_from_json<Value>(v["start_money"], scalar);
  s.start_magazine = per_class_from_json<Value>(v["start_magazine"], scalar);
  s.resource_price = per_class_from_json<Value>(v["resource_price"], scalar);
  s.fix_order_cost = per_class_from_json<Value>(v["fix_order_cost"], scalar);
  s.magazine_cost = per_class_from_json<Value>(v["magazine_cost"], scalar);
  s.incoming_start_queue = per_class_from_json<std::vector<Value>>(v["incoming_start_queue"], values_from_json);
  s.requested_start_queue = per_class_from_json<std::vector<Value>>(v["requested_start_queue"], values_from_json);
  s.resource_basic_price = v["resource_basic_price"].asInt64();
  s.demand_style = style_from_json(v["demand_style"]);
  s.supply_style = style_from_json(v["supply_style"]);
  s.max_rounds = v["max_rounds"].asInt64();
  return s;
}

Flow flow_from_json(const Json::Value& v) {
  Flow f{};
  const auto& links = v["flow"];
  if (!links.isNull()) {
    for (const auto& key : links.getMemberNames()) f.flow.emplace(id_from_key(key), links[key].asUInt64());
  }
  f.first_player = v["first_player"].asUInt64();
  f.last_player = v["last_player"].asUInt64();
  return f;
}

std::map<PlayerId, ClassId> classes_from_json(const Json::Value& v) {
  std::map<PlayerId, ClassId> out;
  if (v.isNull()) return out;
  for (const auto& key : v.getMemberNames()) out.emplace(id_from_key(key), static_cast<ClassId>(v[key].asUInt()));
  return out;
}

GameEvent event_from_json(const Json::Value& v) {
  GameEvent e{};
  e.name = v["name"].asString();
  e.condition = condition_from_json(v["condition"]);
  for (const auto& a : v["actions"]) e.actions.push_back(action_from_json(a));
  e.run_once = v["run_once"].asBool();
  return e;
}

std::vector<GameEvent> events_from_json(const Json::Value& v) {
  // stored as {"events": [...]}; a bare array is accepted too
  const Json::Value& arr = v.isArray() ? v : v["events"];
  std::vector<GameEvent> out;
  out.reserve(arr.size());
  for (const auto& e : arr) out.push_back(event_from_json(e));
  return out;
}

Lobby lobby_from_json(const Json::Value& v) {
  Lobby l{};
  l.id = v["id"].asUInt64();
  l.name = v["name"].asString();
  l.max_players = v["max_players"].asInt();
  l.owner_id = v["owner_id"].asUInt64();
  l.started = v["started"].asBool();
  l.settings = settings_from_json(v["settings"]);
  l.events = events_from_json(v["events"]);
  l.player_classes = classes_from_json(v["player_classes"]);
  return l;
}

Outcome<Json::Value> parse_json(std::string_view text) {
  Json::CharReaderBuilder b;
  const std::unique_ptr<Json::CharReader> reader(b.newCharReader());
  Json::Value root;
  std::string errs;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
    return Outcome<Json::Value>::failure(Status::error(ErrorKind::BadRequest, "invalid json: " + errs));
  }
  return Outcome<Json::Value>::success(std::move(root));
}

std::string dump_json(const Json::Value& v) {
  Json::StreamWriterBuilder b;
  b["indentation"] = "";
  return Json::writeString(b, v);
}

} // namespace bgame
