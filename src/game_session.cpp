#include "bgame/game_session.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "bgame/log.hpp"
#include "bgame/settlement.hpp"
#include "bgame/snapshot.hpp"
#include "bgame/stats.hpp"

namespace bgame {

std::string_view to_string(GamePhase p) noexcept {
  switch (p) {
    case GamePhase::NotStarted: return "NotStarted";
    case GamePhase::Active: return "Active";
    case GamePhase::Finished: return "Finished";
  }
  return "Unknown";
}

GameSession::GameSession(LobbyId id, SnapshotStore& store, BroadcastBus& bus)
  : id_(id), store_(store), bus_(bus), evaluator_(id, store) {}

bool GameSession::has_submitted(PlayerId player) const noexcept {
  return state_.round_orders.find(player) != state_.round_orders.end();
}

Status GameSession::start_new_game(const Lobby& lobby, const std::vector<PlayerId>& roster,
                                   const std::map<PlayerId, ClassId>& classes) {
  if (phase_ == GamePhase::Active || lobby.started) {
    return Status::error(ErrorKind::LobbyStarted, "lobby " + std::to_string(id_) + " already started");
  }

  const Settings& settings = lobby.settings;
  if (Status st = validate_style(settings.demand_style, "demand_style"); !st.ok()) return st;
  if (Status st = validate_style(settings.supply_style, "supply_style"); !st.ok()) return st;

  auto flow = build_flow(roster);
  if (!flow.ok()) return flow.status;

  RoundState rs{};
  rs.round = 0;
  rs.players = static_cast<int64_t>(roster.size());
  rs.settings = settings;
  rs.flow = std::move(flow.value);

  for (const PlayerId p : roster) {
    const auto cls = classes.find(p);
    if (cls == classes.end()) {
      return Status::error(ErrorKind::BadRequest, "player " + std::to_string(p) + " has no class");
    }
    const ClassId c = cls->second;
    const std::string where = " not found for class " + std::to_string(c);

    const auto money = settings.start_money.find(c);
    if (money == settings.start_money.end()) return Status::error(ErrorKind::BadRequest, "start money" + where);
    const auto magazine = settings.start_magazine.find(c);
    if (magazine == settings.start_magazine.end()) {
      return Status::error(ErrorKind::BadRequest, "start magazine" + where);
    }
    const auto incoming = settings.incoming_start_queue.find(c);
    if (incoming == settings.incoming_start_queue.end()) {
      return Status::error(ErrorKind::BadRequest, "incoming start queue" + where);
    }
    const auto requested = settings.requested_start_queue.find(c);
    if (requested == settings.requested_start_queue.end()) {
      return Status::error(ErrorKind::BadRequest, "requested start queue" + where);
    }
    if (auto pricing = pricing_for(settings, c); !pricing.ok()) return pricing.status;

    const PlayerId upstream = rs.flow.sender_of(p);
    auto downstream = rs.flow.recipient_of(p);
    if (!downstream.ok()) return downstream.status;

    PlayerState us{};
    us.player_id = p;
    us.money = money->second;
    us.magazine_state = magazine->second;
    for (const Value v : incoming->second) {
      us.incoming_orders.push_back(Order{p, upstream, v, settings.resource_basic_price * v});
    }
    for (const Value v : requested->second) {
      us.requested_orders.push_back(Order{downstream.value, p, v, settings.resource_basic_price * v});
    }

    rs.users_states.emplace(p, std::move(us));
    rs.player_classes.emplace(p, c);
  }

  auto demand = initial_value(settings.demand_style);
  if (!demand.ok()) return demand.status;
  auto supply = initial_value(settings.supply_style);
  if (!supply.ok()) return supply.status;
  rs.demand = demand.value;
  rs.supply = supply.value;

  if (Status st = store_.begin_game(make_snapshot(id_, rs)); !st.ok()) {
    Json::Value fields;
    fields["lobby"] = static_cast<Json::UInt64>(id_);
    fields["error"] = describe(st);
    log_error("session", "round 0 snapshot failed", fields);
    return st;
  }

  lobby_ = lobby;
  lobby_.started = true;
  lobby_.player_classes = classes;
  state_ = std::move(rs);
  phase_ = GamePhase::Active;

  Json::Value fields;
  fields["lobby"] = static_cast<Json::UInt64>(id_);
  fields["players"] = static_cast<Json::Int64>(state_.players);
  fields["max_rounds"] = static_cast<Json::Int64>(state_.settings.max_rounds);
  log_info("session", "game started", fields);

  publish_(GameStarted{make_update_(state_, {}, {})});
  return Status::success();
}

Status GameSession::submit_round_end(PlayerId player, Value quantity) {
  auto reject = [&](Status st) {
    if (is_client_error(st.kind)) {
      publish_(PlayerError{player, st});
    } else {
      Json::Value fields;
      fields["lobby"] = static_cast<Json::UInt64>(id_);
      fields["player"] = static_cast<Json::UInt64>(player);
      fields["error"] = describe(st);
      log_error("session", "submission failed", fields);
    }
    return st;
  };

  if (phase_ == GamePhase::NotStarted) {
    return reject(Status::error(ErrorKind::LobbyNotStarted, "game not started"));
  }
  if (phase_ == GamePhase::Finished) {
    return reject(Status::error(ErrorKind::GameFinished, "game already finished"));
  }
  if (quantity < 0) {
    return reject(Status::error(ErrorKind::BadRequest, "negative order quantity"));
  }
  if (has_submitted(player)) {
    return reject(Status::error(ErrorKind::AlreadySubmitted,
                                "player " + std::to_string(player) + " already ended round " +
                                    std::to_string(state_.round)));
  }

  const auto cls = state_.player_classes.find(player);
  if (cls == state_.player_classes.end()) {
    return reject(Status::error(ErrorKind::BadRequest, "player " + std::to_string(player) + " has no class"));
  }
  auto pricing = pricing_for(state_.settings, cls->second);
  if (!pricing.ok()) return reject(pricing.status);
  const ClassPricing& price = pricing.value;

  RoundState next = state_;

  const auto found = next.users_states.find(player);
  if (found == next.users_states.end()) {
    return reject(Status::error(ErrorKind::Internal, "no state for player " + std::to_string(player)));
  }
  PlayerState& us = found->second;
  if (us.incoming_orders.empty() || us.requested_orders.empty()) {
    return reject(Status::error(ErrorKind::Internal, "order queues of player " + std::to_string(player) + " ran dry"));
  }

  auto recipient = next.flow.recipient_of(player);
  if (!recipient.ok()) return reject(Status::error(ErrorKind::Internal, recipient.status.detail));

  auto overflow = [&](std::string_view what) {
    return reject(Status::error(ErrorKind::BadRequest,
                                std::string(what) + " of player " + std::to_string(player) + " out of range"));
  };

  // 1-3: place the order
  const auto cost = order_cost(quantity, price.resource_price, price.fix_order_cost);
  if (!cost) return overflow("order quantity");
  if (*cost > us.money) {
    return reject(Status::error(ErrorKind::InsufficientFunds,
                                "order costs " + std::to_string(*cost) + ", only " + std::to_string(us.money) +
                                    " available"));
  }

  const Order placed{player, next.flow.sender_of(player), quantity, *cost};
  const auto spent = checked_add(us.spent_money, *cost);
  if (!spent) return overflow("spent money");
  us.money -= *cost;
  us.spent_money = *spent;
  us.placed_order = placed;
  next.round_orders[player] = placed;

  // 4: holding cost on the stock carried into the round
  const auto holding = checked_mul(us.magazine_state, price.magazine_cost);
  if (!holding) return overflow("holding cost");
  const auto money = checked_sub(us.money, *holding);
  const auto spent_total = checked_add(us.spent_money, *holding);
  if (!money || !spent_total) return overflow("holding cost");
  us.money = *money;
  us.spent_money = *spent_total;

  // 5: take delivery
  const Order received = us.incoming_orders.front();
  us.incoming_orders.pop_front();
  const auto stock = checked_add(us.magazine_state, received.value);
  if (!stock) return overflow("magazine");
  us.magazine_state = *stock;
  us.received_order = received;

  // 6: ship what was asked for, plus whatever backorder the stock now covers
  const Order requested = us.requested_orders.front();
  us.requested_orders.pop_front();
  const BackorderSettlement settled = settle_backorder(us.magazine_state, us.back_order_sum, requested.value);
  us.magazine_state = settled.magazine;
  us.back_order_sum = settled.back_order_sum;

  const auto shipment_cost = order_cost(settled.send_value, price.resource_price, price.fix_order_cost);
  if (!shipment_cost) return overflow("shipment");
  const Order shipment{recipient.value, player, settled.send_value, *shipment_cost};
  next.send_orders[player] = shipment;
  us.sent_orders.push_back(shipment);

  std::vector<LobbyEvent> out;
  out.emplace_back(SubmissionAck{player});

  // 7
  ++next.players_finished;

  if (!next.round_complete()) {
    state_ = std::move(next);
    publish_(out);
    return Status::success();
  }

  Settings lobby_settings = lobby_.settings;
  if (Status st = advance_round_(next, lobby_settings, out); !st.ok()) {
    Json::Value fields;
    fields["lobby"] = static_cast<Json::UInt64>(id_);
    fields["round"] = static_cast<Json::Int64>(state_.round);
    fields["error"] = describe(st);
    log_error("session", "round transition aborted", fields);
    publish_(LobbyError{st});
    return st;
  }

  state_ = std::move(next);
  lobby_.settings = std::move(lobby_settings);
  publish_(out);

  if (state_.round == state_.settings.max_rounds) {
    finish_game_();
  } else {
    new_round_();
  }
  return Status::success();
}

Status GameSession::advance_round_(RoundState& next, Settings& lobby_settings, std::vector<LobbyEvent>& out) {
  out.emplace_back(RoundEnded{});

  const Settings& s = next.settings;

  // customer demand enters at the end of the chain
  const Value demand = generate_next(next.demand, s.demand_style);
  next.round_orders[kNoPlayer] =
      Order{kNoPlayer, next.flow.last_player, demand, saturating_mul(s.resource_basic_price, demand)};

  // the supplier never ships more than the first player asked for; the cap is
  // generated from the stored starting supply, which rounds do not advance
  const Value supply = generate_next(next.supply, s.supply_style);
  const auto first = next.round_orders.find(next.flow.first_player);
  if (first == next.round_orders.end()) {
    return Status::error(ErrorKind::Internal, "first player has no order this round");
  }
  if (supply < first->second.value) {
    next.send_orders[kNoPlayer] = Order{next.flow.first_player, kNoPlayer, supply, saturating_mul(s.resource_basic_price, supply)};
  } else {
    next.send_orders[kNoPlayer] = first->second;
  }

  for (const auto& [_, order] : next.round_orders) {
    if (order.sender == kNoPlayer) continue;
    const auto it = next.users_states.find(order.sender);
    if (it == next.users_states.end()) {
      return Status::error(ErrorKind::Internal, "order sender " + std::to_string(order.sender) + " has no state");
    }
    it->second.requested_orders.push_back(order);
  }

  for (const auto& [_, order] : next.send_orders) {
    if (order.recipient == kNoPlayer) continue;
    const auto it = next.users_states.find(order.recipient);
    if (it == next.users_states.end()) {
      return Status::error(ErrorKind::Internal,
                           "shipment recipient " + std::to_string(order.recipient) + " has no state");
    }
    it->second.incoming_orders.push_back(order);
  }

  next.round += 1;
  next.demand = demand;

  // event effects belong to the row written for the new round
  if (next.round != next.settings.max_rounds) {
    evaluator_.run(lobby_.events, next, &lobby_settings, out);
  }

  return store_.append_snapshot(make_snapshot(id_, next));
}

void GameSession::new_round_() {
  const OrderMap round_orders = std::move(state_.round_orders);
  const OrderMap send_orders = std::move(state_.send_orders);

  std::vector<LobbyEvent> out;
  state_.players_finished = 0;
  state_.round_orders.clear();
  state_.send_orders.clear();

  Json::Value fields;
  fields["lobby"] = static_cast<Json::UInt64>(id_);
  fields["round"] = static_cast<Json::Int64>(state_.round);
  log_debug("session", "round started", fields);

  out.emplace_back(RoundStarted{make_update_(state_, round_orders, send_orders)});
  publish_(out);
}

void GameSession::finish_game_() {
  GameEnd end{};
  end.player_states = state_.users_states;

  auto rows = store_.all_snapshots(id_);
  if (rows.ok()) {
    end.stats = collect_player_stats(rows.value, end_of_game_stats());
  } else {
    Json::Value fields;
    fields["lobby"] = static_cast<Json::UInt64>(id_);
    fields["error"] = describe(rows.status);
    log_error("session", "end of game stats unavailable", fields);
    publish_(LobbyError{rows.status});
  }

  state_.players_finished = 0;
  phase_ = GamePhase::Finished;

  Json::Value fields;
  fields["lobby"] = static_cast<Json::UInt64>(id_);
  fields["rounds"] = static_cast<Json::Int64>(state_.round);
  log_info("session", "game finished", fields);

  publish_(GameEnded{std::move(end)});
}

Status GameSession::restore(const Lobby& lobby, const GameStateRow& latest) {
  if (latest.lobby != id_) {
    return Status::error(ErrorKind::Internal, "snapshot belongs to lobby " + std::to_string(latest.lobby));
  }
  if (latest.user_states.empty()) {
    return Status::error(ErrorKind::Internal, "snapshot of round " + std::to_string(latest.round) + " has no players");
  }

  lobby_ = lobby;
  state_ = restore_round_state(latest, lobby.settings);
  phase_ = (state_.round == state_.settings.max_rounds) ? GamePhase::Finished : GamePhase::Active;
  return Status::success();
}

void GameSession::reset() {
  lobby_ = Lobby{};
  state_ = RoundState{};
  phase_ = GamePhase::NotStarted;
}

void GameSession::publish_(std::vector<LobbyEvent>& out) {
  for (auto& ev : out) publish_(std::move(ev));
  out.clear();
}

void GameSession::publish_(LobbyEvent ev) {
  const LobbyEventType type = type_of(ev);
  if (bus_.publish(std::move(ev)) == 0 && log_enabled(LogLevel::Debug)) {
    Json::Value fields;
    fields["lobby"] = static_cast<Json::UInt64>(id_);
    fields["event"] = std::string(to_string(type));
    log_debug("session", "broadcast had no subscribers", fields);
  }
}

GameUpdate GameSession::make_update_(const RoundState& rs, const OrderMap& round_orders,
                                     const OrderMap& send_orders) const {
  GameUpdate u{};
  u.player_states = rs.users_states;
  u.round = rs.round;
  u.flow = rs.flow;
  u.settings = rs.settings;
  u.round_orders = round_orders;
  u.send_orders = send_orders;
  u.player_classes = rs.player_classes;
  return u;
}

} // namespace bgame
