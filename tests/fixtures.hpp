#pragma once
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "bgame/broadcast.hpp"
#include "bgame/lobby.hpp"
#include "bgame/snapshot_store.hpp"

namespace bgame::fixtures {

// Two-stage chain, every player in class 1:
//   order cost = 2 * qty + 5, holding cost = 1 per unit, basic price 1
inline Settings basic_settings(Round max_rounds = 3) {
  Settings s{};
  s.start_money[1] = 1000;
  s.start_magazine[1] = 10;
  s.resource_price[1] = 2;
  s.fix_order_cost[1] = 5;
  s.magazine_cost[1] = 1;
  s.incoming_start_queue[1] = {4, 4};
  s.requested_start_queue[1] = {4, 4};
  s.resource_basic_price = 1;
  s.demand_style = LinearStyle{4, 1};
  s.supply_style = LinearStyle{10, 0};
  s.max_rounds = max_rounds;
  return s;
}

inline Lobby basic_lobby(LobbyId id, int32_t max_players = 4, Round max_rounds = 3) {
  Lobby l{};
  l.id = id;
  l.name = "lobby-" + std::to_string(id);
  l.max_players = max_players;
  l.owner_id = 1;
  l.settings = basic_settings(max_rounds);
  return l;
}

inline std::unique_ptr<SqliteSnapshotStore> memory_store() {
  auto r = SqliteSnapshotStore::open(":memory:");
  EXPECT_TRUE(r.ok()) << describe(r.status);
  return std::move(r.value);
}

inline std::vector<LobbyEvent> drain(Subscription& sub) {
  std::vector<LobbyEvent> out;
  while (auto ev = sub.try_next()) out.push_back(std::move(*ev));
  return out;
}

inline std::vector<LobbyEventType> types_of(const std::vector<LobbyEvent>& evs) {
  std::vector<LobbyEventType> out;
  for (const auto& e : evs) out.push_back(type_of(e));
  return out;
}

} // namespace bgame::fixtures
