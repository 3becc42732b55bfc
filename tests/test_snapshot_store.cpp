#include <gtest/gtest.h>

#include <cstdio>
#include <string>

#include "bgame/snapshot.hpp"
#include "bgame/snapshot_store.hpp"
#include "fixtures.hpp"

namespace fx = bgame::fixtures;

namespace {

bgame::GameStateRow sample_row(bgame::LobbyId lobby, bgame::Round round) {
  bgame::GameStateRow row{};
  row.lobby = lobby;
  row.round = round;

  bgame::PlayerState s{};
  s.player_id = 5;
  s.money = 900 - round;
  s.spent_money = 100 + round;
  s.magazine_state = 3;
  s.back_order_sum = 2;
  s.incoming_orders = {{5, bgame::kNoPlayer, 4, 4}, {5, bgame::kNoPlayer, 6, 17}};
  s.requested_orders = {{bgame::kNoPlayer, 5, 5, 5}};
  s.sent_orders = {{bgame::kNoPlayer, 5, 4, 13}};
  s.placed_order = {5, bgame::kNoPlayer, 6, 17};
  s.received_order = {5, bgame::kNoPlayer, 4, 4};
  row.user_states.emplace(5, s);

  row.round_orders[bgame::kNoPlayer] = {bgame::kNoPlayer, 5, 5, 5};
  row.round_orders[5] = s.placed_order;
  row.send_orders[5] = s.sent_orders.back();
  row.player_classes[5] = 2;
  row.flow = bgame::build_flow({5}).value;
  row.demand = 5 + round;
  row.supply = 10;
  return row;
}

} // namespace

TEST(SnapshotStore, LobbyRecordRoundTrips) {
  auto store = fx::memory_store();

  bgame::Lobby l = fx::basic_lobby(3);
  l.player_classes = {{1, 1}, {2, 1}};
  l.settings.supply_style = bgame::ExponentialStyle{2, 1, 3};
  l.settings.demand_style = bgame::ListStyle{{4, 8, 12}};

  bgame::GameEvent ev{};
  ev.name = "backlog alarm";
  ev.condition = bgame::ValueExceed{bgame::Resource::BackOrderValue, {bgame::MetByKind::PlayerPercent, 50}, 20};
  ev.actions.push_back(bgame::ShowMessage{"ship faster", bgame::ActionTarget::EventTarget});
  ev.actions.push_back(bgame::AddResource{bgame::Resource::Money, bgame::ActionTarget::AllPlayers, -10});
  ev.actions.push_back(bgame::ChangeSettings{fx::basic_settings(9)});
  ev.run_once = true;
  l.events.push_back(ev);

  ASSERT_TRUE(store->save_lobby(l).ok());
  auto back = store->get_lobby(3);
  ASSERT_TRUE(back.ok()) << bgame::describe(back.status);
  EXPECT_EQ(back.value, l);

  auto all = store->list_lobbies();
  ASSERT_TRUE(all.ok());
  ASSERT_EQ(all.value.size(), 1u);
  EXPECT_EQ(all.value.front(), l);
}

TEST(SnapshotStore, MissingLobbyIsNotFound) {
  auto store = fx::memory_store();
  EXPECT_EQ(store->get_lobby(9).status.kind, bgame::ErrorKind::NotFound);
  EXPECT_EQ(store->set_lobby_started(9, true).kind, bgame::ErrorKind::NotFound);
  EXPECT_EQ(store->update_lobby_settings(9, fx::basic_settings()).kind, bgame::ErrorKind::NotFound);
}

TEST(SnapshotStore, SnapshotRowRoundTrips) {
  auto store = fx::memory_store();
  const auto row = sample_row(1, 4);
  ASSERT_TRUE(store->append_snapshot(row).ok());

  auto latest = store->latest_snapshot(1);
  ASSERT_TRUE(latest.ok()) << bgame::describe(latest.status);
  ASSERT_TRUE(latest.value.has_value());
  EXPECT_EQ(*latest.value, row);
}

TEST(SnapshotStore, QueriesByLobbyAndRound) {
  auto store = fx::memory_store();
  for (bgame::Round r : {0, 1, 2}) ASSERT_TRUE(store->append_snapshot(sample_row(1, r)).ok());
  ASSERT_TRUE(store->append_snapshot(sample_row(2, 7)).ok());

  EXPECT_EQ(store->latest_snapshot(1).value->round, 2);
  EXPECT_EQ(store->latest_snapshot(2).value->round, 7);
  EXPECT_FALSE(store->latest_snapshot(3).value.has_value());

  EXPECT_EQ(store->snapshot_at(1, 1).value->demand, 6);
  EXPECT_FALSE(store->snapshot_at(1, 5).value.has_value());

  auto all = store->all_snapshots(1);
  ASSERT_TRUE(all.ok());
  ASSERT_EQ(all.value.size(), 3u);
  for (std::size_t i = 0; i < all.value.size(); ++i) EXPECT_EQ(all.value[i].round, static_cast<bgame::Round>(i));
}

TEST(SnapshotStore, BeginGameReplacesPreviousRows) {
  auto store = fx::memory_store();
  ASSERT_TRUE(store->save_lobby(fx::basic_lobby(1)).ok());

  ASSERT_TRUE(store->begin_game(sample_row(1, 0)).ok());
  ASSERT_TRUE(store->append_snapshot(sample_row(1, 1)).ok());
  EXPECT_TRUE(store->get_lobby(1).value.started);

  ASSERT_TRUE(store->begin_game(sample_row(1, 0)).ok());
  auto all = store->all_snapshots(1);
  ASSERT_EQ(all.value.size(), 1u);
  EXPECT_EQ(all.value.front().round, 0);
}

TEST(SnapshotStore, BeginGameWithoutLobbyRollsBack) {
  auto store = fx::memory_store();
  EXPECT_EQ(store->begin_game(sample_row(4, 0)).kind, bgame::ErrorKind::NotFound);
  EXPECT_TRUE(store->all_snapshots(4).value.empty());
}

TEST(SnapshotStore, DeleteLobbyDropsItsRows) {
  auto store = fx::memory_store();
  ASSERT_TRUE(store->save_lobby(fx::basic_lobby(1)).ok());
  ASSERT_TRUE(store->begin_game(sample_row(1, 0)).ok());

  ASSERT_TRUE(store->delete_lobby(1).ok());
  EXPECT_EQ(store->get_lobby(1).status.kind, bgame::ErrorKind::NotFound);
  EXPECT_TRUE(store->all_snapshots(1).value.empty());
}

TEST(SnapshotStore, RestoreKeepsEverythingButTheFoldedOrders) {
  const auto row = sample_row(1, 3);
  const auto rs = bgame::restore_round_state(row, fx::basic_settings());

  EXPECT_EQ(rs.round, 3);
  EXPECT_EQ(rs.players, 1);
  EXPECT_EQ(rs.players_finished, 0);
  EXPECT_EQ(rs.users_states, row.user_states);
  EXPECT_EQ(rs.player_classes, row.player_classes);
  EXPECT_EQ(rs.flow, row.flow);
  EXPECT_EQ(rs.demand, row.demand);
  EXPECT_EQ(rs.supply, row.supply);
  EXPECT_TRUE(rs.round_orders.empty());
  EXPECT_TRUE(rs.send_orders.empty());

  const auto again = bgame::make_snapshot(1, rs);
  EXPECT_EQ(again.user_states, row.user_states);
  EXPECT_EQ(again.round, row.round);
}

TEST(SnapshotStore, FileDatabaseSurvivesReopen) {
  const std::string path = ::testing::TempDir() + "bgame_store_reopen.db";
  std::remove(path.c_str());
  {
    auto store = bgame::SqliteSnapshotStore::open(path);
    ASSERT_TRUE(store.ok()) << bgame::describe(store.status);
    ASSERT_TRUE(store.value->save_lobby(fx::basic_lobby(1)).ok());
    ASSERT_TRUE(store.value->begin_game(sample_row(1, 0)).ok());
  }
  {
    auto store = bgame::SqliteSnapshotStore::open(path);
    ASSERT_TRUE(store.ok());
    EXPECT_TRUE(store.value->get_lobby(1).value.started);
    EXPECT_EQ(*store.value->latest_snapshot(1).value, sample_row(1, 0));
  }
  std::remove(path.c_str());
}
