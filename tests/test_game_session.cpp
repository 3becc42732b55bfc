#include <gtest/gtest.h>

#include <limits>

#include "bgame/broadcast.hpp"
#include "bgame/game_session.hpp"
#include "bgame/snapshot_store.hpp"
#include "fixtures.hpp"

namespace fx = bgame::fixtures;

namespace {

// Delegates to a real store; appends can be made to fail on demand
class FlakyStore final : public bgame::SnapshotStore {
public:
  explicit FlakyStore(bgame::SnapshotStore& inner) : inner_(inner) {}

  bool fail_appends{false};

  bgame::Status save_lobby(const bgame::Lobby& l) override { return inner_.save_lobby(l); }
  bgame::Outcome<bgame::Lobby> get_lobby(bgame::LobbyId id) override { return inner_.get_lobby(id); }
  bgame::Outcome<std::vector<bgame::Lobby>> list_lobbies() override { return inner_.list_lobbies(); }
  bgame::Status delete_lobby(bgame::LobbyId id) override { return inner_.delete_lobby(id); }
  bgame::Status update_lobby_settings(bgame::LobbyId id, const bgame::Settings& s) override {
    return inner_.update_lobby_settings(id, s);
  }
  bgame::Status set_lobby_started(bgame::LobbyId id, bool started) override {
    return inner_.set_lobby_started(id, started);
  }

  bgame::Status append_snapshot(const bgame::GameStateRow& row) override {
    if (fail_appends) return bgame::Status::error(bgame::ErrorKind::Persistence, "disk full");
    return inner_.append_snapshot(row);
  }
  bgame::Status begin_game(const bgame::GameStateRow& row) override { return inner_.begin_game(row); }
  bgame::Outcome<std::optional<bgame::GameStateRow>> latest_snapshot(bgame::LobbyId id) override {
    return inner_.latest_snapshot(id);
  }
  bgame::Outcome<std::optional<bgame::GameStateRow>> snapshot_at(bgame::LobbyId id, bgame::Round r) override {
    return inner_.snapshot_at(id, r);
  }
  bgame::Outcome<std::vector<bgame::GameStateRow>> all_snapshots(bgame::LobbyId id) override {
    return inner_.all_snapshots(id);
  }

private:
  bgame::SnapshotStore& inner_;
};

struct Table {
  std::unique_ptr<bgame::SqliteSnapshotStore> store = fx::memory_store();
  bgame::BroadcastBus bus{64};
  std::shared_ptr<bgame::Subscription> sub = bus.subscribe();
  bgame::Lobby lobby = fx::basic_lobby(1);
  bgame::GameSession session{1, *store, bus};

  bgame::Status start(const std::vector<bgame::PlayerId>& roster = {1, 2}) {
    EXPECT_TRUE(store->save_lobby(lobby).ok());
    std::map<bgame::PlayerId, bgame::ClassId> classes;
    for (auto p : roster) classes[p] = 1;
    return session.start_new_game(lobby, roster, classes);
  }
};

} // namespace

TEST(GameSession, StartSeedsQueuesFromFlow) {
  Table t;
  ASSERT_TRUE(t.start().ok());
  EXPECT_EQ(t.session.phase(), bgame::GamePhase::Active);

  const auto& rs = t.session.state();
  EXPECT_EQ(rs.round, 0);
  EXPECT_EQ(rs.players, 2);
  EXPECT_EQ(rs.demand, 4);
  EXPECT_EQ(rs.supply, 10);

  const auto& p1 = rs.users_states.at(1);
  EXPECT_EQ(p1.money, 1000);
  EXPECT_EQ(p1.magazine_state, 10);
  ASSERT_EQ(p1.incoming_orders.size(), 2u);
  EXPECT_EQ(p1.incoming_orders.front(), (bgame::Order{1, bgame::kNoPlayer, 4, 4}));
  EXPECT_EQ(p1.requested_orders.front(), (bgame::Order{2, 1, 4, 4}));

  const auto& p2 = rs.users_states.at(2);
  EXPECT_EQ(p2.incoming_orders.front(), (bgame::Order{2, 1, 4, 4}));
  EXPECT_EQ(p2.requested_orders.front(), (bgame::Order{bgame::kNoPlayer, 2, 4, 4}));

  auto row = t.store->latest_snapshot(1);
  ASSERT_TRUE(row.ok());
  ASSERT_TRUE(row.value.has_value());
  EXPECT_EQ(row.value->round, 0);
  EXPECT_TRUE(t.store->get_lobby(1).value.started);

  const auto evs = fx::drain(*t.sub);
  ASSERT_EQ(evs.size(), 1u);
  EXPECT_EQ(bgame::type_of(evs[0]), bgame::LobbyEventType::GameStarted);
}

TEST(GameSession, StartRejectsIncompleteConfiguration) {
  {
    Table t;
    ASSERT_TRUE(t.store->save_lobby(t.lobby).ok());
    auto st = t.session.start_new_game(t.lobby, {1, 2}, {{1, 1}});   // player 2 has no class
    EXPECT_EQ(st.kind, bgame::ErrorKind::BadRequest);
  }
  {
    Table t;
    t.lobby.settings.start_money.clear();
    EXPECT_EQ(t.start().kind, bgame::ErrorKind::BadRequest);
  }
  {
    Table t;
    t.lobby.settings.demand_style = bgame::ListStyle{};
    EXPECT_EQ(t.start().kind, bgame::ErrorKind::BadRequest);
  }
  {
    Table t;
    EXPECT_EQ(t.start({}).kind, bgame::ErrorKind::BadRequest);
    EXPECT_EQ(t.session.phase(), bgame::GamePhase::NotStarted);
    EXPECT_FALSE(t.store->latest_snapshot(1).value.has_value());
    EXPECT_TRUE(bgame::fixtures::drain(*t.sub).empty());
  }
}

TEST(GameSession, SecondStartIsRejected) {
  Table t;
  ASSERT_TRUE(t.start().ok());
  EXPECT_EQ(t.start().kind, bgame::ErrorKind::LobbyStarted);
}

TEST(GameSession, SubmitBeforeStartIsRejected) {
  Table t;
  EXPECT_EQ(t.session.submit_round_end(1, 4).kind, bgame::ErrorKind::LobbyNotStarted);
}

TEST(GameSession, SingleSubmissionSettlesThePlayer) {
  Table t;
  ASSERT_TRUE(t.start().ok());
  (void)fx::drain(*t.sub);

  ASSERT_TRUE(t.session.submit_round_end(1, 6).ok());

  const auto& rs = t.session.state();
  const auto& p1 = rs.users_states.at(1);
  // order 6*2+5 = 17, holding 10*1 = 10
  EXPECT_EQ(p1.money, 1000 - 17 - 10);
  EXPECT_EQ(p1.spent_money, 27);
  EXPECT_EQ(p1.placed_order, (bgame::Order{1, bgame::kNoPlayer, 6, 17}));
  EXPECT_EQ(p1.received_order, (bgame::Order{1, bgame::kNoPlayer, 4, 4}));
  // 10 + 4 received - 4 shipped
  EXPECT_EQ(p1.magazine_state, 10);
  ASSERT_EQ(p1.sent_orders.size(), 1u);
  EXPECT_EQ(p1.sent_orders.back(), (bgame::Order{2, 1, 4, 13}));
  EXPECT_EQ(rs.send_orders.at(1), p1.sent_orders.back());
  EXPECT_EQ(rs.round_orders.at(1), p1.placed_order);

  EXPECT_TRUE(t.session.has_submitted(1));
  EXPECT_FALSE(t.session.has_submitted(2));

  const auto evs = fx::drain(*t.sub);
  ASSERT_EQ(evs.size(), 1u);
  EXPECT_EQ(bgame::type_of(evs[0]), bgame::LobbyEventType::SubmissionAck);
}

TEST(GameSession, RoundWaitsForEveryPlayer) {
  Table t;
  ASSERT_TRUE(t.start().ok());

  ASSERT_TRUE(t.session.submit_round_end(1, 6).ok());
  EXPECT_EQ(t.session.state().round, 0);
  EXPECT_EQ(t.session.state().players_finished, 1);
  EXPECT_EQ(t.store->latest_snapshot(1).value->round, 0);

  EXPECT_EQ(t.session.submit_round_end(1, 6).kind, bgame::ErrorKind::AlreadySubmitted);
  EXPECT_EQ(t.session.state().players_finished, 1);
}

TEST(GameSession, RoundFinishRoutesOrdersThroughTheChain) {
  Table t;
  ASSERT_TRUE(t.start().ok());
  (void)fx::drain(*t.sub);

  ASSERT_TRUE(t.session.submit_round_end(1, 6).ok());
  ASSERT_TRUE(t.session.submit_round_end(2, 3).ok());

  const auto& rs = t.session.state();
  EXPECT_EQ(rs.round, 1);
  EXPECT_EQ(rs.players_finished, 0);
  EXPECT_TRUE(rs.round_orders.empty());
  EXPECT_TRUE(rs.send_orders.empty());
  EXPECT_EQ(rs.demand, 5);
  EXPECT_EQ(rs.supply, 10);

  const auto& p1 = rs.users_states.at(1);
  const auto& p2 = rs.users_states.at(2);

  // player 2's order must be shipped by player 1, the demand by player 2
  EXPECT_EQ(p1.requested_orders.back(), (bgame::Order{2, 1, 3, 11}));
  EXPECT_EQ(p2.requested_orders.back(), (bgame::Order{bgame::kNoPlayer, 2, 5, 5}));

  // supply 10 covers the 6 asked for, so player 1 gets exactly its order
  EXPECT_EQ(p1.incoming_orders.back(), (bgame::Order{1, bgame::kNoPlayer, 6, 17}));
  EXPECT_EQ(p2.incoming_orders.back(), (bgame::Order{2, 1, 4, 13}));
  EXPECT_EQ(p1.incoming_orders.size(), 2u);
  EXPECT_EQ(p2.requested_orders.size(), 2u);

  auto row = t.store->latest_snapshot(1);
  ASSERT_TRUE(row.value.has_value());
  EXPECT_EQ(row.value->round, 1);
  EXPECT_EQ(row.value->round_orders.at(bgame::kNoPlayer), (bgame::Order{bgame::kNoPlayer, 2, 5, 5}));
  EXPECT_EQ(row.value->user_states, rs.users_states);

  const auto evs = fx::drain(*t.sub);
  const std::vector<bgame::LobbyEventType> expected{
    bgame::LobbyEventType::SubmissionAck, bgame::LobbyEventType::SubmissionAck,
    bgame::LobbyEventType::RoundEnded, bgame::LobbyEventType::RoundStarted};
  EXPECT_EQ(fx::types_of(evs), expected);

  const auto& started = std::get<bgame::RoundStarted>(evs.back()).update;
  EXPECT_EQ(started.round, 1);
  EXPECT_EQ(started.round_orders.size(), 3u);
  EXPECT_EQ(started.send_orders.size(), 3u);
}

TEST(GameSession, SupplyIsCappedByGeneratedAmount) {
  Table t;
  t.lobby.settings.supply_style = bgame::LinearStyle{2, 0};
  ASSERT_TRUE(t.start().ok());

  ASSERT_TRUE(t.session.submit_round_end(1, 6).ok());
  ASSERT_TRUE(t.session.submit_round_end(2, 3).ok());

  const auto& p1 = t.session.state().users_states.at(1);
  EXPECT_EQ(p1.incoming_orders.back(), (bgame::Order{1, bgame::kNoPlayer, 2, 2}));
}

TEST(GameSession, SupplyCapIsGeneratedFromTheStartingLevel) {
  Table t;
  t.lobby.settings.supply_style = bgame::DefaultStyle{};   // starts at 10, next level 15
  ASSERT_TRUE(t.start().ok());

  for (int r = 0; r < 2; ++r) {
    ASSERT_TRUE(t.session.submit_round_end(1, 40).ok());
    ASSERT_TRUE(t.session.submit_round_end(2, 3).ok());

    const auto& rs = t.session.state();
    EXPECT_EQ(rs.supply, 10);
    EXPECT_EQ(rs.users_states.at(1).incoming_orders.back(), (bgame::Order{1, bgame::kNoPlayer, 15, 15}));
  }
  EXPECT_EQ(t.store->latest_snapshot(1).value->supply, 10);
}

TEST(GameSession, OversizedOrderIsRejectedWithoutSideEffects) {
  Table t;
  ASSERT_TRUE(t.start().ok());
  (void)fx::drain(*t.sub);

  constexpr bgame::Value kMax = std::numeric_limits<bgame::Value>::max();
  const bgame::RoundState before = t.session.state();

  // price 2, fixed 5: the first overflows the product, the second the sum
  for (const bgame::Value qty : {kMax / 2 + 1, (kMax - 5) / 2 + 1, kMax}) {
    const auto st = t.session.submit_round_end(1, qty);
    EXPECT_EQ(st.kind, bgame::ErrorKind::BadRequest);
    EXPECT_EQ(t.session.state(), before);
    EXPECT_FALSE(t.session.has_submitted(1));
  }

  const auto evs = fx::drain(*t.sub);
  ASSERT_EQ(evs.size(), 3u);
  for (const auto& e : evs) {
    EXPECT_EQ(std::get<bgame::PlayerError>(e).error.kind, bgame::ErrorKind::BadRequest);
  }

  // a sane order from the same player still goes through
  ASSERT_TRUE(t.session.submit_round_end(1, 6).ok());
  EXPECT_EQ(t.session.state().users_states.at(1).money, 1000 - 17 - 10);
}

TEST(GameSession, InsufficientFundsLeavesStateUntouched) {
  Table t;
  ASSERT_TRUE(t.start().ok());
  (void)fx::drain(*t.sub);

  const bgame::RoundState before = t.session.state();
  const auto st = t.session.submit_round_end(1, 1000);   // 2005 > 1000

  EXPECT_EQ(st.kind, bgame::ErrorKind::InsufficientFunds);
  EXPECT_EQ(t.session.state(), before);
  EXPECT_FALSE(t.session.has_submitted(1));

  const auto evs = fx::drain(*t.sub);
  ASSERT_EQ(evs.size(), 1u);
  const auto& err = std::get<bgame::PlayerError>(evs[0]);
  EXPECT_EQ(err.player, 1u);
  EXPECT_EQ(err.error.kind, bgame::ErrorKind::InsufficientFunds);
}

TEST(GameSession, FailedSnapshotCommitsNothing) {
  auto sqlite = fx::memory_store();
  FlakyStore store{*sqlite};
  bgame::BroadcastBus bus{64};
  auto sub = bus.subscribe();
  bgame::GameSession session{1, store, bus};

  const auto lobby = fx::basic_lobby(1);
  ASSERT_TRUE(store.save_lobby(lobby).ok());
  ASSERT_TRUE(session.start_new_game(lobby, {1, 2}, {{1, 1}, {2, 1}}).ok());
  ASSERT_TRUE(session.submit_round_end(1, 6).ok());
  (void)fx::drain(*sub);

  const bgame::RoundState before = session.state();
  store.fail_appends = true;

  EXPECT_EQ(session.submit_round_end(2, 3).kind, bgame::ErrorKind::Persistence);
  EXPECT_EQ(session.state(), before);
  EXPECT_FALSE(session.has_submitted(2));
  EXPECT_EQ(sqlite->latest_snapshot(1).value->round, 0);

  const auto evs = fx::drain(*sub);
  ASSERT_EQ(evs.size(), 1u);
  EXPECT_EQ(std::get<bgame::LobbyError>(evs[0]).error.kind, bgame::ErrorKind::Persistence);

  // the same submission goes through once the store recovers
  store.fail_appends = false;
  ASSERT_TRUE(session.submit_round_end(2, 3).ok());
  EXPECT_EQ(session.state().round, 1);
  EXPECT_EQ(sqlite->latest_snapshot(1).value->round, 1);
}

TEST(GameSession, GameEndsAfterMaxRounds) {
  Table t;
  ASSERT_TRUE(t.start().ok());

  for (int r = 0; r < 3; ++r) {
    ASSERT_TRUE(t.session.submit_round_end(1, 4).ok());
    ASSERT_TRUE(t.session.submit_round_end(2, 4).ok());
  }

  EXPECT_EQ(t.session.phase(), bgame::GamePhase::Finished);
  EXPECT_EQ(t.session.state().round, 3);
  EXPECT_EQ(t.session.submit_round_end(1, 4).kind, bgame::ErrorKind::GameFinished);

  const auto evs = fx::drain(*t.sub);
  const bgame::GameEnded* ended = nullptr;
  for (const auto& e : evs) {
    if (const auto* g = std::get_if<bgame::GameEnded>(&e)) ended = g;
  }
  ASSERT_NE(ended, nullptr);
  EXPECT_EQ(bgame::type_of(evs.back()), bgame::LobbyEventType::PlayerError);   // the late submission

  const auto& money = ended->end.stats.at("money");
  ASSERT_EQ(money.at(1).size(), 4u);   // rounds 0..3
  EXPECT_EQ(money.at(1).front(), 1000);
  EXPECT_EQ(ended->end.stats.count("spent_money"), 1u);
  EXPECT_EQ(ended->end.stats.count("performance"), 0u);
  EXPECT_EQ(ended->end.player_states, t.session.state().users_states);
}

TEST(GameSession, RestoredSessionBehavesLikeTheOriginal) {
  Table live;
  bgame::GameEvent bonus{};
  bonus.name = "bonus";
  bonus.condition = bgame::RoundMet{1};
  bonus.actions.push_back(bgame::AddResource{bgame::Resource::Money, bgame::ActionTarget::AllPlayers, 100});
  live.lobby.events.push_back(bonus);

  ASSERT_TRUE(live.start().ok());
  ASSERT_TRUE(live.session.submit_round_end(1, 6).ok());
  ASSERT_TRUE(live.session.submit_round_end(2, 3).ok());

  // 1000 - 17 order - 10 holding + 100 granted on entering round 1
  EXPECT_EQ(live.session.state().users_states.at(1).money, 1073);

  auto row = live.store->latest_snapshot(1);
  ASSERT_TRUE(row.ok());
  ASSERT_TRUE(row.value.has_value());
  EXPECT_EQ(row.value->user_states.at(1).money, 1073);

  auto other_store = fx::memory_store();
  bgame::BroadcastBus other_bus{16};
  bgame::GameSession restored{1, *other_store, other_bus};
  ASSERT_TRUE(restored.restore(live.session.lobby(), *row.value).ok());

  EXPECT_EQ(restored.phase(), bgame::GamePhase::Active);
  EXPECT_EQ(restored.state(), live.session.state());

  for (auto* s : {&live.session, &restored}) {
    ASSERT_TRUE(s->submit_round_end(2, 5).ok());
    ASSERT_TRUE(s->submit_round_end(1, 7).ok());
  }
  EXPECT_EQ(restored.state(), live.session.state());
  EXPECT_EQ(restored.state().round, 2);
}

TEST(GameSession, ResetDropsLiveState) {
  Table t;
  ASSERT_TRUE(t.start().ok());
  t.session.reset();
  EXPECT_EQ(t.session.phase(), bgame::GamePhase::NotStarted);
  EXPECT_TRUE(t.session.state().users_states.empty());
  EXPECT_TRUE(t.store->latest_snapshot(1).value.has_value());
}
