#include <charconv>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "bgame/lobby_registry.hpp"
#include "bgame/log.hpp"
#include "bgame/snapshot_store.hpp"
#include "bgame/stats.hpp"

// one row per (stat, player, round)
static void write_stats_csv(const std::string& path, const bgame::PlayerStats& stats) {
  std::ofstream f(path);
  f << "stat,player,round,value\n";
  for (const auto& [name, per_player] : stats) {
    for (const auto& [player, series] : per_player) {
      for (std::size_t r = 0; r < series.size(); ++r) {
        f << name << "," << player << "," << r << "," << series[r] << "\n";
      }
    }
  }
}

static void write_states_csv(const std::string& path, const bgame::PlayerStates& states) {
  std::ofstream f(path);
  f << "player,money,spent_money,magazine_state,back_order_sum,pending_incoming,pending_requested\n";
  for (const auto& [id, s] : states) {
    f << id << "," << s.money << "," << s.spent_money << "," << s.magazine_state << ","
      << s.back_order_sum << "," << s.incoming_orders.size() << "," << s.requested_orders.size() << "\n";
  }
}

static void usage() {
  std::cout
    << "Usage:\n"
    << "  bgame_cli [players] [rounds] [order_qty] [database]\n"
    << "  bgame_cli --stats <database> <lobby_id> <out.csv>\n";
}

template <class T>
static bool parse_arg(const char* s, T& out) {
  const std::string_view v(s);
  const auto res = std::from_chars(v.data(), v.data() + v.size(), out);
  return res.ec == std::errc{} && res.ptr == v.data() + v.size();
}

// Classic setup: every position in the chain shares class 1
static bgame::Lobby demo_lobby(bgame::LobbyId id, int32_t players, bgame::Round rounds) {
  bgame::Lobby l{};
  l.id = id;
  l.name = "demo";
  l.max_players = players;
  l.owner_id = 1;

  bgame::Settings& s = l.settings;
  s.start_money[1] = 10'000;
  s.start_magazine[1] = 12;
  s.resource_price[1] = 5;
  s.fix_order_cost[1] = 10;
  s.magazine_cost[1] = 1;
  s.incoming_start_queue[1] = {4, 4};
  s.requested_start_queue[1] = {4, 4};
  s.resource_basic_price = 2;
  s.demand_style = bgame::ListStyle{{4, 6, 8, 10, 12}};
  s.supply_style = bgame::LinearStyle{20, 0};
  s.max_rounds = rounds;

  bgame::GameEvent low_stock{};
  low_stock.name = "low stock";
  low_stock.condition = bgame::ValueExceed{bgame::Resource::BackOrderValue, {bgame::MetByKind::SinglePlayer, 0}, 10};
  low_stock.actions.push_back(bgame::ShowMessage{"backorders are piling up", bgame::ActionTarget::EventTarget});
  l.events.push_back(low_stock);
  return l;
}

int main(int argc, char** argv) {
  bgame::set_log_level(bgame::LogLevel::Warn);

  // ---------------- Export mode ----------------
  if (argc >= 2 && std::string(argv[1]) == "--stats") {
    if (argc < 5) { usage(); return 1; }

    bgame::LobbyId lobby = 0;
    if (!parse_arg(argv[3], lobby)) { usage(); return 1; }

    auto store = bgame::SqliteSnapshotStore::open(argv[2]);
    if (!store.ok()) {
      std::cerr << bgame::describe(store.status) << "\n";
      return 1;
    }
    auto rows = store.value->all_snapshots(lobby);
    if (!rows.ok()) {
      std::cerr << bgame::describe(rows.status) << "\n";
      return 1;
    }
    std::vector<bgame::StatKind> kinds = bgame::end_of_game_stats();
    kinds.push_back(bgame::StatKind::Performance);
    write_stats_csv(argv[4], bgame::collect_player_stats(rows.value, kinds));
    std::cout << "Wrote " << argv[4] << " (" << rows.value.size() << " rounds)\n";
    return 0;
  }

  // ---------------- Scripted game ----------------
  int32_t players = 4;
  bgame::Round rounds = 10;
  bgame::Value qty = 4;
  std::string db = ":memory:";

  if (argc > 1 && !parse_arg(argv[1], players)) { usage(); return 1; }
  if (argc > 2 && !parse_arg(argv[2], rounds)) { usage(); return 1; }
  if (argc > 3 && !parse_arg(argv[3], qty)) { usage(); return 1; }
  if (argc > 4) db = argv[4];
  if (players <= 0 || rounds <= 0) { usage(); return 1; }

  auto store = bgame::SqliteSnapshotStore::open(db);
  if (!store.ok()) {
    std::cerr << bgame::describe(store.status) << "\n";
    return 1;
  }

  bgame::LobbyRegistry registry{*store.value};
  const bgame::LobbyId lobby_id = 1;

  if (auto st = registry.create_lobby(demo_lobby(lobby_id, players, rounds)); !st.ok()) {
    std::cerr << bgame::describe(st) << "\n";
    return 1;
  }

  std::vector<bgame::PlayerId> roster;
  std::map<bgame::PlayerId, bgame::ClassId> classes;
  for (int32_t i = 0; i < players; ++i) {
    const auto p = static_cast<bgame::PlayerId>(100 + i);
    roster.push_back(p);
    classes[p] = 1;
  }

  if (auto st = registry.start_game(lobby_id, roster, classes); !st.ok()) {
    std::cerr << bgame::describe(st) << "\n";
    return 1;
  }

  for (bgame::Round r = 0; r < rounds; ++r) {
    for (const auto p : roster) {
      if (auto st = registry.submit_round_end(lobby_id, p, qty); !st.ok()) {
        std::cerr << "round " << r << ", player " << p << ": " << bgame::describe(st) << "\n";
        return 1;
      }
    }
  }

  auto view = registry.view(lobby_id);
  if (!view.ok()) {
    std::cerr << bgame::describe(view.status) << "\n";
    return 1;
  }
  auto stats = registry.player_stats(lobby_id, bgame::end_of_game_stats());
  if (!stats.ok()) {
    std::cerr << bgame::describe(stats.status) << "\n";
    return 1;
  }

  write_states_csv("players.csv", view.value.state.users_states);
  write_stats_csv("stats.csv", stats.value);

  std::cout << "Game " << bgame::to_string(view.value.phase) << " after " << view.value.state.round
            << " rounds\n";
  std::cout << "Wrote players.csv and stats.csv\n";
  return 0;
}
