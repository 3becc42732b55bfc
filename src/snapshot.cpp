#include "bgame/snapshot.hpp"

namespace bgame {

GameStateRow make_snapshot(LobbyId lobby, const RoundState& rs) {
  GameStateRow row{};
  row.lobby = lobby;
  row.round = rs.round;
  row.user_states = rs.users_states;
  row.round_orders = rs.round_orders;
  row.send_orders = rs.send_orders;
  row.player_classes = rs.player_classes;
  row.flow = rs.flow;
  row.demand = rs.demand;
  row.supply = rs.supply;
  return row;
}

RoundState restore_round_state(const GameStateRow& row, const Settings& settings) {
  RoundState rs{};
  rs.round = row.round;
  rs.players = static_cast<int64_t>(row.user_states.size());
  rs.players_finished = 0;
  rs.users_states = row.user_states;
  rs.player_classes = row.player_classes;
  rs.settings = settings;
  rs.flow = row.flow;
  rs.demand = row.demand;
  rs.supply = row.supply;
  // order maps were folded into the player queues before the row was written
  return rs;
}

} // namespace bgame
