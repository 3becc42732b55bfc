#include "bgame/stats.hpp"

#include "bgame/player_state.hpp"
#include "bgame/snapshot.hpp"

namespace bgame {

std::string_view stat_name(StatKind k) noexcept {
  switch (k) {
    case StatKind::Money: return "money";
    case StatKind::Performance: return "performance";
    case StatKind::MagazineState: return "magazine_state";
    case StatKind::PlacedOrder: return "placed_order";
    case StatKind::ReceivedOrder: return "received_order";
    case StatKind::BackOrder: return "back_order";
    case StatKind::SpentMoney: return "spent_money";
  }
  return "unknown";
}

std::optional<StatKind> parse_stat_kind(std::string_view s) noexcept {
  if (s == "Money" || s == "money") return StatKind::Money;
  if (s == "Performance" || s == "performance") return StatKind::Performance;
  if (s == "MagazineState" || s == "magazine_state") return StatKind::MagazineState;
  if (s == "PlacedOrder" || s == "placed_order") return StatKind::PlacedOrder;
  if (s == "ReceivedOrder" || s == "received_order") return StatKind::ReceivedOrder;
  if (s == "BackOrder" || s == "back_order") return StatKind::BackOrder;
  if (s == "SpentMoney" || s == "spent_money") return StatKind::SpentMoney;
  return std::nullopt;
}

Value extract_stat(const PlayerState& s, StatKind k) noexcept {
  switch (k) {
    case StatKind::Money: return s.money;
    case StatKind::Performance: return s.performance;
    case StatKind::MagazineState: return s.magazine_state;
    case StatKind::PlacedOrder: return s.placed_order.cost;
    case StatKind::ReceivedOrder: return s.received_order.cost;
    case StatKind::BackOrder: return s.back_order_sum;
    case StatKind::SpentMoney: return s.spent_money;
  }
  return 0;
}

std::vector<StatKind> end_of_game_stats() {
  return {StatKind::Money, StatKind::MagazineState, StatKind::BackOrder,
          StatKind::PlacedOrder, StatKind::ReceivedOrder, StatKind::SpentMoney};
}

PlayerStats collect_player_stats(const std::vector<GameStateRow>& rows, const std::vector<StatKind>& kinds) {
  PlayerStats out;
  for (const StatKind k : kinds) {
    auto& per_player = out[std::string(stat_name(k))];
    for (const auto& row : rows) {
      for (const auto& [id, us] : row.user_states) {
        per_player[id].push_back(extract_stat(us, k));
      }
    }
  }
  return out;
}

} // namespace bgame
