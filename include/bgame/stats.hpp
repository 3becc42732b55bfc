#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "bgame/types.hpp"

namespace bgame {

struct GameStateRow;
struct PlayerState;

enum class StatKind : uint8_t {
  Money = 0,
  Performance,
  MagazineState,
  PlacedOrder,
  ReceivedOrder,
  BackOrder,
  SpentMoney
};

// stat name -> player -> one value per persisted round, in round order
using PlayerStats = std::map<std::string, std::map<PlayerId, std::vector<Value>>>;

std::string_view stat_name(StatKind k) noexcept;
std::optional<StatKind> parse_stat_kind(std::string_view s) noexcept;
Value extract_stat(const PlayerState& s, StatKind k) noexcept;

// Kinds reported when a game ends
std::vector<StatKind> end_of_game_stats();

// Rows must already be ordered by round
PlayerStats collect_player_stats(const std::vector<GameStateRow>& rows, const std::vector<StatKind>& kinds);

} // namespace bgame
