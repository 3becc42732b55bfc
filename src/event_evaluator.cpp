#include "bgame/event_evaluator.hpp"

#include <cstdlib>
#include <string>
#include <type_traits>

#include "bgame/log.hpp"
#include "bgame/settlement.hpp"

namespace bgame {

namespace {

std::vector<PlayerId> all_players(const PlayerStates& players) {
  std::vector<PlayerId> out;
  out.reserve(players.size());
  for (const auto& [id, _] : players) out.push_back(id);
  return out;
}

} // namespace

ConditionResult evaluate_round_met(const RoundState& rs, Round round) {
  if (rs.round != round) return {};
  return ConditionResult{true, all_players(rs.users_states)};
}

ConditionResult evaluate_value_exceed(const PlayerStates& players, Resource resource, MetBy met_by, Value value) {
  ConditionResult r{};
  if (players.empty()) return r;

  switch (met_by.kind) {
    case MetByKind::SinglePlayer: {
      for (const auto& [id, s] : players) {
        if (resource_value(s, resource) > value) r.targets.push_back(id);
      }
      r.met = !r.targets.empty();
      return r;
    }
    case MetByKind::Average: {
      Value sum = 0;
      for (const auto& [id, s] : players) sum = saturating_add(sum, resource_value(s, resource));
      r.met = sum / static_cast<Value>(players.size()) > value;
      if (r.met) r.targets = all_players(players);
      return r;
    }
    case MetByKind::AllPlayers: {
      for (const auto& [id, s] : players) {
        if (resource_value(s, resource) < value) return r;   // met stays false
        r.targets.push_back(id);
      }
      r.met = true;
      return r;
    }
    case MetByKind::PlayerPercent: {
      for (const auto& [id, s] : players) {
        if (resource_value(s, resource) > value) r.targets.push_back(id);
      }
      const auto exceeding = static_cast<int64_t>(r.targets.size());
      const auto total = static_cast<int64_t>(players.size());
      // integer division first: 1 of 3 exceeding counts as 0%
      r.met = (exceeding / total) * 100 >= met_by.percent;
      if (!r.met) r.targets.clear();
      return r;
    }
  }
  return r;
}

ConditionResult evaluate_single_change(const PlayerStates& current, const PlayerStates& prior,
                                       Resource resource, Value value) {
  ConditionResult r{};
  for (const auto& [id, s] : current) {
    const auto before = prior.find(id);
    if (before == prior.end()) continue;
    const Value delta = std::abs(resource_value(s, resource) - resource_value(before->second, resource));
    if (delta > value) r.targets.push_back(id);
  }
  r.met = !r.targets.empty();
  return r;
}

Outcome<ConditionResult> EventEvaluator::evaluate(const EventCondition& cond, const RoundState& rs) {
  return std::visit([&](const auto& c) -> Outcome<ConditionResult> {
    using T = std::decay_t<decltype(c)>;

    if constexpr (std::is_same_v<T, RoundMet>) {
      return Outcome<ConditionResult>::success(evaluate_round_met(rs, c.round));
    } else if constexpr (std::is_same_v<T, ValueExceed>) {
      return Outcome<ConditionResult>::success(evaluate_value_exceed(rs.users_states, c.resource, c.met_by, c.value));
    } else {
      auto prior = store_.snapshot_at(lobby_, rs.round - 1);
      if (!prior.ok()) return Outcome<ConditionResult>::failure(prior.status);
      if (!prior.value) return Outcome<ConditionResult>::success(ConditionResult{});
      return Outcome<ConditionResult>::success(
          evaluate_single_change(rs.users_states, prior.value->user_states, c.resource, c.value));
    }
  }, cond);
}

Status EventEvaluator::apply(const EventAction& action, const std::vector<PlayerId>& targets, RoundState& rs,
                             Settings* lobby_settings, std::vector<LobbyEvent>& out) {
  return std::visit([&](const auto& a) -> Status {
    using T = std::decay_t<decltype(a)>;

    if constexpr (std::is_same_v<T, ShowMessage>) {
      if (a.target == ActionTarget::AllPlayers) {
        out.emplace_back(PopUp{std::nullopt, a.message});
      } else {
        for (const PlayerId p : targets) out.emplace_back(PopUp{p, a.message});
      }
      return Status::success();
    } else if constexpr (std::is_same_v<T, ChangeSettings>) {
      if (Status st = validate_style(a.new_settings.demand_style, "demand_style"); !st.ok()) return st;
      if (Status st = validate_style(a.new_settings.supply_style, "supply_style"); !st.ok()) return st;

      if (Status st = store_.update_lobby_settings(lobby_, a.new_settings); !st.ok()) return st;
      rs.settings = a.new_settings;
      if (lobby_settings) *lobby_settings = a.new_settings;
      out.emplace_back(SettingsChanged{a.new_settings});
      return Status::success();
    } else {
      if (a.target == ActionTarget::AllPlayers) {
        for (auto& [id, s] : rs.users_states) {
          Value& field = resource_field(s, a.resource);
          field = saturating_add(field, a.value);
        }
        out.emplace_back(ResourceGranted{std::nullopt, a.resource, a.value});
        return Status::success();
      }
      for (const PlayerId p : targets) {
        const auto it = rs.users_states.find(p);
        if (it == rs.users_states.end()) {
          return Status::error(ErrorKind::Internal, "event target " + std::to_string(p) + " has no state");
        }
        Value& field = resource_field(it->second, a.resource);
        field = saturating_add(field, a.value);
        out.emplace_back(ResourceGranted{p, a.resource, a.value});
      }
      return Status::success();
    }
  }, action);
}

std::size_t EventEvaluator::run(const std::vector<GameEvent>& events, RoundState& rs, Settings* lobby_settings,
                                std::vector<LobbyEvent>& out) {
  std::size_t fired = 0;

  for (const auto& ev : events) {
    auto cond = evaluate(ev.condition, rs);
    if (!cond.ok()) {
      Json::Value fields;
      fields["lobby"] = static_cast<Json::UInt64>(lobby_);
      fields["event"] = ev.name;
      fields["error"] = describe(cond.status);
      log_warn("events", "condition evaluation failed", fields);
      out.emplace_back(LobbyError{cond.status});
      continue;
    }
    if (!cond.value.met) continue;

    ++fired;
    Json::Value fields;
    fields["lobby"] = static_cast<Json::UInt64>(lobby_);
    fields["event"] = ev.name;
    fields["round"] = static_cast<Json::Int64>(rs.round);
    fields["targets"] = static_cast<Json::UInt64>(cond.value.targets.size());
    log_info("events", "event fired", fields);

    for (const auto& action : ev.actions) {
      if (Status st = apply(action, cond.value.targets, rs, lobby_settings, out); !st.ok()) {
        fields["error"] = describe(st);
        log_warn("events", "event action failed", fields);
        out.emplace_back(LobbyError{std::move(st)});
        break;
      }
    }
  }
  return fired;
}

} // namespace bgame
