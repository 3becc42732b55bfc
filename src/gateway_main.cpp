#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "httplib.h"

#include "bgame/config.hpp"
#include "bgame/lobby_registry.hpp"
#include "bgame/log.hpp"
#include "bgame/poll_listeners.hpp"
#include "bgame/serialization.hpp"
#include "bgame/snapshot_store.hpp"
#include "bgame/stats.hpp"

namespace {

// Events handed out per poll once the first one arrived
constexpr std::size_t kMaxEventsPerPoll = 64;

constexpr int64_t kMaxWaitMs = 60'000;

} // namespace

// ---------------- Helpers ----------------
template <class T>
static std::optional<T> parse_id(const std::string& s) {
  T out{};
  const auto res = std::from_chars(s.data(), s.data() + s.size(), out);
  if (res.ec != std::errc{} || res.ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

static std::optional<int64_t> get_ll(const httplib::Request& req, const char* key) {
  if (!req.has_param(key)) return std::nullopt;
  return parse_id<int64_t>(req.get_param_value(key));
}

static void set_no_cache(httplib::Response& res) {
  res.set_header("Cache-Control", "no-store, max-age=0");
  res.set_header("Pragma", "no-cache");
}

static int http_status(bgame::ErrorKind k) {
  switch (k) {
    case bgame::ErrorKind::None: return 200;
    case bgame::ErrorKind::BadRequest: return 400;
    case bgame::ErrorKind::NotFound: return 404;
    case bgame::ErrorKind::InsufficientFunds:
    case bgame::ErrorKind::AlreadySubmitted:
    case bgame::ErrorKind::LobbyStarted:
    case bgame::ErrorKind::LobbyNotStarted:
    case bgame::ErrorKind::GameFinished: return 409;
    case bgame::ErrorKind::Internal:
    case bgame::ErrorKind::Persistence: return 500;
  }
  return 500;
}

static void reply_json(httplib::Response& res, const Json::Value& body, int status = 200) {
  set_no_cache(res);
  res.status = status;
  res.set_content(bgame::dump_json(body), "application/json");
}

static void reply_status(httplib::Response& res, const bgame::Status& st) {
  Json::Value body(Json::objectValue);
  body["ok"] = st.ok();
  if (!st.ok()) body["error"] = bgame::to_json(st);
  reply_json(res, body, http_status(st.kind));
}

static std::optional<bgame::LobbyId> lobby_of(const httplib::Request& req) {
  if (req.matches.size() < 2) return std::nullopt;
  return parse_id<bgame::LobbyId>(req.matches[1].str());
}

// ---------------- main ----------------
int main(int argc, char** argv) {
  // args: [port] [database]
  auto env = bgame::config_from_env();
  if (!env.ok()) {
    std::cerr << bgame::describe(env.status) << "\n";
    return 1;
  }
  auto cfg_r = bgame::apply_args(std::move(env.value), argc, argv);
  if (!cfg_r.ok()) {
    std::cerr << bgame::describe(cfg_r.status) << "\n";
    std::cerr << "Usage: bgame_gateway [port] [database]\n";
    return 1;
  }
  const bgame::ServerConfig cfg = std::move(cfg_r.value);
  bgame::set_log_level(cfg.log_level);

  auto store_r = bgame::SqliteSnapshotStore::open(cfg.database_path);
  if (!store_r.ok()) {
    Json::Value fields;
    fields["error"] = bgame::describe(store_r.status);
    bgame::log_error("gateway", "cannot open database", fields);
    return 1;
  }
  std::unique_ptr<bgame::SqliteSnapshotStore> store = std::move(store_r.value);

  bgame::LobbyRegistry registry{*store, cfg.backlog_per_player};
  if (bgame::Status st = registry.rehydrate(); !st.ok()) {
    Json::Value fields;
    fields["error"] = bgame::describe(st);
    bgame::log_error("gateway", "rehydration failed", fields);
    return 1;
  }

  bgame::PollListeners listeners{registry};
  httplib::Server svr;

  // Allow typing "exit" or "quit" to stop cleanly
  std::thread stdin_thread([&]() {
    std::string line;
    while (std::getline(std::cin, line)) {
      if (line == "exit" || line == "quit") {
        svr.stop();
        break;
      }
    }
  });

  // ---- Lobbies ----
  svr.Post("/api/lobby", [&](const httplib::Request& req, httplib::Response& res) {
    auto lobby = bgame::decode_json<bgame::Lobby>(req.body, bgame::lobby_from_json);
    if (!lobby.ok()) return reply_status(res, lobby.status);
    reply_status(res, registry.create_lobby(lobby.value));
  });

  svr.Delete(R"(/api/lobby/(\d+))", [&](const httplib::Request& req, httplib::Response& res) {
    const auto id = lobby_of(req);
    if (!id) return reply_status(res, bgame::Status::error(bgame::ErrorKind::BadRequest, "bad lobby id"));
    reply_status(res, registry.remove_lobby(*id));
  });

  svr.Get(R"(/api/lobby/(\d+))", [&](const httplib::Request& req, httplib::Response& res) {
    const auto id = lobby_of(req);
    if (!id) return reply_status(res, bgame::Status::error(bgame::ErrorKind::BadRequest, "bad lobby id"));

    auto view = registry.view(*id);
    if (!view.ok()) return reply_status(res, view.status);

    Json::Value body(Json::objectValue);
    body["lobby"] = bgame::to_json(view.value.lobby);
    body["phase"] = std::string(bgame::to_string(view.value.phase));
    body["round"] = static_cast<Json::Int64>(view.value.state.round);
    body["players_finished"] = static_cast<Json::Int64>(view.value.state.players_finished);
    body["player_states"] = bgame::to_json(view.value.state.users_states);
    body["flow"] = bgame::to_json(view.value.state.flow);
    reply_json(res, body);
  });

  svr.Post(R"(/api/lobby/(\d+)/classes)", [&](const httplib::Request& req, httplib::Response& res) {
    const auto id = lobby_of(req);
    if (!id) return reply_status(res, bgame::Status::error(bgame::ErrorKind::BadRequest, "bad lobby id"));

    auto classes = bgame::decode_json<std::map<bgame::PlayerId, bgame::ClassId>>(req.body, bgame::classes_from_json);
    if (!classes.ok()) return reply_status(res, classes.status);
    reply_status(res, registry.update_player_classes(*id, classes.value));
  });

  // ---- Game ----
  // body: {"roster":[ids in chain order], "classes":{"id":class}}; classes may be omitted
  svr.Post(R"(/api/lobby/(\d+)/start)", [&](const httplib::Request& req, httplib::Response& res) {
    const auto id = lobby_of(req);
    if (!id) return reply_status(res, bgame::Status::error(bgame::ErrorKind::BadRequest, "bad lobby id"));

    struct StartRequest {
      std::vector<bgame::PlayerId> roster;
      std::map<bgame::PlayerId, bgame::ClassId> classes;
    };
    auto start = bgame::decode_json<StartRequest>(req.body, [](const Json::Value& v) {
      StartRequest r{};
      for (const auto& p : v["roster"]) r.roster.push_back(p.asUInt64());
      r.classes = bgame::classes_from_json(v["classes"]);
      return r;
    });
    if (!start.ok()) return reply_status(res, start.status);
    reply_status(res, registry.start_game(*id, start.value.roster, start.value.classes));
  });

  svr.Post(R"(/api/lobby/(\d+)/round_end)", [&](const httplib::Request& req, httplib::Response& res) {
    const auto id = lobby_of(req);
    const auto player = get_ll(req, "player");
    const auto quantity = get_ll(req, "quantity");
    if (!id || !player || !quantity || *player <= 0) {
      return reply_status(res, bgame::Status::error(bgame::ErrorKind::BadRequest, "need lobby, player, quantity"));
    }
    reply_status(res, registry.submit_round_end(*id, static_cast<bgame::PlayerId>(*player), *quantity));
  });

  svr.Post(R"(/api/lobby/(\d+)/stop)", [&](const httplib::Request& req, httplib::Response& res) {
    const auto id = lobby_of(req);
    if (!id) return reply_status(res, bgame::Status::error(bgame::ErrorKind::BadRequest, "bad lobby id"));
    reply_status(res, registry.stop_game(*id));
  });

  svr.Post(R"(/api/lobby/(\d+)/disconnect)", [&](const httplib::Request& req, httplib::Response& res) {
    const auto id = lobby_of(req);
    const auto player = get_ll(req, "player");
    if (!id || !player || *player <= 0) {
      return reply_status(res, bgame::Status::error(bgame::ErrorKind::BadRequest, "need lobby and player"));
    }
    const auto p = static_cast<bgame::PlayerId>(*player);
    listeners.drop(*id, p);
    reply_status(res, registry.disconnect_player(*id, p));
  });

  // ?kinds=money,back_order ; default is the end-of-game set
  svr.Get(R"(/api/lobby/(\d+)/stats)", [&](const httplib::Request& req, httplib::Response& res) {
    const auto id = lobby_of(req);
    if (!id) return reply_status(res, bgame::Status::error(bgame::ErrorKind::BadRequest, "bad lobby id"));

    std::vector<bgame::StatKind> kinds;
    if (req.has_param("kinds")) {
      const std::string list = req.get_param_value("kinds");
      std::size_t pos = 0;
      while (pos <= list.size()) {
        const std::size_t comma = std::min(list.find(',', pos), list.size());
        const std::string name = list.substr(pos, comma - pos);
        if (!name.empty()) {
          const auto k = bgame::parse_stat_kind(name);
          if (!k) {
            return reply_status(res, bgame::Status::error(bgame::ErrorKind::BadRequest, "unknown stat '" + name + "'"));
          }
          kinds.push_back(*k);
        }
        pos = comma + 1;
      }
    } else {
      kinds = bgame::end_of_game_stats();
    }

    auto stats = registry.player_stats(*id, kinds);
    if (!stats.ok()) return reply_status(res, stats.status);
    reply_json(res, bgame::to_json(stats.value));
  });

  // Long poll: ?player=<id>[&wait_ms=<n>]
  svr.Get(R"(/api/lobby/(\d+)/events)", [&](const httplib::Request& req, httplib::Response& res) {
    const auto id = lobby_of(req);
    const auto player = get_ll(req, "player");
    if (!id || !player || *player <= 0) {
      return reply_status(res, bgame::Status::error(bgame::ErrorKind::BadRequest, "need lobby and player"));
    }
    const auto p = static_cast<bgame::PlayerId>(*player);
    const int64_t wait_ms = std::clamp<int64_t>(get_ll(req, "wait_ms").value_or(cfg.events_wait_ms), 0, kMaxWaitMs);

    auto sub = listeners.get(*id, p);
    if (!sub.ok()) return reply_status(res, sub.status);

    Json::Value events(Json::arrayValue);
    auto next = sub.value->wait_next(std::chrono::milliseconds(wait_ms));
    std::size_t taken = 0;
    while (next) {
      if (bgame::visible_to(*next, p)) events.append(bgame::to_json(*next));
      if (++taken == kMaxEventsPerPoll) break;
      next = sub.value->try_next();
    }

    Json::Value body(Json::objectValue);
    body["events"] = events;
    body["missed"] = static_cast<Json::UInt64>(sub.value->missed());
    body["closed"] = sub.value->closed();
    reply_json(res, body);
  });

  Json::Value fields;
  fields["port"] = cfg.port;
  fields["database"] = cfg.database_path;
  fields["lobbies"] = static_cast<Json::UInt64>(registry.lobby_count());
  bgame::log_info("gateway", "listening", fields);
  std::cout << "Type 'exit' (or 'quit') then press Enter to stop cleanly.\n";

  if (!svr.listen("0.0.0.0", cfg.port)) {
    bgame::log_error("gateway", "listen failed", fields);
    // nobody will type exit; leave the reader blocked on stdin
    stdin_thread.detach();
    return 1;
  }

  if (stdin_thread.joinable()) stdin_thread.join();
  return 0;
}
