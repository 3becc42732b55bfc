#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace bgame {

enum class ErrorKind : uint8_t {
  None = 0,

  // configuration / malformed input
  BadRequest,
  NotFound,

  // business rules
  InsufficientFunds,
  AlreadySubmitted,
  LobbyStarted,
  LobbyNotStarted,
  GameFinished,

  // server side
  Internal,
  Persistence
};

std::string_view to_string(ErrorKind k) noexcept;

// Rejections a client caused and can fix; everything else is a server fault.
inline constexpr bool is_client_error(ErrorKind k) noexcept {
  return k != ErrorKind::None && k != ErrorKind::Internal && k != ErrorKind::Persistence;
}

struct Status {
  ErrorKind kind{ErrorKind::None};
  std::string detail{};

  bool ok() const noexcept { return kind == ErrorKind::None; }

  static Status success() { return {}; }
  static Status error(ErrorKind k, std::string d) { return Status{k, std::move(d)}; }

  friend bool operator==(const Status&, const Status&) = default;
};

// Value plus the status that produced it; value is meaningful only when ok()
template <class T>
struct Outcome {
  Status status{};
  T value{};

  bool ok() const noexcept { return status.ok(); }

  static Outcome success(T v) { return Outcome{Status{}, std::move(v)}; }
  static Outcome failure(Status s) { return Outcome{std::move(s), T{}}; }
};

std::string describe(const Status& s);

} // namespace bgame
