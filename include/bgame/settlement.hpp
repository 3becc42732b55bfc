#pragma once
#include <optional>

#include "bgame/settings.hpp"
#include "bgame/status.hpp"
#include "bgame/types.hpp"

namespace bgame {

// Next demand/supply level from the previous one. A List style must be
// non-empty (validate_style); past its tail it keeps returning the last value.
// Compounding styles saturate at the int64 limits.
Value generate_next(Value previous, const GeneratedOrderStyle& style);

// Level used for round 0
Outcome<Value> initial_value(const GeneratedOrderStyle& style);

// int64 arithmetic on ledgers; nullopt when the result does not fit
inline constexpr std::optional<Value> checked_add(Value a, Value b) noexcept {
  Value r{};
  if (__builtin_add_overflow(a, b, &r)) return std::nullopt;
  return r;
}

inline constexpr std::optional<Value> checked_sub(Value a, Value b) noexcept {
  Value r{};
  if (__builtin_sub_overflow(a, b, &r)) return std::nullopt;
  return r;
}

inline constexpr std::optional<Value> checked_mul(Value a, Value b) noexcept {
  Value r{};
  if (__builtin_mul_overflow(a, b, &r)) return std::nullopt;
  return r;
}

// Clamped to [INT64_MIN, INT64_MAX]
Value saturating_add(Value a, Value b) noexcept;
Value saturating_mul(Value a, Value b) noexcept;

// No fixed cost on an empty order; nullopt when the cost overflows
inline constexpr std::optional<Value> order_cost(Value value, Value unit_price, Value fixed_cost) noexcept {
  if (value == 0) return Value{0};
  const auto variable = checked_mul(value, unit_price);
  if (!variable) return std::nullopt;
  return checked_add(*variable, fixed_cost);
}

struct BackorderSettlement {
  Value send_value{};
  Value magazine{};
  Value back_order_sum{};

  friend bool operator==(const BackorderSettlement&, const BackorderSettlement&) = default;
};

// Outstanding backorder is shipped first from stock; the fresh request is always
// shipped in full and any stock shortfall is carried as new backorder.
// Sums saturate at INT64_MAX.
BackorderSettlement settle_backorder(Value magazine, Value back_order_sum, Value requested) noexcept;

} // namespace bgame
