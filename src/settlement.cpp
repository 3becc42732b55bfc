#include "bgame/settlement.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <numbers>
#include <string>
#include <type_traits>

namespace bgame {

namespace {

constexpr Value kMax = std::numeric_limits<Value>::max();
constexpr Value kMin = std::numeric_limits<Value>::min();

// 2^63 is exact in a double; anything at or past it does not fit
Value saturate(double x) noexcept {
  if (std::isnan(x)) return 0;
  if (x >= 9223372036854775808.0) return kMax;
  if (x < -9223372036854775808.0) return kMin;
  return static_cast<Value>(x);
}

} // namespace

Value saturating_add(Value a, Value b) noexcept {
  if (const auto r = checked_add(a, b)) return *r;
  return (b > 0) ? kMax : kMin;
}

Value saturating_mul(Value a, Value b) noexcept {
  if (const auto r = checked_mul(a, b)) return *r;
  return ((a < 0) == (b < 0)) ? kMax : kMin;
}

Value generate_next(Value previous, const GeneratedOrderStyle& style) {
  return std::visit([&](const auto& s) -> Value {
    using T = std::decay_t<decltype(s)>;

    if constexpr (std::is_same_v<T, DefaultStyle>) {
      return saturate(static_cast<double>(previous) * 1.5);
    } else if constexpr (std::is_same_v<T, LinearStyle>) {
      return saturating_add(previous, s.increase);
    } else if constexpr (std::is_same_v<T, MultiplicationStyle>) {
      return saturating_mul(previous, s.increase);
    } else if constexpr (std::is_same_v<T, ExponentialStyle>) {
      const Value factor = saturate(std::pow(std::numbers::e, static_cast<double>(s.power)));
      return saturating_mul(previous, saturating_mul(s.modulator, factor));
    } else {
      // end of script: saturate on the last value
      if (s.values.empty()) return previous;
      const auto it = std::find(s.values.begin(), s.values.end(), previous);
      if (it == s.values.end() || std::next(it) == s.values.end()) return s.values.back();
      return *std::next(it);
    }
  }, style);
}

Outcome<Value> initial_value(const GeneratedOrderStyle& style) {
  return std::visit([](const auto& s) -> Outcome<Value> {
    using T = std::decay_t<decltype(s)>;

    if constexpr (std::is_same_v<T, DefaultStyle>) {
      return Outcome<Value>::success(10);
    } else if constexpr (std::is_same_v<T, ListStyle>) {
      if (s.values.empty()) {
        return Outcome<Value>::failure(Status::error(ErrorKind::BadRequest, "empty list style"));
      }
      return Outcome<Value>::success(s.values.front());
    } else {
      return Outcome<Value>::success(s.start);
    }
  }, style);
}

BackorderSettlement settle_backorder(Value magazine, Value back_order_sum, Value requested) noexcept {
  BackorderSettlement out{0, magazine, back_order_sum};

  // drain outstanding debt first
  const Value drained = std::min(out.magazine, out.back_order_sum);
  out.magazine -= drained;
  out.back_order_sum -= drained;
  out.send_value += drained;

  if (out.magazine >= requested) {
    out.magazine -= requested;
  } else {
    out.back_order_sum = saturating_add(out.back_order_sum, requested - out.magazine);
    out.magazine = 0;
  }
  out.send_value = saturating_add(out.send_value, requested);

  return out;
}

Outcome<ClassPricing> pricing_for(const Settings& s, ClassId cls) {
  ClassPricing p{};

  const auto price = s.resource_price.find(cls);
  if (price == s.resource_price.end()) {
    return Outcome<ClassPricing>::failure(
        Status::error(ErrorKind::BadRequest, "resource price not found for class " + std::to_string(cls)));
  }
  const auto fixed = s.fix_order_cost.find(cls);
  if (fixed == s.fix_order_cost.end()) {
    return Outcome<ClassPricing>::failure(
        Status::error(ErrorKind::BadRequest, "fix order cost not found for class " + std::to_string(cls)));
  }
  const auto holding = s.magazine_cost.find(cls);
  if (holding == s.magazine_cost.end()) {
    return Outcome<ClassPricing>::failure(
        Status::error(ErrorKind::BadRequest, "magazine cost not found for class " + std::to_string(cls)));
  }

  p.resource_price = price->second;
  p.fix_order_cost = fixed->second;
  p.magazine_cost = holding->second;
  return Outcome<ClassPricing>::success(p);
}

Status validate_style(const GeneratedOrderStyle& style, std::string_view what) {
  if (const auto* l = std::get_if<ListStyle>(&style); l && l->values.empty()) {
    return Status::error(ErrorKind::BadRequest, std::string(what) + ": list style has no values");
  }
  return Status::success();
}

} // namespace bgame
