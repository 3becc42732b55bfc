#pragma once
#include <map>
#include <variant>
#include <vector>

#include "bgame/status.hpp"
#include "bgame/types.hpp"

namespace bgame {

// ---- demand / supply generation styles ----
struct DefaultStyle {
  friend bool operator==(const DefaultStyle&, const DefaultStyle&) = default;
};

struct LinearStyle {
  Value start{};
  Value increase{};
  friend bool operator==(const LinearStyle&, const LinearStyle&) = default;
};

struct MultiplicationStyle {
  Value start{};
  Value increase{};
  friend bool operator==(const MultiplicationStyle&, const MultiplicationStyle&) = default;
};

struct ExponentialStyle {
  Value start{};
  Value power{};
  Value modulator{};
  friend bool operator==(const ExponentialStyle&, const ExponentialStyle&) = default;
};

struct ListStyle {
  std::vector<Value> values{};
  friend bool operator==(const ListStyle&, const ListStyle&) = default;
};

using GeneratedOrderStyle =
    std::variant<DefaultStyle, LinearStyle, MultiplicationStyle, ExponentialStyle, ListStyle>;

enum class StyleType : uint8_t { Default, Linear, Multiplication, Exponential, List };

inline StyleType type_of(const GeneratedOrderStyle& s) noexcept {
  return static_cast<StyleType>(s.index()); // relies on variant order above
}

// ---- per-class economic configuration ----
template <class T>
using PerClass = std::map<ClassId, T>;

struct Settings {
  PerClass<Value> start_money{};
  PerClass<Value> start_magazine{};
  PerClass<Value> resource_price{};
  PerClass<Value> fix_order_cost{};
  PerClass<Value> magazine_cost{};
  PerClass<std::vector<Value>> incoming_start_queue{};
  PerClass<std::vector<Value>> requested_start_queue{};

  Value resource_basic_price{};
  GeneratedOrderStyle demand_style{DefaultStyle{}};
  GeneratedOrderStyle supply_style{DefaultStyle{}};
  Round max_rounds{};

  friend bool operator==(const Settings&, const Settings&) = default;
};

// Pricing entries a player needs for every submission
struct ClassPricing {
  Value resource_price{};
  Value fix_order_cost{};
  Value magazine_cost{};
};

Outcome<ClassPricing> pricing_for(const Settings& s, ClassId cls);

// Rejects styles that cannot be evaluated (empty List)
Status validate_style(const GeneratedOrderStyle& style, std::string_view what);

} // namespace bgame
