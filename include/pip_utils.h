#pragma once

// Pip utility functions
// 1 pip = 0.0001 for most FX pairs, 0.01 for JPY pairs, 0.10 gold, 0.001 silver

#include <string_view>

namespace swarm {

// Constexpr tolerance helper for floating-point comparisons
constexpr bool near(double a, double b, double eps = 1e-9) {
  return (a > b ? a - b : b - a) <= eps;
}

constexpr bool is_gold(std::string_view symbol) { return symbol.starts_with("XAU"); }
constexpr bool is_silver(std::string_view symbol) { return symbol.starts_with("XAG"); }

// Price increment of one pip for the instrument
constexpr double pip_size(std::string_view symbol) {
  if (is_gold(symbol))
    return 0.10;
  if (is_silver(symbol))
    return 0.001;
  if (symbol.find("JPY") != std::string_view::npos)
    return 0.01;
  return 0.0001;
}

// Units per standard lot
constexpr double contract_size(std::string_view symbol) {
  if (is_gold(symbol))
    return 100.0;
  if (is_silver(symbol))
    return 5000.0;
  return 100000.0;
}

// Convert a price distance to pips
constexpr double price_to_pips(double distance, std::string_view symbol) {
  return distance / pip_size(symbol);
}

// Convert pips to a price distance
constexpr double pips_to_price(double pips, std::string_view symbol) {
  return pips * pip_size(symbol);
}

constexpr double spread_pips(double bid, double ask, std::string_view symbol) {
  return price_to_pips(ask - bid, symbol);
}

// "EURUSD" -> "EUR", "USD"; empty for symbols that are not six letters
constexpr std::string_view base_currency(std::string_view symbol) {
  return symbol.size() == 6 ? symbol.substr(0, 3) : std::string_view{};
}

constexpr std::string_view quote_currency(std::string_view symbol) {
  return symbol.size() == 6 ? symbol.substr(3, 3) : std::string_view{};
}

// Compile-time tests
static_assert(near(pip_size("EURUSD"), 0.0001), "Majors use 4th decimal");
static_assert(near(pip_size("USDJPY"), 0.01), "JPY pairs use 2nd decimal");
static_assert(near(pip_size("GBPJPY"), 0.01), "JPY crosses use 2nd decimal");
static_assert(near(pip_size("XAUUSD"), 0.10), "Gold pip is 10 cents");
static_assert(near(pip_size("XAGUSD"), 0.001), "Silver pip is a tenth of a cent");

static_assert(near(contract_size("EURUSD"), 100000.0), "FX lot = 100k units");
static_assert(near(contract_size("XAUUSD"), 100.0), "Gold lot = 100 oz");
static_assert(near(contract_size("XAGUSD"), 5000.0), "Silver lot = 5000 oz");

static_assert(near(price_to_pips(0.0015, "EURUSD"), 15.0), "15 pips on EURUSD");
static_assert(near(price_to_pips(0.15, "USDJPY"), 15.0), "15 pips on USDJPY");
static_assert(near(pips_to_price(20.0, "XAUUSD"), 2.0), "20 pips on gold = $2");
static_assert(near(spread_pips(1.1000, 1.1002, "EURUSD"), 2.0), "2 pip spread");

static_assert(base_currency("EURUSD") == "EUR");
static_assert(quote_currency("EURUSD") == "USD");
static_assert(quote_currency("US30").empty(), "Indices have no currency split");

} // namespace swarm
