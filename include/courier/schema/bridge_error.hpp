#pragma once

#include <courier/schema/bridge_error_code.hpp>
#include <courier/schema/primitives.hpp>

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace courier::schema {

/// Failure surfaced across a component boundary.
///
/// `current` and `required` are only populated for balance checks
/// (`insufficient_fee`, `insufficient_balance`, `insufficient_allowance`).
struct bridge_error_t final {
  bridge_error_code code{};
  std::string message;
  std::optional<amount_t> current;
  std::optional<amount_t> required;
};

struct ok_t final {};

template <typename T>
using outcome_t = std::variant<T, bridge_error_t>;

using status_t = outcome_t<ok_t>;

inline bridge_error_t make_error(const bridge_error_code code,
                                 std::string message) {
  return bridge_error_t{.code = code, .message = std::move(message)};
}

inline bridge_error_t make_shortfall_error(const bridge_error_code code,
                                           std::string message,
                                           const amount_t& current,
                                           const amount_t& required) {
  return bridge_error_t{.code = code,
                        .message = std::move(message),
                        .current = current,
                        .required = required};
}

template <typename T>
bool succeeded(const outcome_t<T>& outcome) {
  return std::holds_alternative<T>(outcome);
}

template <typename T>
const bridge_error_t& error_of(const outcome_t<T>& outcome) {
  return std::get<bridge_error_t>(outcome);
}

template <typename T>
const T& value_of(const outcome_t<T>& outcome) {
  return std::get<T>(outcome);
}

template <typename T>
T& value_of(outcome_t<T>& outcome) {
  return std::get<T>(outcome);
}

}  // namespace courier::schema
