#pragma once

#include <courier/schema/primitives.hpp>
#include <courier/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction result.
// Bridge workflow: outcome of one public entry point. `code` 0 means the
// ledger transaction committed at `height`; any other code is a
// bridge_error_code and nothing was written.
namespace courier::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  uint64_t height{};
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

}  // namespace courier::schema
