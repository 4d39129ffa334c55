#pragma once

#include <autoproof/schema/primitives.hpp>
#include <autoproof/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction result.
// Registry workflow: per-transaction outcome: code, codespace, human-readable
// log, SCALE-encoded return value and emitted events.
namespace autoproof::schema {

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
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

}  // namespace autoproof::schema
