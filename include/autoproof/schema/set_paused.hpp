#pragma once

#include <autoproof/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: set paused.
// Registry workflow: admin-only toggle gating part transfers.
namespace autoproof::schema {

template <uint16_t Version>
struct set_paused;

template <>
struct set_paused<1> final {
  uint16_t version{1};
  bool pause{};
};

using set_paused_t = set_paused<1>;

}  // namespace autoproof::schema
