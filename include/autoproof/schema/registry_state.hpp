#pragma once

#include <autoproof/schema/primitives.hpp>
#include <cstdint>

// Schema type: registry state.
// Registry workflow: the single global row holding the admin identity, the
// transfer pause flag and the identifier counter.
namespace autoproof::schema {

template <uint16_t Version>
struct registry_state;

template <>
struct registry_state<1> final {
  uint16_t version{1};
  principal_t admin;
  bool paused{};
  part_id_t next_part_id{};  // Equals the number of registered parts.
};

using registry_state_t = registry_state<1>;

}  // namespace autoproof::schema
