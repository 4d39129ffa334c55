#pragma once

#include <autoproof/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: transfer part.
// Registry workflow: current owner moves a part to a new holder.
namespace autoproof::schema {

template <uint16_t Version>
struct transfer_part;

template <>
struct transfer_part<1> final {
  uint16_t version{1};
  part_id_t part_id{};
  principal_t new_owner;
};

using transfer_part_t = transfer_part<1>;

}  // namespace autoproof::schema
