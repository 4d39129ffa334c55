#pragma once

#include <autoproof/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: update part status.
// Registry workflow: admin overwrites a part's status with any value.
namespace autoproof::schema {

template <uint16_t Version>
struct update_part_status;

template <>
struct update_part_status<1> final {
  uint16_t version{1};
  part_id_t part_id{};
  std::string new_status;
};

using update_part_status_t = update_part_status<1>;

}  // namespace autoproof::schema
