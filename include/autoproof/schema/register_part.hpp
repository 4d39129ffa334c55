#pragma once

#include <autoproof/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: register part.
// Registry workflow: admin mints a new part token and its metadata
// record.
namespace autoproof::schema {

template <uint16_t Version>
struct register_part;

template <>
struct register_part<1> final {
  uint16_t version{1};
  std::string serial_number;
  std::string material_spec;
  std::string origin_factory;
};

using register_part_t = register_part<1>;

}  // namespace autoproof::schema
