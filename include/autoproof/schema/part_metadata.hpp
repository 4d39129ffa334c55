#pragma once

#include <autoproof/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

// Schema type: part metadata.
// Registry workflow: descriptive record of a registered part.  Kept after burn
// so the provenance record outlives the token.
namespace autoproof::schema {

inline constexpr std::size_t kMaxSerialNumberLength = 64;
inline constexpr std::size_t kMaxMaterialSpecLength = 128;
inline constexpr std::size_t kMaxOriginFactoryLength = 64;

template <uint16_t Version>
struct part_metadata;

template <>
struct part_metadata<1> final {
  uint16_t version{1};
  std::string serial_number;
  principal_t manufacturer;
  timestamp_milliseconds_t production_date{};
  std::string material_spec;
  std::string status;
  principal_t last_owner;
  std::string origin_factory;

  bool operator==(const part_metadata<1>&) const = default;
};

using part_metadata_t = part_metadata<1>;

}  // namespace autoproof::schema
