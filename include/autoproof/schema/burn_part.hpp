#pragma once

#include <autoproof/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: burn part.
// Registry workflow: admin who holds a part retires its token; the
// provenance record remains.
namespace autoproof::schema {

template <uint16_t Version>
struct burn_part;

template <>
struct burn_part<1> final {
  uint16_t version{1};
  part_id_t part_id{};
};

using burn_part_t = burn_part<1>;

}  // namespace autoproof::schema
