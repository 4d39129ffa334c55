#pragma once

#include <autoproof/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: transfer admin.
// Registry workflow: hands the privileged role to a new identity.
namespace autoproof::schema {

template <uint16_t Version>
struct transfer_admin;

template <>
struct transfer_admin<1> final {
  uint16_t version{1};
  principal_t new_admin;
};

using transfer_admin_t = transfer_admin<1>;

}  // namespace autoproof::schema
