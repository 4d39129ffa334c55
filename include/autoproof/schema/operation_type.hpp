#pragma once

#include <autoproof/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: operation type.
// Registry workflow: names the mutating registry operations for transaction
// events and tooling.
namespace autoproof::schema {

enum class operation_type_t : uint8_t {
  set_paused = 0,
  transfer_admin = 1,
  register_part = 2,
  transfer_part = 3,
  update_part_status = 4,
  burn_part = 5
};

inline constexpr auto kOperationTypeMappings =
    std::array{enum_name_t<operation_type_t>{
                   "set_paused", operation_type_t::set_paused},
               enum_name_t<operation_type_t>{
                   "transfer_admin", operation_type_t::transfer_admin},
               enum_name_t<operation_type_t>{
                   "register_part", operation_type_t::register_part},
               enum_name_t<operation_type_t>{
                   "transfer_part", operation_type_t::transfer_part},
               enum_name_t<operation_type_t>{
                   "update_part_status", operation_type_t::update_part_status},
               enum_name_t<operation_type_t>{
                   "burn_part", operation_type_t::burn_part}};

template <>
struct enum_names<operation_type_t> {
  static constexpr auto& kNames = kOperationTypeMappings;
};

inline constexpr std::string_view to_string(const operation_type_t value) {
  return find_enum_name(kOperationTypeMappings, value);
}

}  // namespace autoproof::schema
