#pragma once

#include <autoproof/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: registry error code.
// Registry workflow: stable numeric failure taxonomy returned verbatim to
// callers of every mutating and lookup operation.
namespace autoproof::schema {

enum class registry_error_code : uint32_t {
  ok = 0,
  not_authorized = 100,
  already_registered = 101,
  not_found = 102,
  paused = 103,
  zero_address = 104,
  invalid_metadata = 105,
  not_owner = 106,
  already_recycled = 107,
};

inline constexpr auto kRegistryErrorCodeMappings = std::array{
    enum_name_t<registry_error_code>{"ok", registry_error_code::ok},
    enum_name_t<registry_error_code>{
        "not authorized", registry_error_code::not_authorized},
    enum_name_t<registry_error_code>{
        "part already registered", registry_error_code::already_registered},
    enum_name_t<registry_error_code>{
        "part not found", registry_error_code::not_found},
    enum_name_t<registry_error_code>{
        "registry paused", registry_error_code::paused},
    enum_name_t<registry_error_code>{
        "burn address not allowed", registry_error_code::zero_address},
    enum_name_t<registry_error_code>{
        "invalid metadata", registry_error_code::invalid_metadata},
    enum_name_t<registry_error_code>{
        "caller is not the owner", registry_error_code::not_owner},
    enum_name_t<registry_error_code>{
        "part already recycled", registry_error_code::already_recycled}};

inline constexpr std::string_view to_string(const registry_error_code value) {
  return find_enum_name(kRegistryErrorCodeMappings, value);
}

}  // namespace autoproof::schema
