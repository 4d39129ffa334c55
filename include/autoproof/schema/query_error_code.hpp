#pragma once

#include <cstdint>

// Schema type: query error code.
// Registry workflow: query failure taxonomy: stable numeric codes for read-path
// diagnostics and client behavior.
namespace autoproof::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  // 2 is retired; missing rows report the registry's not_found.
  unsupported_path = 3,
};

}  // namespace autoproof::schema
