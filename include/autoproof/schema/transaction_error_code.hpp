#pragma once

#include <cstdint>

// Schema type: transaction error code.
// Registry workflow: envelope failures detected before a payload reaches the
// registry.  Payload failures use registry_error_code.
namespace autoproof::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
};

}  // namespace autoproof::schema
