#pragma once

#include <autoproof/schema/registry_error_code.hpp>
#include <optional>
#include <utility>

// Schema type: operation result.
// Registry workflow: success payload or registry error code; every registry
// operation is total over this shape.
namespace autoproof::schema {

template <typename T>
struct operation_result final {
  registry_error_code code{registry_error_code::ok};
  std::optional<T> value;

  bool ok() const { return code == registry_error_code::ok; }
};

template <typename T>
operation_result<T> make_success(T value) {
  return operation_result<T>{.code = registry_error_code::ok,
                             .value = std::move(value)};
}

template <typename T>
operation_result<T> make_failure(const registry_error_code code) {
  return operation_result<T>{.code = code, .value = std::nullopt};
}

}  // namespace autoproof::schema
