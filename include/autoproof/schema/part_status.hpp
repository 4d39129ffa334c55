#pragma once

#include <cstddef>
#include <string_view>

// Schema type: part status.
// Registry workflow: status is an open vocabulary.  Active and recycled are
// assigned by the registry, installed is the usual fitted state; any other
// caller-defined value is legal.
namespace autoproof::schema {

inline constexpr std::string_view kPartStatusActive{"active"};
inline constexpr std::string_view kPartStatusInstalled{"installed"};
inline constexpr std::string_view kPartStatusRecycled{"recycled"};

inline constexpr std::size_t kMaxPartStatusLength = 32;

/// Recycled is terminal: no transfer, status update or burn after it.
inline bool is_recycled(const std::string_view status) {
  return status == kPartStatusRecycled;
}

}  // namespace autoproof::schema
