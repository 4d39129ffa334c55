#pragma once

#include <autoproof/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace autoproof::testing {

inline constexpr auto kAdmin =
    std::string_view{"ST1PQHQKV0RJXZFY1DGX8MNSNYVE3VGZJSRTPGZGM"};
inline constexpr auto kWalletB =
    std::string_view{"ST1SJ3DTE5DN7X54YDH5D64R3BCB6A2AG2ZQ8YPD5"};
inline constexpr auto kWalletC =
    std::string_view{"ST2CY5V39NHDPWSXMW9QDT3HC3GD6Q6XX4CFRK9AG"};

inline autoproof::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = autoproof::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace autoproof::testing
