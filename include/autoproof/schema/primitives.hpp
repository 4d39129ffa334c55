#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace autoproof::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using principal_t = std::string;  // Pre-authenticated caller identity
using part_id_t = uint64_t;
using history_index_t = uint64_t;
using timestamp_milliseconds_t = uint64_t;

/// Reserved null/burn identity.  Never assignable as an owner or admin.
inline constexpr std::string_view kBurnPrincipal{
    "SP000000000000000000002Q6VF78"};

/// True for the burn identity and for the empty identity.
inline bool is_burn_principal(const std::string_view principal) {
  return principal.empty() || principal == kBurnPrincipal;
}

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
std::string to_base64(const bytes_t& bytes);
std::optional<bytes_t> try_from_base64(const std::string_view encoded);
bytes_t from_base64(const std::string_view encoded);

}  // namespace autoproof::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
