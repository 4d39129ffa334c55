#pragma once
#include <autoproof/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace autoproof::blake3 {

autoproof::schema::hash32_t hash(const std::string_view& str);
autoproof::schema::hash32_t hash(const autoproof::schema::bytes_view_t& bytes);

}  // namespace autoproof::blake3
