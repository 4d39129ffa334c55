#include <autoproof/common/critical.hpp>
#include <autoproof/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string_view>

namespace autoproof::schema {

namespace {

constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};
constexpr auto kBase64Alphabet = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};
constexpr auto kInvalidDigit = uint8_t{0xFF};

uint8_t digit_value(const std::string_view alphabet, const char ch) {
  auto pos = alphabet.find(ch);
  return pos == std::string_view::npos ? kInvalidDigit
                                       : static_cast<uint8_t>(pos);
}

uint8_t hex_digit_value(const char ch) {
  return digit_value(
      kHexDigits,
      static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
}

std::optional<bytes_t> decode_hex(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }
  auto out = bytes_t{};
  out.reserve(hex.size() / 2);
  for (auto pair = hex; !pair.empty(); pair.remove_prefix(2)) {
    auto high = hex_digit_value(pair[0]);
    auto low = hex_digit_value(pair[1]);
    if (high == kInvalidDigit || low == kInvalidDigit) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((high << 4u) | low));
  }
  return out;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != std::tuple_size_v<hash32_t>) {
    autoproof::common::critical("make_hash32 expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_hash32(hex);
  if (!hash) {
    autoproof::common::critical("make_hash32 expected 64 hex characters");
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = decode_hex(hex);
  if (!decoded || decoded->size() != std::tuple_size_v<hash32_t>) {
    return std::nullopt;
  }
  return make_hash32(*decoded);
}

hash32_t make_zero_hash() {
  return {};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    out.push_back(kHexDigits[byte >> 4u]);
    out.push_back(kHexDigits[byte & 0x0Fu]);
  }
  return out;
}

std::optional<bytes_t> try_from_hex(const std::string_view hex) {
  return decode_hex(hex);
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = decode_hex(hex);
  if (!decoded) {
    autoproof::common::critical("invalid hex input");
  }
  return *decoded;
}

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);
  for (auto offset = std::size_t{0}; offset < bytes.size(); offset += 3) {
    auto available = std::min<std::size_t>(3, bytes.size() - offset);
    auto group = uint32_t{0};
    for (auto i = std::size_t{0}; i < 3; ++i) {
      group <<= 8u;
      if (i < available) {
        group |= bytes[offset + i];
      }
    }
    // `available` input bytes produce `available + 1` output digits.
    for (auto i = std::size_t{0}; i < 4; ++i) {
      if (i <= available) {
        out.push_back(kBase64Alphabet[(group >> (18u - (6u * i))) & 0x3Fu]);
      } else {
        out.push_back('=');
      }
    }
  }
  return out;
}

std::string to_base64(const bytes_t& bytes) {
  return to_base64(bytes_view_t{bytes.data(), bytes.size()});
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  auto compact = std::string{};
  compact.reserve(encoded.size());
  std::copy_if(std::begin(encoded), std::end(encoded),
               std::back_inserter(compact), [](const char ch) {
                 return std::isspace(static_cast<unsigned char>(ch)) == 0;
               });
  if (compact.size() % 4 != 0) {
    return std::nullopt;
  }

  auto out = bytes_t{};
  out.reserve((compact.size() / 4) * 3);
  for (auto offset = std::size_t{0}; offset < compact.size(); offset += 4) {
    auto chunk = std::string_view{compact}.substr(offset, 4);
    auto padding = static_cast<std::size_t>(
        std::count(std::begin(chunk), std::end(chunk), '='));
    // Padding only closes the final chunk and never exceeds two digits.
    if (padding > 0) {
      auto last_chunk = offset + 4 == compact.size();
      if (padding > 2 || !last_chunk || chunk.find('=') != 4 - padding) {
        return std::nullopt;
      }
    }
    auto group = uint32_t{0};
    for (auto i = std::size_t{0}; i < 4; ++i) {
      auto value = uint8_t{0};
      if (i < 4 - padding) {
        value = digit_value(kBase64Alphabet, chunk[i]);
        if (value == kInvalidDigit) {
          return std::nullopt;
        }
      }
      group = (group << 6u) | value;
    }
    for (auto i = std::size_t{0}; i < 3 - padding; ++i) {
      out.push_back(static_cast<uint8_t>((group >> (16u - (8u * i))) & 0xFFu));
    }
  }
  return out;
}

bytes_t from_base64(const std::string_view encoded) {
  auto decoded = try_from_base64(encoded);
  if (!decoded) {
    autoproof::common::critical("invalid base64 input");
  }
  return *decoded;
}

}  // namespace autoproof::schema
