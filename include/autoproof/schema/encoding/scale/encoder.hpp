#pragma once
#include <autoproof/common/critical.hpp>
#include <autoproof/schema/encoding/encoder.hpp>
#include <autoproof/schema/encoding/scale/burn_part.hpp>
#include <autoproof/schema/encoding/scale/history_event.hpp>
#include <autoproof/schema/encoding/scale/part_metadata.hpp>
#include <autoproof/schema/encoding/scale/register_part.hpp>
#include <autoproof/schema/encoding/scale/registry_state.hpp>
#include <autoproof/schema/encoding/scale/set_paused.hpp>
#include <autoproof/schema/encoding/scale/transaction.hpp>
#include <autoproof/schema/encoding/scale/transfer_admin.hpp>
#include <autoproof/schema/encoding/scale/transfer_part.hpp>
#include <autoproof/schema/encoding/scale/update_part_status.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace autoproof::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  autoproof::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, autoproof::schema::bytes_t& out);

  template <typename T>
  T decode(const autoproof::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const autoproof::schema::bytes_view_t& bytes);
};

template <typename T>
autoproof::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    autoproof::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        autoproof::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const autoproof::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    autoproof::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const autoproof::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace autoproof::schema::encoding
