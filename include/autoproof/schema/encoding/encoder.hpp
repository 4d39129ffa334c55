#pragma once
#include <autoproof/schema/primitives.hpp>
#include <optional>
#include <span>

namespace autoproof::schema::encoding {

// The codec is a build time choice selected by tag.  Call sites only see
// encoder<Tag>, so swapping SCALE for another wire format touches the
// specialization and nothing else.
template <typename Library>
struct encoder {
  template <typename T>
  autoproof::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, autoproof::schema::bytes_t& out);

  template <typename T>
  T decode(const autoproof::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const autoproof::schema::bytes_view_t& bytes);
};

}  // namespace autoproof::schema::encoding
