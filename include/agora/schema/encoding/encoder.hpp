#pragma once
#include <agora/schema/primitives.hpp>
#include <optional>
#include <span>

namespace agora::schema::encoding {

// Selected at build time by tag; swapping the wire format means providing
// another specialization, callers never name the codec library directly.
template <typename Library>
struct encoder {
  template <typename T>
  agora::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, agora::schema::bytes_t& out);

  template <typename T>
  T decode(const agora::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const agora::schema::bytes_view_t& bytes);
};

}  // namespace agora::schema::encoding
