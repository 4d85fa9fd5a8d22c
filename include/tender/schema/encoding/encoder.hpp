#pragma once
#include <tender/schema/primitives.hpp>
#include <optional>
#include <span>

namespace tender::schema::encoding {

// The encoding library is a build time choice: callers name the tag once
// (see `scale_encoder_tag`) and everything downstream is templated on the
// resulting encoder type. Hot swapping is not a design goal.
template <typename Library>
struct encoder {
  template <typename T>
  tender::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, tender::schema::bytes_t& out);

  template <typename T>
  T decode(const tender::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tender::schema::bytes_view_t& bytes);
};

}  // namespace tender::schema::encoding
