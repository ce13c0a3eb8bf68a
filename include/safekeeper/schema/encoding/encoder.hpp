#pragma once
#include <safekeeper/schema/primitives.hpp>
#include <optional>
#include <span>

namespace safekeeper::schema::encoding {

// The codec is a build time choice. Each library specializes this template
// behind a tag type; callers name the tag once through an alias.
template <typename Library>
struct encoder {
  template <typename T>
  safekeeper::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, safekeeper::schema::bytes_t& out);

  template <typename T>
  T decode(const safekeeper::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const safekeeper::schema::bytes_view_t& bytes);
};

}  // namespace safekeeper::schema::encoding
