#pragma once
#include <tentacle/schema/primitives.hpp>
#include <optional>
#include <span>

namespace tentacle::schema::encoding {

// Encoding backend is a build-time choice; callers name the tag they use.
template <typename Library>
struct encoder {
  template <typename T>
  tentacle::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, tentacle::schema::bytes_t& out);

  template <typename T>
  T decode(const tentacle::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tentacle::schema::bytes_view_t& bytes);
};

}  // namespace tentacle::schema::encoding
