#pragma once
#include <ledgersync/schema/primitives.hpp>
#include <optional>
#include <span>

namespace ledgersync::schema::encoding {

// The codec is selected at build time by tag; rows persisted by the storage
// layer all go through one encoder instance.
template <typename Library>
struct encoder {
  template <typename T>
  ledgersync::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, ledgersync::schema::bytes_t& out);

  template <typename T>
  T decode(const ledgersync::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const ledgersync::schema::bytes_view_t& bytes);
};

}  // namespace ledgersync::schema::encoding
