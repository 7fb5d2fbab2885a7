#pragma once
#include <ledgersync/common/critical.hpp>
#include <ledgersync/schema/encoding/encoder.hpp>
#include <ledgersync/schema/encoding/scale/runtime_version.hpp>
#include <ledgersync/schema/encoding/scale/snapshot.hpp>
#include <ledgersync/schema/encoding/scale/snapshot_chunk.hpp>
#include <ledgersync/schema/encoding/scale/snapshot_sync.hpp>
#include <ledgersync/schema/encoding/scale/vote.hpp>
#include <ledgersync/schema/encoding/scale/wallet_state_sync_record.hpp>
#include <iterator>
#include <optional>
#include <utility>
#include <scale/scale.hpp>

namespace ledgersync::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  ledgersync::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, ledgersync::schema::bytes_t& out);

  template <typename T>
  T decode(const ledgersync::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const ledgersync::schema::bytes_view_t& bytes);
};

template <typename T>
ledgersync::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto out = ledgersync::schema::bytes_t{};
  encode(obj, out);
  return out;
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        ledgersync::schema::bytes_t& out) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    ledgersync::common::critical("SCALE encoding failed: {}",
                                 encoded.error().message());
  }
  out.insert(std::end(out), std::begin(encoded.value()),
             std::end(encoded.value()));
}

// Readers that tolerate undecodable rows use try_decode.
template <typename T>
T encoder<scale_encoder_tag>::decode(
    const ledgersync::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    ledgersync::common::critical("SCALE decoding of {} bytes failed",
                                 bytes.size());
  }
  return std::move(*decoded);
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const ledgersync::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return std::move(decoded.value());
}

}  // namespace ledgersync::schema::encoding
