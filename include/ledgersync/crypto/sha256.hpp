#pragma once

#include <ledgersync/schema/primitives.hpp>

#include <cstdint>
#include <memory>

struct evp_md_ctx_st;

namespace ledgersync::crypto {

/// Incremental SHA-256 over OpenSSL EVP.
///
/// Integers are fed little-endian so digests agree across hosts.
class sha256_hasher final {
 public:
  sha256_hasher();

  sha256_hasher& update(const ledgersync::schema::bytes_view_t& bytes);
  sha256_hasher& update(uint64_t value);

  /// Produce the digest. The hasher must not be updated afterwards.
  ledgersync::schema::hash32_t finalize();

 private:
  struct context_deleter final {
    void operator()(evp_md_ctx_st* context) const;
  };

  std::unique_ptr<evp_md_ctx_st, context_deleter> context_;
};

ledgersync::schema::hash32_t sha256(
    const ledgersync::schema::bytes_view_t& bytes);

}  // namespace ledgersync::crypto
