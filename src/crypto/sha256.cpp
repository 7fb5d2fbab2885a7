#include <ledgersync/common/critical.hpp>
#include <ledgersync/crypto/sha256.hpp>

#include <boost/endian/buffers.hpp>
#include <openssl/evp.h>

namespace ledgersync::crypto {

void sha256_hasher::context_deleter::operator()(
    evp_md_ctx_st* context) const {
  EVP_MD_CTX_free(context);
}

sha256_hasher::sha256_hasher() : context_{EVP_MD_CTX_new()} {
  if (!context_) {
    ledgersync::common::critical("failed to allocate SHA-256 context");
  }
  if (EVP_DigestInit_ex(context_.get(), EVP_sha256(), nullptr) != 1) {
    ledgersync::common::critical("failed to initialize SHA-256 context");
  }
}

sha256_hasher& sha256_hasher::update(
    const ledgersync::schema::bytes_view_t& bytes) {
  if (bytes.empty()) {
    return *this;
  }
  if (EVP_DigestUpdate(context_.get(), bytes.data(), bytes.size()) != 1) {
    ledgersync::common::critical("SHA-256 update failed");
  }
  return *this;
}

sha256_hasher& sha256_hasher::update(const uint64_t value) {
  auto buffer = boost::endian::little_uint64_buf_t{value};
  return update(ledgersync::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(buffer.data()), sizeof(value)});
}

ledgersync::schema::hash32_t sha256_hasher::finalize() {
  auto output = ledgersync::schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestFinal_ex(context_.get(), output.data(), &length) != 1 ||
      length != output.size()) {
    ledgersync::common::critical("SHA-256 finalize failed");
  }
  return output;
}

ledgersync::schema::hash32_t sha256(
    const ledgersync::schema::bytes_view_t& bytes) {
  return sha256_hasher{}.update(bytes).finalize();
}

}  // namespace ledgersync::crypto
