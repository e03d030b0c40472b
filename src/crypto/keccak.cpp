#include <docket/crypto/keccak.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <memory>

namespace docket::crypto {

namespace {

using evp_md_ptr = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

evp_md_ptr fetch_keccak() {
  return evp_md_ptr{EVP_MD_fetch(nullptr, "KECCAK-256", nullptr), EVP_MD_free};
}

}  // namespace

bool keccak_available() {
  static const auto available = static_cast<bool>(fetch_keccak());
  return available;
}

std::optional<docket::schema::hash32_t> keccak256(
    const docket::schema::bytes_view_t& bytes) {
  if (!keccak_available()) {
    return std::nullopt;
  }
  auto md = fetch_keccak();
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!md || !ctx) {
    return std::nullopt;
  }

  auto out = docket::schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestInit_ex(ctx.get(), md.get(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), out.data(), &length) != 1 ||
      length != out.size()) {
    return std::nullopt;
  }
  return out;
}

std::optional<docket::schema::selector_t> selector(
    const std::string_view signature) {
  auto digest = keccak256(docket::schema::make_bytes_view(signature));
  if (!digest) {
    return std::nullopt;
  }
  auto out = docket::schema::selector_t{};
  std::copy_n(digest->begin(), out.size(), out.begin());
  return out;
}

}  // namespace docket::crypto
