/**
 * @file crypto.hpp
 * @brief Cryptographic primitives consumed by workers.
 *
 * The pool never implements a digest itself. Workers call through the
 * CryptoProvider interface; OpenSslProvider forwards to libcrypto. JWT
 * signing goes through jwt-cpp (jwt.hpp) and only takes the clock from here.
 * Providers are immutable after construction and shared by all workers.
 */

#ifndef AUTHPOOL_CRYPTO_HPP_
#define AUTHPOOL_CRYPTO_HPP_

#include "authpool/vocabulary.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace authpool {

/** @brief Failure reported by a primitive. Wrapped as PrimitiveFailure. */
struct PrimitiveError {
  std::string message;
};

template <typename V>
using PrimitiveResult = expected<V, PrimitiveError>;

enum class DigestEncoding : uint8_t {
  kHex = 0,
  kBase64,
};

inline optional<DigestEncoding> ParseDigestEncoding(const std::string& name) {
  if (name == "hex") return optional<DigestEncoding>(DigestEncoding::kHex);
  if (name == "base64") return optional<DigestEncoding>(DigestEncoding::kBase64);
  return optional<DigestEncoding>();
}

// ============================================================================
// CryptoProvider
// ============================================================================

class CryptoProvider {
 public:
  virtual ~CryptoProvider() = default;

  /**
   * @brief Hash @p data with the named algorithm ("sha256", "sha512", ...).
   * @return Encoded digest, or "Digest method not supported".
   */
  virtual PrimitiveResult<std::string> Digest(const std::string& algorithm,
                                              const std::string& data,
                                              DigestEncoding encoding) const = 0;

  virtual bool ConstantTimeEqual(const std::string& a,
                                 const std::string& b) const = 0;

  /** @brief Wall clock, seconds since the epoch. */
  virtual int64_t NowSeconds() const = 0;
};

// ============================================================================
// OpenSslProvider
// ============================================================================

class OpenSslProvider final : public CryptoProvider {
 public:
  PrimitiveResult<std::string> Digest(const std::string& algorithm,
                                      const std::string& data,
                                      DigestEncoding encoding) const override {
    const EVP_MD* md = EVP_get_digestbyname(algorithm.c_str());
    if (md == nullptr) {
      return PrimitiveResult<std::string>::error(
          PrimitiveError{"Digest method not supported"});
    }

    std::unique_ptr<EVP_MD_CTX, void (*)(EVP_MD_CTX*)> ctx(EVP_MD_CTX_new(),
                                                           &EVP_MD_CTX_free);
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0U;
    if (ctx == nullptr ||
        EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1) {
      return PrimitiveResult<std::string>::error(
          PrimitiveError{"Digest computation failed"});
    }

    std::string raw(reinterpret_cast<const char*>(out), out_len);
    return PrimitiveResult<std::string>::success(
        encoding == DigestEncoding::kHex ? ToHex(raw) : ToBase64(raw));
  }

  bool ConstantTimeEqual(const std::string& a,
                         const std::string& b) const override {
    if (a.size() != b.size()) return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
  }

  int64_t NowSeconds() const override {
    return static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  }

 private:
  static std::string ToHex(const std::string& raw) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(raw.size() * 2U);
    for (unsigned char c : raw) {
      hex.push_back(kDigits[c >> 4U]);
      hex.push_back(kDigits[c & 0x0FU]);
    }
    return hex;
  }

  static std::string ToBase64(const std::string& raw) {
    if (raw.empty()) return std::string();
    std::string out(4U * ((raw.size() + 2U) / 3U) + 1U, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(raw.data()),
                            static_cast<int>(raw.size()));
    out.resize(static_cast<size_t>(n));
    return out;
  }
};

/** @brief Shared default provider. */
inline std::shared_ptr<const CryptoProvider> DefaultCryptoProvider() {
  static const std::shared_ptr<const CryptoProvider> provider =
      std::make_shared<OpenSslProvider>();
  return provider;
}

}  // namespace authpool

#endif  // AUTHPOOL_CRYPTO_HPP_
