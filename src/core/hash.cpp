#include <landledger/core/hash.hpp>
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace landledger::core {

  namespace {
    using EVP_MD_CTX_Ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    void throw_openssl_error(const std::string& context) {
      unsigned long err = ERR_get_error();
      char err_buf[256]{0};
      ERR_error_string_n(err, err_buf, sizeof(err_buf));
      throw std::runtime_error(context + ": " + err_buf);
    }
  }

  auto toHex(std::span<const uint8_t> data) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto b : data) oss << std::setw(2) << static_cast<int>(b);
    return oss.str();
  }

  auto sha256(std::span<const uint8_t> data) -> Hash256 {
    Hash256 out{};
    EVP_MD_CTX_Ptr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) throw_openssl_error("EVP_MD_CTX_new");

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
      throw_openssl_error("EVP_DigestInit_ex");
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
      throw_openssl_error("EVP_DigestUpdate");

    unsigned int len = static_cast<unsigned int>(out.size());
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1)
      throw_openssl_error("EVP_DigestFinal_ex");
    return out;
  }

  std::string random_hex(size_t num_bytes) {
    std::vector<uint8_t> bytes(num_bytes);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1)
      throw_openssl_error("RAND_bytes");
    return to_hex(std::span<const uint8_t>(bytes.data(), bytes.size()));
  }
}
