
#ifndef CALCFLOW_SHA256_HPP
#define CALCFLOW_SHA256_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <openssl/evp.h>

namespace calcflow::crypto {
  using Hash256 = std::array<uint8_t, 32>;

  /**
   * Take a SHA-256 hash from bytes
   * @param input to be hashed
   * @return hashed bytes
   */
  Hash256 sha256(std::string_view input);

  /**
   * Take a SHA-256 hash from bytes
   * @param input to be hashed
   * @return lowercase hex encoded hash
   */
  std::string sha256Hex(std::string_view input);

  /**
   * Incremental SHA-256, for content which is streamed in chunks
   */
  class Sha256Stream {
   public:
    Sha256Stream();

    void update(std::string_view chunk);

    /**
     * @return lowercase hex encoded hash of everything passed to update()
     */
    std::string finalHex();

   private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
  };
}  // namespace calcflow::crypto

#endif  // CALCFLOW_SHA256_HPP
