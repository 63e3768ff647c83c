#ifndef CALCFLOW_HEXUTIL_HPP
#define CALCFLOW_HEXUTIL_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace calcflow::base {

  /**
   * @brief Converts bytes to lowercase hex representation
   * @param bytes pointer to the first byte
   * @param len number of bytes
   * @return hexstring
   */
  std::string hex_lower(const uint8_t *bytes, size_t len) noexcept;

  template <typename Container>
  std::string hex_lower(const Container &bytes) noexcept {
    return hex_lower(bytes.data(), bytes.size());
  }

  /**
   * @return true if every char of @param str is a lowercase hex digit
   */
  bool is_lower_hex(std::string_view str) noexcept;
}  // namespace calcflow::base

#endif  // CALCFLOW_HEXUTIL_HPP
