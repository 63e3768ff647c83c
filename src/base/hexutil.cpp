#include "base/hexutil.hpp"

#include <algorithm>

#include <boost/algorithm/hex.hpp>

namespace calcflow::base {

  std::string hex_lower(const uint8_t *bytes, size_t len) noexcept {
    std::string res(len * 2, '\x00');
    boost::algorithm::hex_lower(bytes, bytes + len, res.begin());
    return res;
  }

  bool is_lower_hex(std::string_view str) noexcept {
    return std::all_of(str.begin(), str.end(), [](char c) {
      return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
  }
}  // namespace calcflow::base
