#include "storage/content/content_store.hpp"

#include <algorithm>
#include <cctype>

#include "base/hexutil.hpp"
#include "storage/database_error.hpp"

namespace calcflow::storage {

  namespace {
    constexpr size_t kDigestLength = 64;
    constexpr size_t kMaxExtensionLength = 16;

    bool isValidExtension(const std::string &extension) {
      if (extension.size() > kMaxExtensionLength) {
        return false;
      }
      return std::all_of(extension.begin(), extension.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'
               || c == '-';
      });
    }
  }  // namespace

  outcome::result<ObjectKey> makeObjectKey(const std::string &digest,
                                           const std::string &extension) {
    if (digest.size() != kDigestLength || !base::is_lower_hex(digest)) {
      return DatabaseError::INVALID_ARGUMENT;
    }
    if (!isValidExtension(extension)) {
      return DatabaseError::INVALID_ARGUMENT;
    }
    return extension.empty() ? digest : digest + "." + extension;
  }

  outcome::result<ObjectKeyParts> parseObjectKey(const ObjectKey &key) {
    ObjectKeyParts parts;
    parts.digest = key.substr(0, kDigestLength);
    if (key.size() > kDigestLength) {
      if (key[kDigestLength] != '.' || key.size() == kDigestLength + 1) {
        return DatabaseError::INVALID_ARGUMENT;
      }
      parts.extension = key.substr(kDigestLength + 1);
    }
    auto rebuilt = makeObjectKey(parts.digest, parts.extension);
    if (!rebuilt) {
      return outcome::failure(rebuilt.error());
    }
    return parts;
  }
}  // namespace calcflow::storage
