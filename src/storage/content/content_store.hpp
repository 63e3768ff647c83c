#ifndef CALCFLOW_STORAGE_CONTENT_STORE_HPP
#define CALCFLOW_STORAGE_CONTENT_STORE_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/code.hpp"

namespace calcflow::storage {
  using primitives::ObjectKey;

  /**
   * @brief Append-only content-addressed blob storage.
   * Objects are keyed by the SHA-256 of their bytes and an extension tag,
   * so storing the same bytes twice keeps a single copy.
   */
  class ContentStore {
   public:
    virtual ~ContentStore() = default;

    /**
     * @brief Store @param bytes, unless an identical object is present
     * @param extension tag kept in the key, may be empty
     * @return key of the object
     */
    virtual outcome::result<ObjectKey> put(std::string_view bytes,
                                           const std::string &extension) = 0;

    /**
     * @brief Store the content of a local file, streaming it in chunks
     */
    virtual outcome::result<ObjectKey> putFile(
        const std::string &path, const std::string &extension) = 0;

    /**
     * @return the bytes of the object, DatabaseError::NOT_FOUND if absent
     */
    virtual outcome::result<std::string> get(const ObjectKey &key) const = 0;

    /**
     * @return size of the object in bytes, DatabaseError::NOT_FOUND if absent
     */
    virtual outcome::result<uint64_t> size(const ObjectKey &key) const = 0;

    [[nodiscard]] virtual bool exists(const ObjectKey &key) const = 0;

    [[nodiscard]] virtual size_t count() const = 0;

    [[nodiscard]] virtual std::vector<ObjectKey> keys() const = 0;
  };

  struct ObjectKeyParts {
    std::string digest;     ///< lowercase sha256 hex
    std::string extension;  ///< may be empty
  };

  /**
   * @brief Builds the key for a digest and extension tag
   * @return DatabaseError::INVALID_ARGUMENT for a malformed extension
   */
  outcome::result<ObjectKey> makeObjectKey(const std::string &digest,
                                           const std::string &extension);

  /**
   * @brief Splits and validates a key
   * @return DatabaseError::INVALID_ARGUMENT for a malformed key
   */
  outcome::result<ObjectKeyParts> parseObjectKey(const ObjectKey &key);
}  // namespace calcflow::storage

#endif  // CALCFLOW_STORAGE_CONTENT_STORE_HPP
