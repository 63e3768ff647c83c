#include "storage/in_memory/in_memory_content_store.hpp"

#include <fstream>
#include <iterator>

#include "crypto/sha/sha256.hpp"
#include "storage/database_error.hpp"

namespace calcflow::storage {

  outcome::result<ObjectKey> InMemoryContentStore::put(
      std::string_view bytes, const std::string &extension) {
    auto key = makeObjectKey(crypto::sha256Hex(bytes), extension);
    if (!key) {
      return outcome::failure(key.error());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    storage_.emplace(key.value(), std::string(bytes));
    return key;
  }

  outcome::result<ObjectKey> InMemoryContentStore::putFile(
      const std::string &path, const std::string &extension) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
      return DatabaseError::NOT_FOUND;
    }
    std::string bytes((std::istreambuf_iterator<char>(input)),
                      std::istreambuf_iterator<char>());
    return put(bytes, extension);
  }

  outcome::result<std::string> InMemoryContentStore::get(
      const ObjectKey &key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = storage_.find(key);
    if (it == storage_.end()) {
      return DatabaseError::NOT_FOUND;
    }
    return it->second;
  }

  outcome::result<uint64_t> InMemoryContentStore::size(
      const ObjectKey &key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = storage_.find(key);
    if (it == storage_.end()) {
      return DatabaseError::NOT_FOUND;
    }
    return static_cast<uint64_t>(it->second.size());
  }

  bool InMemoryContentStore::exists(const ObjectKey &key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return storage_.find(key) != storage_.end();
  }

  size_t InMemoryContentStore::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return storage_.size();
  }

  std::vector<ObjectKey> InMemoryContentStore::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ObjectKey> result;
    result.reserve(storage_.size());
    for (const auto &[key, bytes] : storage_) {
      result.push_back(key);
    }
    return result;
  }
}  // namespace calcflow::storage
