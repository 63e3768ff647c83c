#ifndef CALCFLOW_STORAGE_IN_MEMORY_CONTENT_STORE_HPP
#define CALCFLOW_STORAGE_IN_MEMORY_CONTENT_STORE_HPP

#include <map>
#include <mutex>

#include "storage/content/content_store.hpp"

namespace calcflow::storage {

  /**
   * Simple content store implementation, which keeps objects in memory.
   * Used for testing
   */
  class InMemoryContentStore : public ContentStore {
   public:
    ~InMemoryContentStore() override = default;

    outcome::result<ObjectKey> put(std::string_view bytes,
                                   const std::string &extension) override;

    outcome::result<ObjectKey> putFile(const std::string &path,
                                       const std::string &extension) override;

    outcome::result<std::string> get(const ObjectKey &key) const override;

    outcome::result<uint64_t> size(const ObjectKey &key) const override;

    bool exists(const ObjectKey &key) const override;

    size_t count() const override;

    std::vector<ObjectKey> keys() const override;

   private:
    mutable std::mutex mutex_;
    std::map<ObjectKey, std::string> storage_;
  };

}  // namespace calcflow::storage

#endif  // CALCFLOW_STORAGE_IN_MEMORY_CONTENT_STORE_HPP
