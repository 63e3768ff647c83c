#ifndef CALCFLOW_STORAGE_FILE_CONTENT_STORE_HPP
#define CALCFLOW_STORAGE_FILE_CONTENT_STORE_HPP

#include <memory>
#include <string_view>

#include <boost/filesystem/path.hpp>

#include "base/logger.hpp"
#include "storage/content/content_store.hpp"

namespace calcflow::storage {

  /**
   * @brief Content store keeping one file per object, sharded by the first
   * two hex digits of the digest: <root>/ab/abcdef...[.ext]
   * Objects are written to <root>/tmp first and renamed into place once
   * synced, so a reader never observes a partially written object.
   */
  class FileContentStore : public ContentStore {
   public:
    /**
     * @brief Factory method to open (and create if missing) a store
     * @param root directory of the store
     */
    static outcome::result<std::shared_ptr<FileContentStore>> create(
        const boost::filesystem::path &root);

    explicit FileContentStore(boost::filesystem::path root);
    ~FileContentStore() override = default;

    outcome::result<ObjectKey> put(std::string_view bytes,
                                   const std::string &extension) override;

    outcome::result<ObjectKey> putFile(const std::string &path,
                                       const std::string &extension) override;

    outcome::result<std::string> get(const ObjectKey &key) const override;

    outcome::result<uint64_t> size(const ObjectKey &key) const override;

    bool exists(const ObjectKey &key) const override;

    size_t count() const override;

    std::vector<ObjectKey> keys() const override;

    /**
     * @return path where the object with @param key is (or would be) stored
     */
    outcome::result<boost::filesystem::path> objectPath(
        const ObjectKey &key) const;

   private:
    outcome::result<boost::filesystem::path> tempPath() const;

    /// move a synced temporary file to the location of @param key
    outcome::result<void> commit(const boost::filesystem::path &temp,
                                 const ObjectKey &key);

    boost::filesystem::path root_;
    base::Logger logger_;
  };

}  // namespace calcflow::storage

#endif  // CALCFLOW_STORAGE_FILE_CONTENT_STORE_HPP
