#ifndef CALCFLOW_STORAGE_PROJECT_HPP
#define CALCFLOW_STORAGE_PROJECT_HPP

#include <memory>

#include <boost/filesystem/path.hpp>

#include "outcome/outcome.hpp"
#include "storage/content/content_store.hpp"
#include "storage/metadata/metadata_store.hpp"

namespace calcflow::storage {

  /**
   * @brief A project directory: the content store under <path>/objects and
   * the metadata database <path>/storage.sqlite
   */
  class Project {
   public:
    static constexpr const char *kObjectsFolder = "objects";
    static constexpr const char *kDatabaseFile = "storage.sqlite";
    static constexpr const char *kConfigFile = "config.json";

    /**
     * @brief Creates the project layout where missing, and opens it
     */
    static outcome::result<Project> init(const boost::filesystem::path &path);

    /**
     * @brief Opens an existing project
     * @return DatabaseError::NOT_FOUND if the directory, the object store or
     * the database is missing
     */
    static outcome::result<Project> open(const boost::filesystem::path &path);

    const boost::filesystem::path &path() const {
      return path_;
    }

    /// optional engine configuration file of the project
    boost::filesystem::path configPath() const {
      return path_ / kConfigFile;
    }

    std::shared_ptr<ContentStore> objects() const {
      return objects_;
    }

    std::shared_ptr<MetadataStore> metadata() const {
      return metadata_;
    }

   private:
    Project(boost::filesystem::path path,
            std::shared_ptr<ContentStore> objects,
            std::shared_ptr<MetadataStore> metadata);

    static outcome::result<Project> connect(
        const boost::filesystem::path &path);

    boost::filesystem::path path_;
    std::shared_ptr<ContentStore> objects_;
    std::shared_ptr<MetadataStore> metadata_;
  };

}  // namespace calcflow::storage

#endif  // CALCFLOW_STORAGE_PROJECT_HPP
