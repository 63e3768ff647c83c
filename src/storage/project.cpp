#include "storage/project.hpp"

#include <boost/filesystem.hpp>

#include "base/logger.hpp"
#include "storage/content/file_content_store.hpp"
#include "storage/database_error.hpp"
#include "storage/metadata/sqlite_metadata_store.hpp"

namespace fs = boost::filesystem;

namespace calcflow::storage {

  Project::Project(fs::path path,
                   std::shared_ptr<ContentStore> objects,
                   std::shared_ptr<MetadataStore> metadata)
      : path_(std::move(path)),
        objects_(std::move(objects)),
        metadata_(std::move(metadata)) {}

  outcome::result<Project> Project::init(const fs::path &path) {
    boost::system::error_code ec;
    fs::create_directories(path / kObjectsFolder, ec);
    if (ec) {
      base::createLogger("Project")->error(
          "Cannot create project directory {}: {}", path.string(), ec.message());
      return DatabaseError::IO_ERROR;
    }
    return connect(path);
  }

  outcome::result<Project> Project::open(const fs::path &path) {
    auto logger = base::createLogger("Project");
    boost::system::error_code ec;
    if (!fs::is_directory(path, ec)) {
      logger->error("Project path not found (use `calcflow init`): {}",
                    path.string());
      return DatabaseError::NOT_FOUND;
    }
    if (!fs::is_directory(path / kObjectsFolder, ec)) {
      logger->error("Object store path not found: {}",
                    (path / kObjectsFolder).string());
      return DatabaseError::NOT_FOUND;
    }
    if (!fs::is_regular_file(path / kDatabaseFile, ec)) {
      logger->error("Database path not found: {}",
                    (path / kDatabaseFile).string());
      return DatabaseError::NOT_FOUND;
    }
    return connect(path);
  }

  outcome::result<Project> Project::connect(const fs::path &path) {
    auto objects = FileContentStore::create(path / kObjectsFolder);
    if (!objects) {
      return outcome::failure(objects.error());
    }
    auto metadata = SqliteMetadataStore::create((path / kDatabaseFile).string());
    if (!metadata) {
      return outcome::failure(metadata.error());
    }
    return Project(path, objects.value(), metadata.value());
  }

}  // namespace calcflow::storage
