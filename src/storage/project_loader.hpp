#ifndef CALCFLOW_STORAGE_PROJECT_LOADER_HPP
#define CALCFLOW_STORAGE_PROJECT_LOADER_HPP

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>
#include <nlohmann/json.hpp>

#include "base/logger.hpp"
#include "outcome/outcome.hpp"
#include "storage/content/content_store.hpp"
#include "storage/loader_error.hpp"
#include "storage/metadata/metadata_store.hpp"

namespace calcflow::storage {

  /// what a bulk load created
  struct LoadedRows {
    std::map<std::string, ObjectKey> objects;  ///< object label -> key
    std::vector<int64_t> clients;
    std::vector<int64_t> codes;
    std::vector<int64_t> calcjobs;
  };

  /**
   * @brief Bulk loader of clients, codes, calcjobs and the objects they
   * upload, from a JSON document:
   * @code
   * {
   *   "objects": {"<label>": {"content": "...", "extension": "txt"}
   *               | {"path": "relative/to/document"}},
   *   "clients": [{"label": ..., "client_url": ..., ...}],
   *   "codes": [{"label": ..., "client_label": ..., "script": ...,
   *              "upload_paths": {"<path>": {"label": ...} | {"key": ...}
   *                                         | null}}],
   *   "calcjobs": [{"code_label": ..., "parameters": {...},
   *                 "upload_paths": {...}, "download_globs": [...]}]
   * }
   * @endcode
   * Rows are inserted in one transaction, nothing is inserted if any item is
   * rejected.
   */
  class ProjectLoader {
   public:
    ProjectLoader(std::shared_ptr<ContentStore> objects,
                  std::shared_ptr<MetadataStore> metadata);

    /// loads a document file, relative object paths resolve to its folder
    outcome::result<LoadedRows> loadFile(const boost::filesystem::path &path);

    outcome::result<LoadedRows> load(const nlohmann::json &document,
                                     const boost::filesystem::path &base_dir);

   private:
    outcome::result<void> loadObjects(const nlohmann::json &objects,
                                      const boost::filesystem::path &base_dir,
                                      LoadedRows &rows);
    outcome::result<void> loadClients(const nlohmann::json &clients,
                                      LoadedRows &rows);
    outcome::result<void> loadCodes(const nlohmann::json &codes,
                                    LoadedRows &rows);
    outcome::result<void> loadCalcJobs(const nlohmann::json &calcjobs,
                                       LoadedRows &rows);

    /// resolves {"label"}/{"key"}/null references of an upload mapping
    outcome::result<primitives::PathMap> resolveUploads(
        const nlohmann::json &item,
        const LoadedRows &rows,
        const std::string &name) const;

    std::shared_ptr<ContentStore> objects_;
    std::shared_ptr<MetadataStore> metadata_;
    base::Logger logger_;
  };

}  // namespace calcflow::storage

#endif  // CALCFLOW_STORAGE_PROJECT_LOADER_HPP
