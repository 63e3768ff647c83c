#ifndef CALCFLOW_PRIMITIVES_CALCJOB_HPP
#define CALCFLOW_PRIMITIVES_CALCJOB_HPP

#include <string>
#include <vector>

#include "primitives/client.hpp"
#include "primitives/code.hpp"

namespace calcflow::primitives {
  /// opaque parameters, substituted into the script template
  using ParameterMap = std::map<std::string, std::string>;

  /// remote sub-folder of the client working directory holding all calcjobs
  constexpr const char *kWorkflowsFolder = "workflows";

  /// name of the rendered job script inside the calcjob folder
  constexpr const char *kJobScriptName = "job.sh";

  /**
   * @brief One unit of remote work, bound to exactly one code.
   * Immutable once created, progress is tracked by Processing.
   */
  struct CalcJob {
    int64_t pk = 0;                           ///< primary key, set by the database
    std::string label;                        ///< unique per code
    std::string uuid;                         ///< namespaces the remote folder
    int64_t code_pk = 0;                      ///< code to run
    ParameterMap parameters;                  ///< template parameters
    PathMap upload_paths;                     ///< merged with the code uploads
    std::vector<std::string> download_globs;  ///< outputs to retrieve

    /// @return remote folder in which this calcjob runs
    std::string remotePath(const Client &client) const;

    inline bool operator==(const CalcJob &rhs) const {
      return pk == rhs.pk && label == rhs.label && uuid == rhs.uuid
             && code_pk == rhs.code_pk && parameters == rhs.parameters
             && upload_paths == rhs.upload_paths
             && download_globs == rhs.download_globs;
    }

    inline bool operator!=(const CalcJob &rhs) const {
      return !operator==(rhs);
    }
  };

  /**
   * @brief Checks that @param path is a non empty POSIX path relative to its
   * base folder, which does not escape it
   */
  bool isValidRelativePath(const std::string &path);

  /**
   * @brief Joins POSIX path segments, without duplicating separators
   */
  std::string joinRemotePath(const std::string &base, const std::string &rel);
}  // namespace calcflow::primitives

#endif  // CALCFLOW_PRIMITIVES_CALCJOB_HPP
