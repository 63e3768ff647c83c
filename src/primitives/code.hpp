#ifndef CALCFLOW_PRIMITIVES_CODE_HPP
#define CALCFLOW_PRIMITIVES_CODE_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace calcflow::primitives {
  /// key of an object in the content store: "<sha256 hex>[.<extension>]"
  using ObjectKey = std::string;

  /**
   * @brief POSIX relative path -> object key.
   * std::nullopt denotes a directory rather than a file.
   */
  using PathMap = std::map<std::string, std::optional<ObjectKey>>;

  /**
   * @brief An executable definition, bound to exactly one client
   */
  struct Code {
    int64_t pk = 0;         ///< primary key, set by the database
    std::string label;      ///< unique label
    int64_t client_pk = 0;  ///< client this code runs on
    std::string script;     ///< job script template
    PathMap upload_paths;   ///< uploaded with every calcjob of this code

    inline bool operator==(const Code &rhs) const {
      return pk == rhs.pk && label == rhs.label && client_pk == rhs.client_pk
             && script == rhs.script && upload_paths == rhs.upload_paths;
    }

    inline bool operator!=(const Code &rhs) const {
      return !operator==(rhs);
    }
  };
}  // namespace calcflow::primitives

#endif  // CALCFLOW_PRIMITIVES_CODE_HPP
