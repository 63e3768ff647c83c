#ifndef CALCFLOW_STORAGE_JSON_COLUMNS_HPP
#define CALCFLOW_STORAGE_JSON_COLUMNS_HPP

#include <string>
#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/calcjob.hpp"
#include "primitives/code.hpp"

namespace calcflow::storage::json_columns {
  /// mappings are stored as JSON objects with sorted keys
  std::string encodePathMap(const primitives::PathMap &paths);
  outcome::result<primitives::PathMap> decodePathMap(const std::string &text);

  std::string encodeParameters(const primitives::ParameterMap &parameters);
  outcome::result<primitives::ParameterMap> decodeParameters(
      const std::string &text);

  std::string encodeStringList(const std::vector<std::string> &list);
  outcome::result<std::vector<std::string>> decodeStringList(
      const std::string &text);
}  // namespace calcflow::storage::json_columns

#endif  // CALCFLOW_STORAGE_JSON_COLUMNS_HPP
