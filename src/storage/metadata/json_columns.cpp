#include "storage/metadata/json_columns.hpp"

#include <nlohmann/json.hpp>

#include "storage/database_error.hpp"

namespace calcflow::storage::json_columns {

  using nlohmann::json;

  std::string encodePathMap(const primitives::PathMap &paths) {
    json doc = json::object();
    for (const auto &[path, key] : paths) {
      doc[path] = key ? json(*key) : json(nullptr);
    }
    return doc.dump();
  }

  outcome::result<primitives::PathMap> decodePathMap(const std::string &text) {
    try {
      auto doc = json::parse(text);
      if (!doc.is_object()) {
        return DatabaseError::CORRUPTION;
      }
      primitives::PathMap paths;
      for (const auto &item : doc.items()) {
        if (item.value().is_null()) {
          paths.emplace(item.key(), std::nullopt);
        } else if (item.value().is_string()) {
          paths.emplace(item.key(), item.value().get<std::string>());
        } else {
          return DatabaseError::CORRUPTION;
        }
      }
      return paths;
    } catch (const json::exception &e) {
      return DatabaseError::CORRUPTION;
    }
  }

  std::string encodeParameters(const primitives::ParameterMap &parameters) {
    json doc = json::object();
    for (const auto &[key, value] : parameters) {
      doc[key] = value;
    }
    return doc.dump();
  }

  outcome::result<primitives::ParameterMap> decodeParameters(
      const std::string &text) {
    try {
      auto doc = json::parse(text);
      if (!doc.is_object()) {
        return DatabaseError::CORRUPTION;
      }
      primitives::ParameterMap parameters;
      for (const auto &item : doc.items()) {
        if (!item.value().is_string()) {
          return DatabaseError::CORRUPTION;
        }
        parameters.emplace(item.key(), item.value().get<std::string>());
      }
      return parameters;
    } catch (const json::exception &e) {
      return DatabaseError::CORRUPTION;
    }
  }

  std::string encodeStringList(const std::vector<std::string> &list) {
    return json(list).dump();
  }

  outcome::result<std::vector<std::string>> decodeStringList(
      const std::string &text) {
    try {
      auto doc = json::parse(text);
      if (!doc.is_array()) {
        return DatabaseError::CORRUPTION;
      }
      std::vector<std::string> list;
      for (const auto &item : doc) {
        if (!item.is_string()) {
          return DatabaseError::CORRUPTION;
        }
        list.push_back(item.get<std::string>());
      }
      return list;
    } catch (const json::exception &e) {
      return DatabaseError::CORRUPTION;
    }
  }
}  // namespace calcflow::storage::json_columns
