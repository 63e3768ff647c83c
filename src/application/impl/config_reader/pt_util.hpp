#ifndef CALCFLOW_APPLICATION_PT_UTIL_HPP
#define CALCFLOW_APPLICATION_PT_UTIL_HPP

#include <string>

#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>

#include "application/impl/config_reader/error.hpp"

namespace calcflow::application {

  /**
   * Reads an optional entry of @param tree
   * @return none if @param key is absent, INVALID_VALUE if its value cannot
   * be read as T
   */
  template <typename T>
  outcome::result<boost::optional<T>> optionalEntry(
      const boost::property_tree::ptree &tree, const std::string &key) {
    auto child = tree.get_child_optional(key);
    if (!child) {
      return boost::optional<T>{};
    }
    auto value = child->get_value_optional<T>();
    if (!value) {
      return ConfigReaderError::INVALID_VALUE;
    }
    return value;
  }

}  // namespace calcflow::application

#endif  // CALCFLOW_APPLICATION_PT_UTIL_HPP
