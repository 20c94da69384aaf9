#ifndef BLOCKWATCH_APPLICATION_PT_UTIL_HPP
#define BLOCKWATCH_APPLICATION_PT_UTIL_HPP

#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>
#include "application/impl/config_reader/error.hpp"

namespace blockwatch::application {

  template <typename T>
  outcome::result<std::decay_t<T>> ensure(boost::optional<T> opt_entry) {
    if (! opt_entry) {
      return ConfigReaderError::MISSING_ENTRY;
    }
    return opt_entry.value();
  }

  /**
   * Read an optional entry, falling back to a default when it is absent
   * @return INVALID_ENTRY if the entry exists but has the wrong type
   */
  template <typename T>
  outcome::result<T> getOr(const boost::property_tree::ptree &tree,
                           const std::string &path,
                           T default_value) {
    auto child = tree.get_child_optional(path);
    if (! child) {
      return default_value;
    }
    auto value = child->get_value_optional<T>();
    if (! value) {
      return ConfigReaderError::INVALID_ENTRY;
    }
    return value.value();
  }

}  // namespace blockwatch::application

#endif  // BLOCKWATCH_APPLICATION_PT_UTIL_HPP
