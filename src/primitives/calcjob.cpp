#include "primitives/calcjob.hpp"

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

namespace calcflow::primitives {

  std::string CalcJob::remotePath(const Client &client) const {
    return joinRemotePath(joinRemotePath(client.work_dir, kWorkflowsFolder),
                          uuid);
  }

  bool isValidRelativePath(const std::string &path) {
    if (path.empty() || path.front() == '/') {
      return false;
    }
    std::vector<std::string> segments;
    boost::algorithm::split(segments, path, boost::algorithm::is_any_of("/"));
    for (const auto &segment : segments) {
      if (segment == "..") {
        return false;
      }
    }
    return true;
  }

  std::string joinRemotePath(const std::string &base, const std::string &rel) {
    if (base.empty()) {
      return rel;
    }
    if (rel.empty()) {
      return base;
    }
    std::string joined = base;
    if (joined.back() != '/') {
      joined.push_back('/');
    }
    size_t start = 0;
    while (start < rel.size() && rel[start] == '/') {
      ++start;
    }
    return joined + rel.substr(start);
  }
}  // namespace calcflow::primitives
