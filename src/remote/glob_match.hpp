#ifndef CALCFLOW_REMOTE_GLOB_MATCH_HPP
#define CALCFLOW_REMOTE_GLOB_MATCH_HPP

#include <string>
#include <vector>

namespace calcflow::remote
{
    /**
     * @brief Matches a relative POSIX path against a glob pattern.
     * Segments are matched with fnmatch rules, a "**" segment matches any
     * number of segments, including none.
     */
    bool GlobMatch( const std::string &pattern, const std::string &path );

    /// @return true if @param path matches at least one of @param patterns
    bool GlobMatchAny( const std::vector<std::string> &patterns, const std::string &path );

    /**
     * @brief Whether a directory could contain a match of @param pattern,
     * used to prune a recursive listing
     */
    bool GlobMayMatchBelow( const std::string &pattern, const std::string &directory );
}

#endif
