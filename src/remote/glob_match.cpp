#include "remote/glob_match.hpp"

#include <fnmatch.h>

#include <algorithm>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

namespace calcflow::remote
{
    namespace
    {
        constexpr const char *kAnyDepth = "**";

        std::vector<std::string> Segments( const std::string &path )
        {
            std::vector<std::string> parts;
            boost::algorithm::split( parts, path, boost::algorithm::is_any_of( "/" ) );
            parts.erase( std::remove_if( parts.begin(),
                                         parts.end(),
                                         []( const std::string &part ) { return part.empty() || part == "."; } ),
                         parts.end() );
            return parts;
        }

        bool SegmentMatch( const std::string &pattern, const std::string &segment )
        {
            return ::fnmatch( pattern.c_str(), segment.c_str(), FNM_PERIOD ) == 0;
        }

        bool MatchFrom( const std::vector<std::string> &pattern,
                        size_t                          p,
                        const std::vector<std::string> &path,
                        size_t                          s,
                        bool                            prefix_only )
        {
            while ( p < pattern.size() )
            {
                if ( pattern[p] == kAnyDepth )
                {
                    for ( size_t skip = s; skip <= path.size(); ++skip )
                    {
                        if ( MatchFrom( pattern, p + 1, path, skip, prefix_only ) )
                        {
                            return true;
                        }
                    }
                    return prefix_only;
                }
                if ( s == path.size() )
                {
                    // the directory ends before the pattern, something below may match
                    return prefix_only;
                }
                if ( !SegmentMatch( pattern[p], path[s] ) )
                {
                    return false;
                }
                ++p;
                ++s;
            }
            return s == path.size() && !prefix_only;
        }
    }

    bool GlobMatch( const std::string &pattern, const std::string &path )
    {
        return MatchFrom( Segments( pattern ), 0, Segments( path ), 0, false );
    }

    bool GlobMatchAny( const std::vector<std::string> &patterns, const std::string &path )
    {
        for ( const auto &pattern : patterns )
        {
            if ( GlobMatch( pattern, path ) )
            {
                return true;
            }
        }
        return false;
    }

    bool GlobMayMatchBelow( const std::string &pattern, const std::string &directory )
    {
        return MatchFrom( Segments( pattern ), 0, Segments( directory ), 0, true );
    }
}
