#include "remote/url.hpp"

#include <cctype>

#include <boost/algorithm/string/predicate.hpp>

#include "remote/remote_error.hpp"

namespace calcflow::remote
{
    namespace
    {
        bool isUnreserved( unsigned char c )
        {
            return std::isalnum( c ) != 0 || c == '-' || c == '_' || c == '.' || c == '~';
        }

        std::string encodePairs( const QueryParams &fields )
        {
            std::string out;
            for ( const auto &[name, value] : fields )
            {
                if ( !out.empty() )
                {
                    out += '&';
                }
                out += urlEncode( name );
                out += '=';
                out += urlEncode( value );
            }
            return out;
        }
    }

    std::string Url::target( const std::string &path, const QueryParams &query ) const
    {
        std::string result = base_path;
        if ( !path.empty() && path.front() != '/' )
        {
            result += '/';
        }
        result += path;
        if ( result.empty() )
        {
            result = "/";
        }
        if ( !query.empty() )
        {
            result += '?';
            result += encodePairs( query );
        }
        return result;
    }

    std::string Url::origin() const
    {
        return scheme + "://" + host + ":" + port;
    }

    outcome::result<Url> parseUrl( const std::string &url )
    {
        Url         result;
        std::string rest;
        if ( boost::algorithm::istarts_with( url, "https://" ) )
        {
            result.scheme = "https";
            result.port   = "443";
            rest          = url.substr( 8 );
        }
        else if ( boost::algorithm::istarts_with( url, "http://" ) )
        {
            result.scheme = "http";
            result.port   = "80";
            rest          = url.substr( 7 );
        }
        else
        {
            return RemoteError::INVALID_URL;
        }

        auto        slash     = rest.find( '/' );
        std::string authority = rest.substr( 0, slash );
        if ( slash != std::string::npos )
        {
            result.base_path = rest.substr( slash );
            while ( !result.base_path.empty() && result.base_path.back() == '/' )
            {
                result.base_path.pop_back();
            }
        }
        if ( authority.find( '@' ) != std::string::npos || result.base_path.find_first_of( "?#" ) != std::string::npos )
        {
            return RemoteError::INVALID_URL;
        }

        auto colon = authority.rfind( ':' );
        if ( colon != std::string::npos && authority.find( ']' ) == std::string::npos )
        {
            result.port = authority.substr( colon + 1 );
            authority.resize( colon );
            if ( result.port.empty() || result.port.find_first_not_of( "0123456789" ) != std::string::npos )
            {
                return RemoteError::INVALID_URL;
            }
        }
        if ( authority.empty() )
        {
            return RemoteError::INVALID_URL;
        }
        result.host = authority;
        return result;
    }

    std::string urlEncode( const std::string &value )
    {
        static const char *kHex = "0123456789ABCDEF";
        std::string        out;
        out.reserve( value.size() );
        for ( unsigned char c : value )
        {
            if ( isUnreserved( c ) || c == '/' )
            {
                out += static_cast<char>( c );
            }
            else
            {
                out += '%';
                out += kHex[c >> 4];
                out += kHex[c & 0x0f];
            }
        }
        return out;
    }

    std::string formEncode( const QueryParams &fields )
    {
        return encodePairs( fields );
    }
}
