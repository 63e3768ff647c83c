#include "storage/content/file_content_store.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>

#include <boost/filesystem.hpp>

#include "crypto/sha/sha256.hpp"
#include "storage/database_error.hpp"

namespace fs = boost::filesystem;

namespace calcflow::storage
{
    namespace
    {
        constexpr const char *kTempFolder    = "tmp";
        constexpr size_t      kCopyChunkSize = 64 * 1024;

        /// write all bytes to a file descriptor and sync it
        bool writeAll( int fd, std::string_view bytes )
        {
            size_t written = 0;
            while ( written < bytes.size() )
            {
                auto n = ::write( fd, bytes.data() + written, bytes.size() - written );
                if ( n < 0 )
                {
                    if ( errno == EINTR )
                    {
                        continue;
                    }
                    return false;
                }
                written += static_cast<size_t>( n );
            }
            return true;
        }
    } // namespace

    outcome::result<std::shared_ptr<FileContentStore>> FileContentStore::create( const fs::path &root )
    {
        boost::system::error_code ec;
        fs::create_directories( root / kTempFolder, ec );
        if ( ec )
        {
            return DatabaseError::IO_ERROR;
        }
        return std::make_shared<FileContentStore>( root );
    }

    FileContentStore::FileContentStore( fs::path root ) :
        root_( std::move( root ) ), logger_( base::createLogger( "ContentStore" ) )
    {
    }

    outcome::result<fs::path> FileContentStore::objectPath( const ObjectKey &key ) const
    {
        auto parts = parseObjectKey( key );
        if ( !parts )
        {
            return outcome::failure( parts.error() );
        }
        return root_ / parts.value().digest.substr( 0, 2 ) / key;
    }

    outcome::result<fs::path> FileContentStore::tempPath() const
    {
        boost::system::error_code ec;
        auto                      path = fs::unique_path( root_ / kTempFolder / "%%%%-%%%%-%%%%-%%%%", ec );
        if ( ec )
        {
            return DatabaseError::IO_ERROR;
        }
        return path;
    }

    outcome::result<void> FileContentStore::commit( const fs::path &temp, const ObjectKey &key )
    {
        auto target = objectPath( key );
        boost::system::error_code ec;
        if ( !target )
        {
            fs::remove( temp, ec );
            return outcome::failure( target.error() );
        }

        if ( fs::exists( target.value(), ec ) )
        {
            fs::remove( temp, ec );
            return outcome::success();
        }
        fs::create_directories( target.value().parent_path(), ec );
        if ( !ec )
        {
            // rename is atomic, a concurrent writer of the same object renames identical bytes
            fs::rename( temp, target.value(), ec );
        }
        if ( ec )
        {
            logger_->error( "Cannot store object {}: {}", key, ec.message() );
            fs::remove( temp, ec );
            return DatabaseError::IO_ERROR;
        }
        return outcome::success();
    }

    outcome::result<ObjectKey> FileContentStore::put( std::string_view bytes, const std::string &extension )
    {
        auto key = makeObjectKey( crypto::sha256Hex( bytes ), extension );
        if ( !key )
        {
            return outcome::failure( key.error() );
        }
        if ( exists( key.value() ) )
        {
            return key;
        }

        auto temp = tempPath();
        if ( !temp )
        {
            return outcome::failure( temp.error() );
        }
        int fd = ::open( temp.value().c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644 );
        if ( fd < 0 )
        {
            logger_->error( "Cannot open {}: {}", temp.value().string(), std::strerror( errno ) );
            return DatabaseError::IO_ERROR;
        }
        bool ok = writeAll( fd, bytes ) && ::fsync( fd ) == 0;
        ::close( fd );
        if ( !ok )
        {
            boost::system::error_code ec;
            fs::remove( temp.value(), ec );
            return DatabaseError::IO_ERROR;
        }

        auto committed = commit( temp.value(), key.value() );
        if ( !committed )
        {
            return outcome::failure( committed.error() );
        }
        logger_->debug( "Stored object {} ({} bytes)", key.value(), bytes.size() );
        return key;
    }

    outcome::result<ObjectKey> FileContentStore::putFile( const std::string &path, const std::string &extension )
    {
        std::ifstream input( path, std::ios::binary );
        if ( !input )
        {
            return DatabaseError::NOT_FOUND;
        }

        auto temp = tempPath();
        if ( !temp )
        {
            return outcome::failure( temp.error() );
        }
        int fd = ::open( temp.value().c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644 );
        if ( fd < 0 )
        {
            return DatabaseError::IO_ERROR;
        }

        crypto::Sha256Stream hasher;
        std::string          chunk( kCopyChunkSize, '\0' );
        bool                 ok = true;
        while ( ok && input )
        {
            input.read( chunk.data(), static_cast<std::streamsize>( chunk.size() ) );
            auto n = static_cast<size_t>( input.gcount() );
            if ( n == 0 )
            {
                break;
            }
            std::string_view view( chunk.data(), n );
            hasher.update( view );
            ok = writeAll( fd, view );
        }
        ok = ok && !input.bad() && ::fsync( fd ) == 0;
        ::close( fd );
        if ( !ok )
        {
            boost::system::error_code ec;
            fs::remove( temp.value(), ec );
            return DatabaseError::IO_ERROR;
        }

        auto key = makeObjectKey( hasher.finalHex(), extension );
        if ( !key )
        {
            boost::system::error_code ec;
            fs::remove( temp.value(), ec );
            return outcome::failure( key.error() );
        }
        auto committed = commit( temp.value(), key.value() );
        if ( !committed )
        {
            return outcome::failure( committed.error() );
        }
        return key;
    }

    outcome::result<std::string> FileContentStore::get( const ObjectKey &key ) const
    {
        auto path = objectPath( key );
        if ( !path )
        {
            return outcome::failure( path.error() );
        }
        std::ifstream input( path.value().string(), std::ios::binary );
        if ( !input )
        {
            return DatabaseError::NOT_FOUND;
        }
        std::string bytes( ( std::istreambuf_iterator<char>( input ) ), std::istreambuf_iterator<char>() );
        if ( input.bad() )
        {
            return DatabaseError::IO_ERROR;
        }
        return bytes;
    }

    outcome::result<uint64_t> FileContentStore::size( const ObjectKey &key ) const
    {
        auto path = objectPath( key );
        if ( !path )
        {
            return outcome::failure( path.error() );
        }
        boost::system::error_code ec;
        auto                      file_size = fs::file_size( path.value(), ec );
        if ( ec )
        {
            return DatabaseError::NOT_FOUND;
        }
        return static_cast<uint64_t>( file_size );
    }

    bool FileContentStore::exists( const ObjectKey &key ) const
    {
        auto path = objectPath( key );
        if ( !path )
        {
            return false;
        }
        boost::system::error_code ec;
        return fs::is_regular_file( path.value(), ec );
    }

    size_t FileContentStore::count() const
    {
        return keys().size();
    }

    std::vector<ObjectKey> FileContentStore::keys() const
    {
        std::vector<ObjectKey>    result;
        boost::system::error_code ec;
        for ( fs::directory_iterator shard( root_, ec ), end; !ec && shard != end; shard.increment( ec ) )
        {
            if ( !fs::is_directory( shard->path() ) || shard->path().filename() == kTempFolder )
            {
                continue;
            }
            for ( fs::directory_iterator object( shard->path(), ec ); !ec && object != end; object.increment( ec ) )
            {
                result.push_back( object->path().filename().string() );
            }
        }
        std::sort( result.begin(), result.end() );
        return result;
    }
} // namespace calcflow::storage
