#include "base/logger.hpp"

#include <mutex>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace
{
    std::mutex &loggerMutex()
    {
        static std::mutex mutex;
        return mutex;
    }

    spdlog::level::level_enum &defaultLevel()
    {
        static spdlog::level::level_enum level = spdlog::level::info;
        return level;
    }

    std::string &logFilePath()
    {
        static std::string path;
        return path;
    }

    void setGlobalPattern( spdlog::logger &logger )
    {
        logger.set_pattern( "[%Y-%m-%d %H:%M:%S][%l][%n] %v" );
    }

    std::shared_ptr<spdlog::logger> createLogger( const std::string &tag, const std::string &basepath )
    {
        std::shared_ptr<spdlog::logger> logger;
        if ( !basepath.empty() )
        {
            logger = spdlog::basic_logger_mt( tag, basepath );
        }
        else
        {
            logger = spdlog::stdout_color_mt( tag );
        }
        setGlobalPattern( *logger );
        logger->set_level( defaultLevel() );
        return logger;
    }
} // namespace

namespace calcflow::base
{
    Logger createLogger( const std::string &tag )
    {
        std::lock_guard<std::mutex> lock( loggerMutex() );
        auto                        logger = spdlog::get( tag );
        if ( logger == nullptr )
        {
            logger = ::createLogger( tag, logFilePath() );
        }
        return logger;
    }

    void setLogLevel( spdlog::level::level_enum level )
    {
        std::lock_guard<std::mutex> lock( loggerMutex() );
        defaultLevel() = level;
        spdlog::apply_all( [level]( const std::shared_ptr<spdlog::logger> &logger ) { logger->set_level( level ); } );
    }

    void setLogFile( const std::string &path )
    {
        std::lock_guard<std::mutex> lock( loggerMutex() );
        logFilePath() = path;
    }
} // namespace calcflow::base
