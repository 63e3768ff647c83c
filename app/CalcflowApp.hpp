/**
 * @file       CalcflowApp.hpp
 * @brief      calcflow command line application
 * @date       2026-10-18
 */

#ifndef _CALCFLOW_APP_HPP_
#define _CALCFLOW_APP_HPP_

#include <memory>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

#include "application/engine_config.hpp"
#include "base/logger.hpp"
#include "outcome/outcome.hpp"
#include "storage/project.hpp"

/**
 * @brief Parses the command line and dispatches to one command:
 * init, add, run, status, client, code, calcjob or object
 */
class CalcflowApp
{
public:
    /// @return exit code, non zero if the command line is not usable
    int init( int argc, char **argv );

    /// @return exit code of the command
    int run();

private:
    int CmdInit();
    int CmdAdd();
    int CmdRun();
    int CmdStatus();
    int CmdClient();
    int CmdCode();
    int CmdCalcJob();
    int CmdObject();

    int CalcJobList( const std::vector<std::string> &args );
    int CalcJobShow( const std::vector<std::string> &args );

    outcome::result<calcflow::storage::Project> OpenProject() const;
    outcome::result<calcflow::application::EngineConfig> LoadConfig( const calcflow::storage::Project &project ) const;

    /// loads a bulk document, printing what it created
    int Load( const calcflow::storage::Project &project, const std::string &file ) const;

    int Fail( const std::string &what, const std::error_code &error ) const;
    int Usage( const std::string &message ) const;

    std::string                    m_command;
    std::vector<std::string>       m_args;
    boost::filesystem::path        m_project_path;
    std::string                    m_config_path;
    std::string                    m_usage;
    bool                           m_verbosity_set = false;
    calcflow::base::Logger         m_logger;
};

#endif
