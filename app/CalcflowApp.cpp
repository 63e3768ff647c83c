/**
 * @file       CalcflowApp.cpp
 * @brief      calcflow command line application
 * @date       2026-10-18
 */
#include "CalcflowApp.hpp"

#include <algorithm>
#include <csignal>
#include <iostream>
#include <sstream>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

#include "application/impl/engine_config_reader.hpp"
#include "processing/calcjob_runner.hpp"
#include "processing/output_classifier.hpp"
#include "processing/processing_engine.hpp"
#include "processing/step_executor.hpp"
#include "remote/gateway_registry.hpp"
#include "storage/project_loader.hpp"
#include "storage/runner_slot.hpp"

namespace po = boost::program_options;

using calcflow::application::EngineConfig;
using calcflow::application::EngineConfigReader;
using calcflow::storage::CalcJobField;
using calcflow::storage::CalcJobQuery;
using calcflow::storage::Comparison;
using calcflow::storage::Project;

namespace
{
    constexpr const char *kDefaultProjectPath = ".calcflow_project";
    constexpr size_t      kDefaultPageSize    = 50;

    /// parses the options of a sub command, without positional arguments beyond @param positional
    outcome::result<po::variables_map> ParseSubcommand( const std::vector<std::string>         &args,
                                                        const po::options_description          &options,
                                                        const po::positional_options_description &positional )
    {
        po::variables_map vm;
        try
        {
            po::store( po::command_line_parser( args ).options( options ).positional( positional ).run(), vm );
            po::notify( vm );
        }
        catch ( const po::error &e )
        {
            std::cerr << e.what() << std::endl;
            return outcome::failure( std::make_error_code( std::errc::invalid_argument ) );
        }
        return vm;
    }

    nlohmann::json ToJson( const calcflow::primitives::PathMap &paths )
    {
        auto json = nlohmann::json::object();
        for ( const auto &[path, key] : paths )
        {
            json[path] = key ? nlohmann::json( *key ) : nlohmann::json();
        }
        return json;
    }
}

int CalcflowApp::init( int argc, char **argv )
{
    m_logger = calcflow::base::createLogger( "calcflow" );

    std::string verbosity;
    std::string log_file;
    std::string project_path;

    po::options_description global( "Usage: calcflow [options] <command> [args]\n"
                                    "Commands:\n"
                                    "  init [--add FILE]      create a project\n"
                                    "  add FILE               bulk add objects, clients, codes and calcjobs\n"
                                    "  run [-n N] [--serve]   drive playing calcjobs\n"
                                    "  status                 count calcjobs per state\n"
                                    "  client list\n"
                                    "  code list\n"
                                    "  calcjob list [--state S] [--step S] [--code LABEL] [--limit N] [--page P]\n"
                                    "  calcjob show PK\n"
                                    "  object cat KEY\n"
                                    "Options" );
    // clang-format off
    global.add_options()
        ( "help,h", "Show this help" )
        ( "project-path,p", po::value<std::string>( &project_path )->default_value( kDefaultProjectPath ), "Project directory" )
        ( "verbosity,v", po::value<std::string>( &verbosity ), "Log level: trace, debug, info, warning, error, critical, off or 0-6" )
        ( "log-file", po::value<std::string>( &log_file ), "Write logs to this file instead of stdout" )
        ( "config", po::value<std::string>( &m_config_path ), "Engine config file, <project>/config.json by default" );
    // clang-format on

    po::options_description hidden;
    hidden.add_options()                                              //
        ( "command", po::value<std::string>( &m_command ), "" )       //
        ( "args", po::value<std::vector<std::string>>(), "" );

    po::options_description all;
    all.add( global ).add( hidden );

    po::positional_options_description positional;
    positional.add( "command", 1 ).add( "args", -1 );

    std::ostringstream usage;
    usage << global;
    m_usage = usage.str();

    po::variables_map vm;
    try
    {
        auto parsed = po::command_line_parser( argc, argv )
                          .options( all )
                          .positional( positional )
                          .allow_unregistered()
                          .run();
        po::store( parsed, vm );
        po::notify( vm );

        // sub command options are parsed by each command
        m_args = po::collect_unrecognized( parsed.options, po::include_positional );
        if ( !m_args.empty() )
        {
            m_args.erase( m_args.begin() );
        }
    }
    catch ( const po::error &e )
    {
        return Usage( e.what() );
    }

    if ( vm.count( "help" ) > 0 || m_command.empty() )
    {
        std::cout << m_usage << std::endl;
        return m_command.empty() && vm.count( "help" ) == 0 ? 2 : 0;
    }

    if ( !log_file.empty() )
    {
        calcflow::base::setLogFile( log_file );
        m_logger = calcflow::base::createLogger( "calcflow" );
    }
    if ( !verbosity.empty() )
    {
        auto level = calcflow::application::parseLogLevel( verbosity );
        if ( !level )
        {
            return Usage( "unknown verbosity '" + verbosity + "'" );
        }
        calcflow::base::setLogLevel( level.value() );
        m_verbosity_set = true;
    }
    m_project_path = project_path;
    return 0;
}

int CalcflowApp::run()
{
    if ( m_command == "init" )
    {
        return CmdInit();
    }
    if ( m_command == "add" )
    {
        return CmdAdd();
    }
    if ( m_command == "run" )
    {
        return CmdRun();
    }
    if ( m_command == "status" )
    {
        return CmdStatus();
    }
    if ( m_command == "client" )
    {
        return CmdClient();
    }
    if ( m_command == "code" )
    {
        return CmdCode();
    }
    if ( m_command == "calcjob" )
    {
        return CmdCalcJob();
    }
    if ( m_command == "object" )
    {
        return CmdObject();
    }
    return Usage( "unknown command '" + m_command + "'" );
}

int CalcflowApp::Fail( const std::string &what, const std::error_code &error ) const
{
    std::cerr << what << ": " << error.message() << std::endl;
    return 1;
}

int CalcflowApp::Usage( const std::string &message ) const
{
    std::cerr << message << "\n" << m_usage << std::endl;
    return 2;
}

outcome::result<Project> CalcflowApp::OpenProject() const
{
    auto project = Project::open( m_project_path );
    if ( !project )
    {
        std::cerr << "No project at " << m_project_path.string() << ", create one with 'calcflow init'" << std::endl;
    }
    return project;
}

outcome::result<EngineConfig> CalcflowApp::LoadConfig( const Project &project ) const
{
    auto path = m_config_path.empty() ? project.configPath() : boost::filesystem::path( m_config_path );
    if ( !m_config_path.empty() && !boost::filesystem::exists( path ) )
    {
        std::cerr << "Config file " << path.string() << " does not exist" << std::endl;
        return outcome::failure( std::make_error_code( std::errc::no_such_file_or_directory ) );
    }
    return EngineConfigReader::readFile( path );
}

int CalcflowApp::Load( const Project &project, const std::string &file ) const
{
    calcflow::storage::ProjectLoader loader( project.objects(), project.metadata() );
    auto                             loaded = loader.loadFile( file );
    if ( !loaded )
    {
        return Fail( "Cannot add " + file, loaded.error() );
    }
    const auto &rows = loaded.value();
    std::cout << "objects:  " << rows.objects.size() << "\n"
              << "clients:  " << rows.clients.size() << "\n"
              << "codes:    " << rows.codes.size() << "\n"
              << "calcjobs: " << rows.calcjobs.size() << std::endl;
    for ( const auto &[label, key] : rows.objects )
    {
        std::cout << "  object " << label << " -> " << key << "\n";
    }
    for ( auto pk : rows.calcjobs )
    {
        std::cout << "  calcjob PK-" << pk << "\n";
    }
    std::cout.flush();
    return 0;
}

int CalcflowApp::CmdInit()
{
    po::options_description options( "init" );
    options.add_options()( "add", po::value<std::string>(), "Bulk document to add once created" );
    auto vm = ParseSubcommand( m_args, options, {} );
    if ( !vm )
    {
        return Usage( "bad arguments to init" );
    }

    auto project = Project::init( m_project_path );
    if ( !project )
    {
        return Fail( "Cannot create project at " + m_project_path.string(), project.error() );
    }
    std::cout << "Initialized project at " << m_project_path.string() << std::endl;

    if ( vm.value().count( "add" ) > 0 )
    {
        return Load( project.value(), vm.value()["add"].as<std::string>() );
    }
    return 0;
}

int CalcflowApp::CmdAdd()
{
    po::options_description options( "add" );
    options.add_options()( "file", po::value<std::string>()->required(), "Bulk document" );
    po::positional_options_description positional;
    positional.add( "file", 1 );
    auto vm = ParseSubcommand( m_args, options, positional );
    if ( !vm )
    {
        return Usage( "usage: calcflow add FILE" );
    }

    auto project = OpenProject();
    if ( !project )
    {
        return 1;
    }
    return Load( project.value(), vm.value()["file"].as<std::string>() );
}

int CalcflowApp::CmdRun()
{
    po::options_description options( "run" );
    // clang-format off
    options.add_options()
        ( "concurrency,n", po::value<size_t>(), "Calcjobs driven at the same time" )
        ( "serve", "Keep running and pick up calcjobs as they are added" );
    // clang-format on
    auto vm = ParseSubcommand( m_args, options, {} );
    if ( !vm )
    {
        return Usage( "usage: calcflow run [-n N] [--serve]" );
    }

    auto project = OpenProject();
    if ( !project )
    {
        return 1;
    }
    auto config = LoadConfig( project.value() );
    if ( !config )
    {
        return Fail( "Cannot read config", config.error() );
    }
    if ( vm.value().count( "concurrency" ) > 0 )
    {
        config.value().concurrency = vm.value()["concurrency"].as<size_t>();
    }
    auto valid = EngineConfigReader::validate( config.value() );
    if ( !valid )
    {
        return Fail( "Invalid config", valid.error() );
    }
    if ( !m_verbosity_set )
    {
        calcflow::base::setLogLevel( config.value().log_level );
    }

    const auto &engine_config = config.value();
    auto        gateways      = std::make_shared<calcflow::remote::GatewayRegistry>( engine_config.gatewayOptions() );
    auto        executor      = std::make_shared<calcflow::processing::StepExecutor>(
        project.value().objects(),
        gateways,
        std::make_shared<calcflow::processing::DefaultOutputClassifier>(),
        engine_config.executorOptions() );
    auto engine = std::make_shared<calcflow::processing::ProcessingEngine>( project.value().metadata(), executor );
    auto slot = calcflow::storage::RunnerSlot::acquire( project.value().path() );
    if ( !slot )
    {
        return Fail( "Cannot acquire a runner slot", slot.error() );
    }
    auto runner_options  = engine_config.runnerOptions();
    runner_options.owner = slot.value()->owner();
    auto runner          = std::make_shared<calcflow::processing::CalcJobRunner>( project.value().metadata(),
                                                                         engine,
                                                                         runner_options );

    boost::asio::io_context signal_context;
    boost::asio::signal_set signals( signal_context, SIGINT, SIGTERM );
    signals.async_wait(
        [this, runner]( const boost::system::error_code &ec, int signal )
        {
            if ( !ec )
            {
                m_logger->info( "Signal {} received, stopping after the steps in progress", signal );
                runner->Stop();
            }
        } );
    std::thread signal_thread( [&signal_context] { signal_context.run(); } );

    auto summary = vm.value().count( "serve" ) > 0 ? runner->Serve() : runner->RunUntilDone();

    signals.cancel();
    signal_context.stop();
    signal_thread.join();

    std::cout << "finished: " << summary.finished << ", excepted: " << summary.excepted
              << ", interrupted: " << summary.interrupted << ", failed: " << summary.failed << std::endl;
    return summary.failed > 0 ? 1 : 0;
}

int CalcflowApp::CmdStatus()
{
    auto project = OpenProject();
    if ( !project )
    {
        return 1;
    }
    auto metadata = project.value().metadata();

    for ( auto state : { calcflow::primitives::ProcessState::kPlaying,
                         calcflow::primitives::ProcessState::kFinished,
                         calcflow::primitives::ProcessState::kExcepted } )
    {
        CalcJobQuery query;
        query.where.push_back( { CalcJobField::kState, Comparison::kEq, calcflow::primitives::toString( state ) } );
        auto count = metadata->countCalcJobs( query );
        if ( !count )
        {
            return Fail( "Cannot count calcjobs", count.error() );
        }
        std::cout << fmt::format( "{:<10} {}", calcflow::primitives::toString( state ), count.value() ) << "\n";

        if ( state != calcflow::primitives::ProcessState::kPlaying )
        {
            continue;
        }
        for ( int i = static_cast<int>( calcflow::primitives::Step::kCreated );
              i < static_cast<int>( calcflow::primitives::Step::kFinished );
              ++i )
        {
            auto       step       = static_cast<calcflow::primitives::Step>( i );
            auto       step_query = query;
            step_query.where.push_back( { CalcJobField::kStep, Comparison::kEq, calcflow::primitives::toString( step ) } );
            auto step_count = metadata->countCalcJobs( step_query );
            if ( !step_count )
            {
                return Fail( "Cannot count calcjobs", step_count.error() );
            }
            if ( step_count.value() > 0 )
            {
                std::cout << fmt::format( "  {:<12} {}", calcflow::primitives::toString( step ), step_count.value() )
                          << "\n";
            }
        }
    }
    std::cout.flush();
    return 0;
}

int CalcflowApp::CmdClient()
{
    if ( m_args.size() != 1 || m_args[0] != "list" )
    {
        return Usage( "usage: calcflow client list" );
    }
    auto project = OpenProject();
    if ( !project )
    {
        return 1;
    }
    auto clients = project.value().metadata()->listClients();
    if ( !clients )
    {
        return Fail( "Cannot list clients", clients.error() );
    }
    std::cout << fmt::format( "{:<6} {:<20} {:<16} {}", "PK", "LABEL", "MACHINE", "URL" ) << "\n";
    for ( const auto &client : clients.value() )
    {
        std::cout << fmt::format( "{:<6} {:<20} {:<16} {}",
                                  client.pk,
                                  client.label,
                                  client.machine_name,
                                  client.client_url )
                  << "\n";
    }
    std::cout.flush();
    return 0;
}

int CalcflowApp::CmdCode()
{
    if ( m_args.size() != 1 || m_args[0] != "list" )
    {
        return Usage( "usage: calcflow code list" );
    }
    auto project = OpenProject();
    if ( !project )
    {
        return 1;
    }
    auto metadata = project.value().metadata();
    auto codes    = metadata->listCodes();
    if ( !codes )
    {
        return Fail( "Cannot list codes", codes.error() );
    }
    std::cout << fmt::format( "{:<6} {:<20} {:<20} {}", "PK", "LABEL", "CLIENT", "UPLOADS" ) << "\n";
    for ( const auto &code : codes.value() )
    {
        auto client = metadata->getClient( code.client_pk );
        std::cout << fmt::format( "{:<6} {:<20} {:<20} {}",
                                  code.pk,
                                  code.label,
                                  client ? client.value().label : std::to_string( code.client_pk ),
                                  code.upload_paths.size() )
                  << "\n";
    }
    std::cout.flush();
    return 0;
}

int CalcflowApp::CmdCalcJob()
{
    if ( m_args.empty() )
    {
        return Usage( "usage: calcflow calcjob list|show ..." );
    }
    const std::vector<std::string> args( m_args.begin() + 1, m_args.end() );
    if ( m_args[0] == "list" )
    {
        return CalcJobList( args );
    }
    if ( m_args[0] == "show" )
    {
        return CalcJobShow( args );
    }
    return Usage( "unknown calcjob command '" + m_args[0] + "'" );
}

int CalcflowApp::CalcJobList( const std::vector<std::string> &args )
{
    po::options_description options( "calcjob list" );
    // clang-format off
    options.add_options()
        ( "state", po::value<std::string>(), "playing, finished or excepted" )
        ( "step", po::value<std::string>(), "Current step" )
        ( "code", po::value<std::string>(), "Code label" )
        ( "limit", po::value<size_t>()->default_value( kDefaultPageSize ), "Rows per page" )
        ( "page", po::value<size_t>()->default_value( 1 ), "Page, starting at 1" );
    // clang-format on
    auto vm = ParseSubcommand( args, options, {} );
    if ( !vm )
    {
        return Usage( "bad arguments to calcjob list" );
    }
    const auto &values = vm.value();

    CalcJobQuery query;
    if ( values.count( "state" ) > 0 )
    {
        auto state = values["state"].as<std::string>();
        if ( !calcflow::primitives::stateFromString( state ) )
        {
            return Usage( "unknown state '" + state + "'" );
        }
        query.where.push_back( { CalcJobField::kState, Comparison::kEq, state } );
    }
    if ( values.count( "step" ) > 0 )
    {
        auto step = values["step"].as<std::string>();
        if ( !calcflow::primitives::stepFromString( step ) )
        {
            return Usage( "unknown step '" + step + "'" );
        }
        query.where.push_back( { CalcJobField::kStep, Comparison::kEq, step } );
    }
    if ( values.count( "code" ) > 0 )
    {
        query.where.push_back( { CalcJobField::kCodeLabel, Comparison::kEq, values["code"].as<std::string>() } );
    }
    const auto limit = values["limit"].as<size_t>();
    const auto page  = values["page"].as<size_t>();
    if ( limit == 0 || page == 0 )
    {
        return Usage( "--limit and --page start at 1" );
    }
    query.limit  = limit;
    query.offset = ( page - 1 ) * limit;

    auto project = OpenProject();
    if ( !project )
    {
        return 1;
    }
    auto metadata = project.value().metadata();
    auto total    = metadata->countCalcJobs( query );
    auto rows     = metadata->queryCalcJobs( query );
    if ( !total || !rows )
    {
        return Fail( "Cannot query calcjobs", total ? rows.error() : total.error() );
    }

    std::cout << fmt::format( "{:<6} {:<38} {:<10} {:<12} {}", "PK", "LABEL", "STATE", "STEP", "JOB" ) << "\n";
    for ( const auto &row : rows.value() )
    {
        std::cout << fmt::format( "{:<6} {:<38} {:<10} {:<12} {}",
                                  row.calcjob.pk,
                                  row.calcjob.label,
                                  calcflow::primitives::toString( row.processing.state() ),
                                  calcflow::primitives::toString( row.processing.step ),
                                  row.processing.job_id.value_or( "-" ) )
                  << "\n";
    }
    const auto pages = ( total.value() + limit - 1 ) / limit;
    std::cout << fmt::format( "page {}/{}, {} calcjobs", page, std::max<size_t>( pages, 1 ), total.value() )
              << std::endl;
    return 0;
}

int CalcflowApp::CalcJobShow( const std::vector<std::string> &args )
{
    po::options_description options( "calcjob show" );
    options.add_options()( "pk", po::value<int64_t>()->required(), "Calcjob primary key" );
    po::positional_options_description positional;
    positional.add( "pk", 1 );
    auto vm = ParseSubcommand( args, options, positional );
    if ( !vm )
    {
        return Usage( "usage: calcflow calcjob show PK" );
    }
    const auto pk = vm.value()["pk"].as<int64_t>();

    auto project = OpenProject();
    if ( !project )
    {
        return 1;
    }
    auto metadata   = project.value().metadata();
    auto calcjob    = metadata->getCalcJob( pk );
    auto processing = metadata->getProcessing( pk );
    if ( !calcjob || !processing )
    {
        return Fail( "Cannot show calcjob PK-" + std::to_string( pk ),
                     calcjob ? processing.error() : calcjob.error() );
    }
    const auto &job    = calcjob.value();
    const auto &record = processing.value();
    auto        code   = metadata->getCode( job.code_pk );

    nlohmann::json json = {
        { "pk", job.pk },
        { "label", job.label },
        { "uuid", job.uuid },
        { "code", code ? code.value().label : std::to_string( job.code_pk ) },
        { "parameters", job.parameters },
        { "upload_paths", ToJson( job.upload_paths ) },
        { "download_globs", job.download_globs },
        { "state", calcflow::primitives::toString( record.state() ) },
        { "step", calcflow::primitives::toString( record.step ) },
        { "job_id", record.job_id ? nlohmann::json( *record.job_id ) : nlohmann::json() },
        { "remote_state",
          record.remote_state ? nlohmann::json( calcflow::primitives::toString( *record.remote_state ) )
                              : nlohmann::json() },
        { "exception", record.exception ? nlohmann::json( *record.exception ) : nlohmann::json() },
        { "failed_step",
          record.failed_step ? nlohmann::json( calcflow::primitives::toString( *record.failed_step ) )
                             : nlohmann::json() },
        { "retrieved_paths", ToJson( record.retrieved_paths ) },
    };
    std::cout << json.dump( 2 ) << std::endl;
    return 0;
}

int CalcflowApp::CmdObject()
{
    if ( m_args.size() != 2 || m_args[0] != "cat" )
    {
        return Usage( "usage: calcflow object cat KEY" );
    }
    auto project = OpenProject();
    if ( !project )
    {
        return 1;
    }
    auto bytes = project.value().objects()->get( m_args[1] );
    if ( !bytes )
    {
        return Fail( "Cannot read object " + m_args[1], bytes.error() );
    }
    std::cout.write( bytes.value().data(), static_cast<std::streamsize>( bytes.value().size() ) );
    std::cout.flush();
    return 0;
}
