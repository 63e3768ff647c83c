#include "storage/project_loader.hpp"

#include <gtest/gtest.h>

#include "storage/database_error.hpp"
#include "storage/project.hpp"
#include "testutil/outcome_util.hpp"
#include "testutil/storage/base_fs_test.hpp"

using namespace calcflow::storage;
using nlohmann::json;

namespace
{
    const std::string kHelloKey = "0ba904eae8773b70c75333db4de2f3ac45a8ad4ddba1b242f0b3cfc199391dd8.txt";

    json makeDocument()
    {
        return json::parse( R"({
          "objects": {
            "hello": {"content": "Hello world!\n"},
            "input": {"path": "data/input.dat", "extension": "dat"}
          },
          "clients": [{
            "label": "cluster",
            "client_url": "https://api.cluster.example/v1",
            "client_id": "id",
            "client_secret": "secret",
            "token_uri": "https://auth.cluster.example/token",
            "machine_name": "daint",
            "work_dir": "/scratch/user",
            "small_file_size_mb": 1
          }],
          "codes": [{
            "label": "echo",
            "client_label": "cluster",
            "script": "cat input.dat > output.txt",
            "upload_paths": {"input.dat": {"label": "input"}, "logs": null}
          }],
          "calcjobs": [
            {"code_label": "echo", "label": "first",
             "parameters": {"n": 3, "name": "x"},
             "upload_paths": {"greeting.txt": {"key": ")" + kHelloKey + R"("}},
             "download_globs": ["*.txt"]},
            {"code_label": "echo"}
          ]
        })" );
    }
}

class ProjectLoaderTest : public test::FSFixture
{
public:
    ProjectLoaderTest() : test::FSFixture( "calcflow_project_loader_test" )
    {
    }

    void SetUp() override
    {
        test::FSFixture::SetUp();
        auto project = Project::init( base_path / "project" );
        ASSERT_TRUE( project ) << project.error().message();
        objects  = project.value().objects();
        metadata = project.value().metadata();
        loader   = std::make_unique<ProjectLoader>( objects, metadata );
        writeFile( "data/input.dat", "42\n" );
    }

    std::shared_ptr<ContentStore>  objects;
    std::shared_ptr<MetadataStore> metadata;
    std::unique_ptr<ProjectLoader> loader;
};

/**
 * @given a document with objects, a client, a code and calcjobs
 * @when it is loaded
 * @then every item is stored and references resolve to object keys
 */
TEST_F( ProjectLoaderTest, LoadsAllSections )
{
    EXPECT_OUTCOME_TRUE( rows, loader->load( makeDocument(), base_path ) );
    ASSERT_EQ( rows.objects.size(), 2 );
    EXPECT_EQ( rows.objects.at( "hello" ), kHelloKey );
    EXPECT_EQ( rows.clients.size(), 1 );
    EXPECT_EQ( rows.codes.size(), 1 );
    ASSERT_EQ( rows.calcjobs.size(), 2 );

    EXPECT_OUTCOME_TRUE( input, objects->get( rows.objects.at( "input" ) ) );
    EXPECT_EQ( input, "42\n" );

    EXPECT_OUTCOME_TRUE( client, metadata->getClientByLabel( "cluster" ) );
    EXPECT_EQ( client.small_file_size_mb, 1 );

    EXPECT_OUTCOME_TRUE( code, metadata->getCodeByLabel( "echo" ) );
    EXPECT_EQ( code.client_pk, client.pk );
    EXPECT_EQ( code.upload_paths.at( "input.dat" ), rows.objects.at( "input" ) );
    EXPECT_FALSE( code.upload_paths.at( "logs" ) );

    EXPECT_OUTCOME_TRUE( first, metadata->getCalcJob( rows.calcjobs[0] ) );
    EXPECT_EQ( first.label, "first" );
    EXPECT_EQ( first.parameters.at( "n" ), "3" );
    EXPECT_EQ( first.parameters.at( "name" ), "x" );
    EXPECT_EQ( first.upload_paths.at( "greeting.txt" ), kHelloKey );
    EXPECT_EQ( first.download_globs, std::vector<std::string>{ "*.txt" } );

    EXPECT_OUTCOME_TRUE( second, metadata->getCalcJob( rows.calcjobs[1] ) );
    EXPECT_EQ( second.label, second.uuid );
}

/**
 * @given a document whose last calcjob names an unknown code
 * @when it is loaded
 * @then nothing is inserted
 */
TEST_F( ProjectLoaderTest, RejectedItemRollsBackEverything )
{
    auto document = makeDocument();
    document["calcjobs"].push_back( { { "code_label", "missing" } } );

    EXPECT_OUTCOME_ERROR( loader->load( document, base_path ), LoaderError::UNKNOWN_LABEL );

    EXPECT_OUTCOME_TRUE( clients, metadata->listClients() );
    EXPECT_TRUE( clients.empty() );
    EXPECT_OUTCOME_TRUE( codes, metadata->listCodes() );
    EXPECT_TRUE( codes.empty() );
    EXPECT_OUTCOME_TRUE( count, metadata->countCalcJobs( CalcJobQuery{} ) );
    EXPECT_EQ( count, 0 );
}

/**
 * @given upload references to keys which are not stored
 * @when the document is loaded
 * @then it is rejected as a missing object
 */
TEST_F( ProjectLoaderTest, UnknownObjectKeyIsRejected )
{
    auto document = makeDocument();
    document["calcjobs"][0]["upload_paths"]["greeting.txt"]["key"] = std::string( 64, 'f' ) + ".txt";
    document.erase( "objects" );
    document["codes"][0].erase( "upload_paths" );

    EXPECT_OUTCOME_ERROR( loader->load( document, base_path ), LoaderError::MISSING_OBJECT );
}

/**
 * @given malformed documents
 * @when they are loaded
 * @then they are rejected with the matching error
 */
TEST_F( ProjectLoaderTest, MalformedDocuments )
{
    EXPECT_OUTCOME_ERROR( loader->load( json::array(), base_path ), LoaderError::INVALID_DOCUMENT );
    EXPECT_OUTCOME_ERROR( loader->load( json{ { "clients", json::object() } }, base_path ),
                          LoaderError::INVALID_DOCUMENT );

    auto no_url = makeDocument();
    no_url["clients"][0].erase( "client_url" );
    EXPECT_OUTCOME_ERROR( loader->load( no_url, base_path ), LoaderError::INVALID_ITEM );

    auto no_file = makeDocument();
    no_file["objects"]["input"]["path"] = "data/absent.dat";
    EXPECT_OUTCOME_ERROR( loader->load( no_file, base_path ), LoaderError::UNREADABLE_FILE );

    auto escaping = makeDocument();
    escaping["codes"][0]["upload_paths"] = { { "../up", nullptr } };
    EXPECT_OUTCOME_ERROR( loader->load( escaping, base_path ), LoaderError::REJECTED );

    writeFile( "broken.json", "{ not json" );
    EXPECT_OUTCOME_ERROR( loader->loadFile( base_path / "broken.json" ), LoaderError::INVALID_DOCUMENT );
    EXPECT_OUTCOME_ERROR( loader->loadFile( base_path / "absent.json" ), LoaderError::UNREADABLE_FILE );
}

/**
 * @given a document file next to its data folder
 * @when it is loaded from its path
 * @then relative object paths resolve against the document folder
 */
TEST_F( ProjectLoaderTest, LoadFileResolvesRelativePaths )
{
    writeFile( "calcjobs.json", makeDocument().dump() );
    EXPECT_OUTCOME_TRUE( rows, loader->loadFile( base_path / "calcjobs.json" ) );
    EXPECT_EQ( rows.calcjobs.size(), 2 );
}

/**
 * @given a folder which holds no project
 * @when it is opened, then initialised and reopened
 * @then opening fails first and afterwards sees the stored rows
 */
TEST_F( ProjectLoaderTest, ProjectInitAndOpen )
{
    EXPECT_OUTCOME_ERROR( Project::open( base_path / "other" ), DatabaseError::NOT_FOUND );

    EXPECT_OUTCOME_TRUE_1( loader->load( makeDocument(), base_path ) );
    metadata.reset();
    objects.reset();
    loader.reset();

    EXPECT_OUTCOME_TRUE( project, Project::open( base_path / "project" ) );
    EXPECT_EQ( project.configPath(), base_path / "project" / Project::kConfigFile );
    EXPECT_TRUE( project.objects()->exists( kHelloKey ) );
    EXPECT_OUTCOME_TRUE( count, project.metadata()->countCalcJobs( CalcJobQuery{} ) );
    EXPECT_EQ( count, 2 );
}
