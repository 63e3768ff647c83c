#include "remote/url.hpp"

#include <gtest/gtest.h>

#include "remote/remote_error.hpp"
#include "testutil/outcome_util.hpp"

using namespace calcflow::remote;

/**
 * @given absolute urls with and without port and base path
 * @when they are parsed
 * @then scheme, host, port and base path are split out
 */
TEST( UrlTest, ParsesAbsoluteUrls )
{
    EXPECT_OUTCOME_TRUE( api, parseUrl( "https://api.cluster.example/firecrest/v1/" ) );
    EXPECT_TRUE( api.isTls() );
    EXPECT_EQ( api.host, "api.cluster.example" );
    EXPECT_EQ( api.port, "443" );
    EXPECT_EQ( api.base_path, "/firecrest/v1" );
    EXPECT_EQ( api.origin(), "https://api.cluster.example:443" );

    EXPECT_OUTCOME_TRUE( local, parseUrl( "http://localhost:8000" ) );
    EXPECT_FALSE( local.isTls() );
    EXPECT_EQ( local.host, "localhost" );
    EXPECT_EQ( local.port, "8000" );
    EXPECT_EQ( local.base_path, "" );
    EXPECT_EQ( local.target( "" ), "/" );
}

/**
 * @given malformed urls
 * @when they are parsed
 * @then they are rejected
 */
TEST( UrlTest, RejectsMalformedUrls )
{
    EXPECT_OUTCOME_ERROR( parseUrl( "ftp://host/path" ), RemoteError::INVALID_URL );
    EXPECT_OUTCOME_ERROR( parseUrl( "api.cluster.example" ), RemoteError::INVALID_URL );
    EXPECT_OUTCOME_ERROR( parseUrl( "https://" ), RemoteError::INVALID_URL );
    EXPECT_OUTCOME_ERROR( parseUrl( "https://host:port/" ), RemoteError::INVALID_URL );
    EXPECT_OUTCOME_ERROR( parseUrl( "https://user@host/" ), RemoteError::INVALID_URL );
    EXPECT_OUTCOME_ERROR( parseUrl( "https://host/path?x=1" ), RemoteError::INVALID_URL );
}

/**
 * @given a parsed url with a base path
 * @when a request target is built with query parameters
 * @then the path is joined below the base path and the query is encoded
 */
TEST( UrlTest, BuildsTargets )
{
    EXPECT_OUTCOME_TRUE( api, parseUrl( "https://api.cluster.example/v1" ) );
    EXPECT_EQ( api.target( "/compute/daint/jobs" ), "/v1/compute/daint/jobs" );
    EXPECT_EQ( api.target( "status", { { "jobids", "1,2" } } ), "/v1/status?jobids=1%2C2" );
    EXPECT_EQ( api.target( "/filesystem/daint/ops/ls", { { "path", "/scratch/a b" }, { "showhidden", "true" } } ),
               "/v1/filesystem/daint/ops/ls?path=/scratch/a%20b&showhidden=true" );
}

TEST( UrlTest, FormEncoding )
{
    EXPECT_EQ( urlEncode( "a-b_c.d~e" ), "a-b_c.d~e" );
    EXPECT_EQ( urlEncode( "s3cr&t=+" ), "s3cr%26t%3D%2B" );
    EXPECT_EQ( formEncode( { { "grant_type", "client_credentials" }, { "client_id", "my id" } } ),
               "grant_type=client_credentials&client_id=my%20id" );
}
