#include "remote/glob_match.hpp"

#include <gtest/gtest.h>

using namespace calcflow::remote;

TEST( GlobMatchTest, SingleSegmentPatterns )
{
    EXPECT_TRUE( GlobMatch( "*.txt", "output.txt" ) );
    EXPECT_TRUE( GlobMatch( "output.txt", "./output.txt" ) );
    EXPECT_TRUE( GlobMatch( "out?ut.[tc]xt", "output.cxt" ) );
    EXPECT_FALSE( GlobMatch( "*.txt", "output.dat" ) );
    // a wildcard does not cross directories
    EXPECT_FALSE( GlobMatch( "*.txt", "logs/output.txt" ) );
    // nor does it match hidden files
    EXPECT_FALSE( GlobMatch( "*", ".hidden" ) );
}

TEST( GlobMatchTest, AnyDepthPatterns )
{
    EXPECT_TRUE( GlobMatch( "**/*.txt", "output.txt" ) );
    EXPECT_TRUE( GlobMatch( "**/*.txt", "a/b/c/output.txt" ) );
    EXPECT_TRUE( GlobMatch( "logs/**", "logs/a/b.log" ) );
    EXPECT_TRUE( GlobMatch( "logs/**/err.log", "logs/err.log" ) );
    EXPECT_FALSE( GlobMatch( "logs/**/err.log", "other/err.log" ) );
    EXPECT_TRUE( GlobMatchAny( { "*.dat", "**/*.txt" }, "x/y.txt" ) );
    EXPECT_FALSE( GlobMatchAny( {}, "x/y.txt" ) );
}

/**
 * @given patterns with directory segments
 * @when a listing asks whether to descend into a directory
 * @then only directories which could contain a match are entered
 */
TEST( GlobMatchTest, PrunesDirectories )
{
    EXPECT_TRUE( GlobMayMatchBelow( "logs/*.log", "logs" ) );
    EXPECT_FALSE( GlobMayMatchBelow( "logs/*.log", "data" ) );
    EXPECT_FALSE( GlobMayMatchBelow( "*.txt", "data" ) );
    EXPECT_TRUE( GlobMayMatchBelow( "**/*.txt", "data/deep" ) );
    EXPECT_TRUE( GlobMayMatchBelow( "*/out/*.txt", "run1/out" ) );
    EXPECT_FALSE( GlobMayMatchBelow( "*/out/*.txt", "run1/out/more" ) );
}
