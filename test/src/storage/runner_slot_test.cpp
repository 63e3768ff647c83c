#include "storage/runner_slot.hpp"

#include <gtest/gtest.h>

#include <boost/algorithm/string/predicate.hpp>

#include "storage/database_error.hpp"
#include "testutil/outcome_util.hpp"
#include "testutil/storage/base_fs_test.hpp"

using calcflow::storage::DatabaseError;
using calcflow::storage::RunnerSlot;

class RunnerSlotTest : public test::FSFixture
{
public:
    RunnerSlotTest() : test::FSFixture( "calcflow_runner_slot_test" )
    {
    }
};

/**
 * @given a project whose first runner slot is held
 * @when another slot is acquired
 * @then it gets a different owner name
 */
TEST_F( RunnerSlotTest, HeldSlotsHaveDistinctOwners )
{
    EXPECT_OUTCOME_TRUE( first, RunnerSlot::acquire( base_path ) );
    EXPECT_OUTCOME_TRUE( second, RunnerSlot::acquire( base_path ) );
    EXPECT_TRUE( boost::algorithm::ends_with( first->owner(), "-0" ) );
    EXPECT_TRUE( boost::algorithm::ends_with( second->owner(), "-1" ) );
    EXPECT_TRUE( boost::algorithm::starts_with( first->owner(), "runner-" ) );
    EXPECT_TRUE( fs::exists( base_path / RunnerSlot::kRunnersFolder ) );
}

/**
 * @given a runner slot which was freed
 * @when a slot is acquired again
 * @then the former owner name is reused
 */
TEST_F( RunnerSlotTest, FreedSlotKeepsItsOwner )
{
    std::string owner;
    {
        EXPECT_OUTCOME_TRUE( slot, RunnerSlot::acquire( base_path ) );
        owner = slot->owner();
    }
    EXPECT_OUTCOME_TRUE( again, RunnerSlot::acquire( base_path ) );
    EXPECT_EQ( again->owner(), owner );
}

TEST_F( RunnerSlotTest, AllSlotsHeld )
{
    EXPECT_OUTCOME_TRUE( only, RunnerSlot::acquire( base_path, 1 ) );
    EXPECT_FALSE( only->owner().empty() );
    EXPECT_OUTCOME_ERROR( RunnerSlot::acquire( base_path, 1 ), DatabaseError::BUSY );
}
