#include "processing/processing_engine.hpp"

#include <gtest/gtest.h>

#include <boost/algorithm/string/predicate.hpp>

#include "processing/processing_error.hpp"
#include "remote/remote_error.hpp"
#include "storage/database_error.hpp"
#include "testutil/outcome_util.hpp"
#include "testutil/processing/engine_fixture.hpp"

using namespace calcflow::processing;
using calcflow::primitives::ProcessState;
using calcflow::primitives::RemoteStatus;
using calcflow::primitives::Step;
using calcflow::remote::RemoteError;
using calcflow::storage::DatabaseError;

namespace
{
    const std::string kOwner    = "runner-test";
    const std::string kHelloKey = "0ba904eae8773b70c75333db4de2f3ac45a8ad4ddba1b242f0b3cfc199391dd8.txt";
    const auto        kLease    = std::chrono::minutes( 5 );
}

class ProcessingEngineTest : public test::EngineFixture
{
public:
    void SetUp() override
    {
        test::EngineFixture::SetUp();
        engine->SetTransitionSink( [this]( int64_t, Step from, Step to )
                                   { transitions.emplace_back( from, to ); } );
    }

    /// claims and loads a calcjob
    StepContext start( int64_t calcjob_pk )
    {
        auto claimed = metadata->claimCalcJob( calcjob_pk, kOwner, kLease );
        EXPECT_TRUE( claimed ) << claimed.error().message();
        auto context = engine->Load( calcjob_pk );
        EXPECT_TRUE( context ) << context.error().message();
        return context ? context.value() : StepContext{};
    }

    /// runs steps until @param until or a terminal step, @return the last report
    StepReport drive( StepContext &context, Step until = Step::kFinished )
    {
        StepReport report{ StepOutcome::kAdvanced, {} };
        while ( context.processing.step != until && !calcflow::primitives::isTerminal( context.processing.step ) )
        {
            report = engine->RunStep( context, kOwner, stop, false );
            if ( report.outcome != StepOutcome::kAdvanced )
            {
                break;
            }
        }
        return report;
    }

    StopSource                        stop;
    std::vector<std::pair<Step, Step>> transitions;
};

/**
 * @given a calcjob echoing "Hello world!" into output.txt
 * @when it is driven to the end
 * @then it takes every step once, finishes, and output.txt is stored by its sha256
 */
TEST_F( ProcessingEngineTest, DrivesCalcJobToFinished )
{
    auto pk      = addCalcJob( "hello" );
    auto context = start( pk );
    auto report  = drive( context );
    EXPECT_EQ( report.outcome, StepOutcome::kAdvanced );

    const std::vector<std::pair<Step, Step>> expected{ { Step::kCreated, Step::kUploading },
                                                        { Step::kUploading, Step::kSubmitting },
                                                        { Step::kSubmitting, Step::kSubmitted },
                                                        { Step::kSubmitted, Step::kPolling },
                                                        { Step::kPolling, Step::kDownloading },
                                                        { Step::kDownloading, Step::kParsing },
                                                        { Step::kParsing, Step::kFinished } };
    EXPECT_EQ( transitions, expected );

    EXPECT_OUTCOME_TRUE( processing, metadata->getProcessing( pk ) );
    EXPECT_EQ( processing.state(), ProcessState::kFinished );
    EXPECT_EQ( processing.remote_state, std::optional<RemoteStatus>( RemoteStatus::kCompleted ) );
    EXPECT_FALSE( processing.exception );
    ASSERT_EQ( processing.retrieved_paths.size(), 1 );
    EXPECT_EQ( processing.retrieved_paths.at( "output.txt" ), kHelloKey );
    EXPECT_OUTCOME_TRUE( output, objects->get( kHelloKey ) );
    EXPECT_EQ( output, "Hello world!\n" );

    const auto folder = context.calcjob.remotePath( context.client );
    EXPECT_EQ( folder, "/scratch/workflows/" + context.calcjob.uuid );
    EXPECT_EQ( cluster->FileContent( folder + "/job.sh" ),
               std::optional<std::string>( "echo 'Hello world!' > output.txt\n" ) );
    EXPECT_EQ( cluster->Jobs().size(), 1 );

    EXPECT_OUTCOME_TRUE( owner, metadata->claimOwner( pk ) );
    EXPECT_FALSE( owner );
}

/**
 * @given a calcjob expecting an output its script never writes
 * @when it is driven to the end
 * @then it excepts in the parsing step, naming the missing output
 */
TEST_F( ProcessingEngineTest, MissingOutputExceptsInParsing )
{
    auto pk      = addCalcJob( "mismatch", "Hello world!", { "output.txt", "result.dat" } );
    auto context = start( pk );
    auto report  = drive( context );
    EXPECT_EQ( report.outcome, StepOutcome::kExcepted );
    EXPECT_EQ( report.error, ProcessingError::PARSE_ERROR );

    EXPECT_OUTCOME_TRUE( processing, metadata->getProcessing( pk ) );
    EXPECT_EQ( processing.step, Step::kExcepted );
    EXPECT_EQ( processing.failed_step, std::optional<Step>( Step::kParsing ) );
    EXPECT_EQ( processing.exception,
               std::optional<std::string>( "ParseError: expected output missing (result.dat)" ) );
    // outputs retrieved before the failure stay recorded
    EXPECT_EQ( processing.retrieved_paths.at( "output.txt" ), kHelloKey );
    EXPECT_EQ( transitions.back(), std::make_pair( Step::kParsing, Step::kExcepted ) );
}

TEST_F( ProcessingEngineTest, FailedRemoteJobExcepts )
{
    auto pk = addCalcJob( "failing" );
    cluster->SetJobDuration( 5 );
    auto context = start( pk );
    drive( context, Step::kSubmitted );
    ASSERT_TRUE( context.processing.job_id );
    cluster->SetJobState( *context.processing.job_id, "NODE_FAIL" );

    auto report = drive( context );
    EXPECT_EQ( report.outcome, StepOutcome::kExcepted );
    EXPECT_OUTCOME_TRUE( processing, metadata->getProcessing( pk ) );
    EXPECT_EQ( processing.remote_state, std::optional<RemoteStatus>( RemoteStatus::kFailed ) );
    EXPECT_EQ( processing.exception,
               std::optional<std::string>( "ParseError: remote job did not complete (failed)" ) );
}

/**
 * @given a calcjob whose driver went away after the submission was recorded
 * @when another driver loads it and continues
 * @then the job is polled, never submitted again
 */
TEST_F( ProcessingEngineTest, ResumeFromSubmittedDoesNotResubmit )
{
    auto pk = addCalcJob( "resumed" );
    {
        auto context = start( pk );
        drive( context, Step::kSubmitted );
        EXPECT_EQ( context.processing.step, Step::kSubmitted );
    }
    EXPECT_OUTCOME_TRUE( stored, metadata->getProcessing( pk ) );
    EXPECT_EQ( stored.step, Step::kSubmitted );
    EXPECT_EQ( stored.job_id, std::optional<std::string>( "1000" ) );

    auto resumed = start( pk );
    EXPECT_EQ( resumed.processing.job_id, std::optional<std::string>( "1000" ) );
    drive( resumed );

    EXPECT_EQ( resumed.processing.step, Step::kFinished );
    EXPECT_EQ( cluster->CountRequests( "POST", "/compute/" ), 1 );
    EXPECT_EQ( cluster->Jobs().size(), 1 );
}

TEST_F( ProcessingEngineTest, ResumeFromPollingDownloadsOnce )
{
    auto pk = addCalcJob( "resumed-polling" );
    {
        auto context = start( pk );
        drive( context, Step::kPolling );
    }
    const auto polls = cluster->CountRequests( "GET", "/compute/" );

    auto resumed = start( pk );
    EXPECT_EQ( resumed.processing.step, Step::kPolling );
    EXPECT_EQ( resumed.processing.remote_state, std::optional<RemoteStatus>( RemoteStatus::kCompleted ) );
    drive( resumed );

    EXPECT_EQ( resumed.processing.step, Step::kFinished );
    EXPECT_EQ( cluster->CountRequests( "GET", "/compute/" ), polls );
    EXPECT_EQ( cluster->CountRequests( "POST", "/compute/" ), 1 );
}

/**
 * @given an access token which expires right before the submission
 * @when the submitting step runs
 * @then the token is refreshed and the calcjob is submitted exactly once
 */
TEST_F( ProcessingEngineTest, ExpiredTokenDuringSubmissionSubmitsOnce )
{
    auto pk      = addCalcJob( "expired-token" );
    auto context = start( pk );
    drive( context, Step::kSubmitting );
    ASSERT_EQ( context.processing.step, Step::kSubmitting );
    cluster->RevokeTokens();

    auto report = engine->RunStep( context, kOwner, stop, false );
    EXPECT_EQ( report.outcome, StepOutcome::kAdvanced );

    EXPECT_OUTCOME_TRUE( processing, metadata->getProcessing( pk ) );
    EXPECT_EQ( processing.step, Step::kSubmitted );
    ASSERT_TRUE( processing.job_id );
    ASSERT_EQ( cluster->Jobs().size(), 1 );
    EXPECT_EQ( cluster->Jobs()[0].id, processing.job_id.value() );
    // the rejected request and the one sent with the new token
    EXPECT_EQ( cluster->CountRequests( "POST", "/compute/" ), 2 );
}

/**
 * @given an upload which fails with a server error
 * @when the step may be retried
 * @then the calcjob keeps its step, and the next attempt advances
 */
TEST_F( ProcessingEngineTest, TransientFailureIsLeftForRetry )
{
    auto pk      = addCalcJob( "flaky" );
    auto context = start( pk );
    drive( context, Step::kUploading );
    cluster->InjectStatus( "POST", "/ops/upload", 503 );

    auto report = engine->RunStep( context, kOwner, stop, true );
    EXPECT_EQ( report.outcome, StepOutcome::kRetry );
    EXPECT_EQ( report.error, RemoteError::SERVER_ERROR );
    EXPECT_EQ( context.processing.step, Step::kUploading );
    EXPECT_OUTCOME_TRUE( stored, metadata->getProcessing( pk ) );
    EXPECT_EQ( stored.step, Step::kUploading );

    report = engine->RunStep( context, kOwner, stop, true );
    EXPECT_EQ( report.outcome, StepOutcome::kAdvanced );
    EXPECT_EQ( context.processing.step, Step::kSubmitting );
}

/**
 * @given an upload which keeps failing
 * @when no retry is left
 * @then the calcjob excepts with a transfer error in the uploading step
 */
TEST_F( ProcessingEngineTest, ExhaustedRetriesExcept )
{
    auto pk      = addCalcJob( "broken-upload" );
    auto context = start( pk );
    drive( context, Step::kUploading );
    cluster->InjectTimeout( "POST", "/ops/upload" );

    auto report = engine->RunStep( context, kOwner, stop, false );
    EXPECT_EQ( report.outcome, StepOutcome::kExcepted );
    EXPECT_EQ( report.error, RemoteError::TIMEOUT );

    EXPECT_OUTCOME_TRUE( processing, metadata->getProcessing( pk ) );
    EXPECT_EQ( processing.failed_step, std::optional<Step>( Step::kUploading ) );
    ASSERT_TRUE( processing.exception );
    EXPECT_TRUE( boost::algorithm::starts_with( *processing.exception, "TransferError: " ) )
        << *processing.exception;
    EXPECT_TRUE( boost::algorithm::ends_with( *processing.exception, "(job.sh)" ) ) << *processing.exception;
    EXPECT_TRUE( cluster->Jobs().empty() );
}

TEST_F( ProcessingEngineTest, TemplateErrorExceptsInCreated )
{
    calcflow::primitives::CalcJob calcjob;
    calcjob.label   = "no-text";
    calcjob.code_pk = echo_code_pk;
    EXPECT_OUTCOME_TRUE( pk, metadata->insertCalcJob( calcjob ) );

    auto context = start( pk );
    auto report  = drive( context );
    EXPECT_EQ( report.outcome, StepOutcome::kExcepted );
    EXPECT_OUTCOME_TRUE( processing, metadata->getProcessing( pk ) );
    EXPECT_EQ( processing.failed_step, std::optional<Step>( Step::kCreated ) );
    EXPECT_EQ( processing.exception,
               std::optional<std::string>( "TemplateError: job script cannot be rendered (parameters.text)" ) );
    EXPECT_TRUE( cluster->Requests().empty() );
}

/**
 * @given a calcjob claimed by another runner
 * @when this engine runs its step
 * @then nothing is recorded and the claim is reported lost
 */
TEST_F( ProcessingEngineTest, ForeignClaimIsRespected )
{
    auto pk = addCalcJob( "foreign" );
    EXPECT_OUTCOME_TRUE_1( metadata->claimCalcJob( pk, "runner-other", kLease ) );
    EXPECT_OUTCOME_TRUE( context, engine->Load( pk ) );

    auto report = engine->RunStep( context, kOwner, stop, true );
    EXPECT_EQ( report.outcome, StepOutcome::kLostClaim );
    EXPECT_EQ( report.error, DatabaseError::CONCURRENCY_VIOLATION );
    EXPECT_OUTCOME_TRUE( processing, metadata->getProcessing( pk ) );
    EXPECT_EQ( processing.step, Step::kCreated );
    EXPECT_TRUE( transitions.empty() );
}

/**
 * @given a calcjob whose remote job keeps running
 * @when a stop is requested while it is polled
 * @then the step is interrupted and the calcjob stays submitted
 */
TEST_F( ProcessingEngineTest, StopInterruptsPolling )
{
    cluster->SetJobDuration( 1000000 );
    auto pk      = addCalcJob( "long" );
    auto context = start( pk );
    drive( context, Step::kSubmitted );

    stop.RequestStop();
    auto report = engine->RunStep( context, kOwner, stop, true );
    EXPECT_EQ( report.outcome, StepOutcome::kStopped );
    EXPECT_OUTCOME_TRUE( processing, metadata->getProcessing( pk ) );
    EXPECT_EQ( processing.step, Step::kSubmitted );
    EXPECT_FALSE( processing.remote_state );
}

TEST_F( ProcessingEngineTest, StepTableIsLinear )
{
    const auto &table = engine->Transitions();
    ASSERT_EQ( table.size(), 7 );
    for ( const auto &[from, transition] : table )
    {
        EXPECT_EQ( static_cast<int>( transition.next ), static_cast<int>( from ) + 1 );
        EXPECT_TRUE( transition.action );
    }
    EXPECT_EQ( table.count( Step::kFinished ), 0 );
    EXPECT_EQ( table.count( Step::kExcepted ), 0 );
}

TEST( FailureKindTest, KindsFollowTheFailingStep )
{
    EXPECT_EQ( FailureKind( Step::kUploading, RemoteError::TIMEOUT ), "TransferError" );
    EXPECT_EQ( FailureKind( Step::kPolling, RemoteError::NOT_FOUND ), "TransferError" );
    EXPECT_EQ( FailureKind( Step::kSubmitting, RemoteError::CLIENT_ERROR ), "SubmissionError" );
    EXPECT_EQ( FailureKind( Step::kSubmitted, RemoteError::JOB_UNKNOWN ), "PollError" );
    EXPECT_EQ( FailureKind( Step::kParsing, ProcessingError::PARSE_ERROR ), "ParseError" );
    EXPECT_EQ( FailureKind( Step::kUploading, DatabaseError::NOT_FOUND ), "NotFound" );
    EXPECT_EQ( FailureKind( Step::kPolling, DatabaseError::CONCURRENCY_VIOLATION ), "ConcurrencyViolation" );

    EXPECT_TRUE( IsTransientFailure( RemoteError::TIMEOUT ) );
    EXPECT_TRUE( IsTransientFailure( RemoteError::SERVER_ERROR ) );
    EXPECT_TRUE( IsTransientFailure( DatabaseError::BUSY ) );
    EXPECT_FALSE( IsTransientFailure( RemoteError::CLIENT_ERROR ) );
    EXPECT_FALSE( IsTransientFailure( ProcessingError::PARSE_ERROR ) );
}
