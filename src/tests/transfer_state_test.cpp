#include <gtest/gtest.h>
#include <stdexcept>
#include "transfer/transfer_error.hpp"
#include "transfer/transfer_state.hpp"
#include "transfer/transfer_types.hpp"

using namespace fstore::transfer;
using fstore::session::RemoteStatus;
using fstore::session::SessionError;
using fstore::session::SessionErrorCode;

TEST(TransferStateTest, PushFollowsLinearChain) {
    StateTracker<PushState> tracker("Test", PushState::INIT);
    tracker.advance(PushState::NEGOTIATING);
    tracker.advance(PushState::STREAMING);
    tracker.advance(PushState::FINALIZING);
    tracker.advance(PushState::DONE);
    EXPECT_EQ(tracker.get(), PushState::DONE);
}

TEST(TransferStateTest, SkippingAStateThrows) {
    StateTracker<PushState> tracker("Test", PushState::INIT);
    EXPECT_THROW(tracker.advance(PushState::STREAMING), std::logic_error);
    EXPECT_EQ(tracker.get(), PushState::INIT);

    StateTracker<PullState> pull("Test", PullState::INIT);
    EXPECT_THROW(pull.advance(PullState::DONE), std::logic_error);
}

TEST(TransferStateTest, FailIsIgnoredOnceTerminal) {
    StateTracker<PullState> tracker("Test", PullState::INIT);
    tracker.advance(PullState::OPENING);
    tracker.fail(PullState::FAILED);
    EXPECT_EQ(tracker.get(), PullState::FAILED);

    tracker.fail(PullState::FAILED);
    EXPECT_EQ(tracker.get(), PullState::FAILED);
    EXPECT_THROW(tracker.advance(PullState::TRANSFERRING), std::logic_error);
}

TEST(TransferStateTest, DoneCannotFail) {
    EXPECT_FALSE(is_valid_transition(PushState::DONE, PushState::FAILED));
    EXPECT_TRUE(is_valid_transition(PushState::INIT, PushState::FAILED));
    EXPECT_TRUE(is_valid_transition(PullState::CLOSING, PullState::FAILED));
}

TEST(TransferStateTest, Names) {
    EXPECT_STREQ(state_to_string(PushState::STREAMING), "Streaming");
    EXPECT_STREQ(state_to_string(PullState::TRANSFERRING), "Transferring");
    EXPECT_STREQ(error_kind_to_string(ErrorKind::HASH_MISMATCH), "HashMismatch");
    EXPECT_STREQ(outcome_to_string(Outcome::SKIPPED), "Skipped");
}

TEST(TransferErrorTest, ClassifiesSessionErrors) {
    EXPECT_EQ(classify(SessionError(SessionErrorCode::TIMEOUT, "t")), ErrorKind::TRANSPORT_ERROR);
    EXPECT_EQ(classify(SessionError(SessionErrorCode::CONNECTION_LOST, "l")), ErrorKind::TRANSPORT_ERROR);
    EXPECT_EQ(classify(SessionError(SessionErrorCode::PROTOCOL, "p")), ErrorKind::TRANSPORT_ERROR);
    EXPECT_EQ(classify(SessionError(RemoteStatus::ALREADY_EXISTS, "x")), ErrorKind::ALREADY_EXISTS);
    EXPECT_EQ(classify(SessionError(RemoteStatus::NOT_FOUND, "x")), ErrorKind::REMOTE_REJECTED);
    EXPECT_EQ(classify(SessionError(RemoteStatus::REJECTED, "x")), ErrorKind::REMOTE_REJECTED);
}

TEST(TransferReportTest, CountsAndSuccess) {
    TransferReport report;
    FileResult ok;
    ok.outcome = Outcome::SUCCESS;
    FileResult skipped;
    skipped.outcome = Outcome::SKIPPED;
    report.results = {ok, skipped, ok};

    EXPECT_EQ(report.count(Outcome::SUCCESS), 2u);
    EXPECT_TRUE(report.succeeded());

    FileResult failed;
    failed.outcome = Outcome::FAILED;
    failed.error = ErrorKind::LOCAL_IO;
    report.results.push_back(failed);
    EXPECT_FALSE(report.succeeded());
    EXPECT_FALSE(failed.ok());
}
