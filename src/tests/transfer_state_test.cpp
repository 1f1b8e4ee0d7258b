#include <gtest/gtest.h>
#include <sstream>
#include "transfer/transfer_state.hpp"

using namespace blobxfer::transfer;
using State = TransferState::State;

class TransferStateTest : public ::testing::Test {
protected:
    TransferState state;
};

TEST_F(TransferStateTest, InitialState) {
    EXPECT_EQ(state.get_state(), State::IDLE);
    EXPECT_EQ(state.get_state_string(), "IDLE");
    EXPECT_FALSE(state.has_started());
    EXPECT_FALSE(state.is_terminal());
}

TEST_F(TransferStateTest, DownloadLifecycle) {
    EXPECT_TRUE(state.transition_to(State::STARTED));
    EXPECT_TRUE(state.transition_to(State::DOWNLOADING));
    EXPECT_TRUE(state.transition_to(State::FINALIZING));
    EXPECT_TRUE(state.transition_to(State::SUCCEEDED));
    EXPECT_TRUE(state.is_terminal());
}

TEST_F(TransferStateTest, UploadSkipsDownloadStates) {
    EXPECT_TRUE(state.transition_to(State::STARTED));
    EXPECT_TRUE(state.transition_to(State::SUCCEEDED));
}

TEST_F(TransferStateTest, InvalidTransitions) {
    // Work has to be started first
    EXPECT_FALSE(state.transition_to(State::DOWNLOADING));
    EXPECT_FALSE(state.transition_to(State::SUCCEEDED));
    EXPECT_FALSE(state.transition_to(State::FAILED));
    EXPECT_EQ(state.get_state(), State::IDLE);

    EXPECT_TRUE(state.transition_to(State::STARTED));
    EXPECT_FALSE(state.transition_to(State::FINALIZING));

    EXPECT_TRUE(state.transition_to(State::DOWNLOADING));
    EXPECT_FALSE(state.transition_to(State::SUCCEEDED));
    EXPECT_EQ(state.get_state(), State::DOWNLOADING);
}

TEST_F(TransferStateTest, CancelFromEveryActiveState) {
    for (State active : {State::IDLE, State::STARTED, State::DOWNLOADING, State::FINALIZING}) {
        EXPECT_TRUE(TransferState::is_valid_transition(active, State::CANCELLED))
            << TransferState::state_to_string(active);
    }
}

TEST_F(TransferStateTest, TerminalStatesAreFinal) {
    for (State terminal : {State::SUCCEEDED, State::FAILED, State::CANCELLED}) {
        for (State next : {State::IDLE, State::STARTED, State::DOWNLOADING, State::FINALIZING,
                           State::SUCCEEDED, State::FAILED, State::CANCELLED}) {
            EXPECT_FALSE(TransferState::is_valid_transition(terminal, next))
                << terminal << " -> " << next;
        }
    }
}

TEST_F(TransferStateTest, StreamOperator) {
    std::ostringstream os;
    os << State::FINALIZING;
    EXPECT_EQ(os.str(), "FINALIZING");
}
