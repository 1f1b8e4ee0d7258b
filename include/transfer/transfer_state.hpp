#ifndef BLOBXFER_TRANSFER_STATE_HPP
#define BLOBXFER_TRANSFER_STATE_HPP

#include <ostream>
#include <string>

namespace blobxfer::transfer {

/**
 * TransferState tracks the lifecycle of one transfer and rejects invalid transitions.
 * Uploads and deletions only use IDLE, STARTED and the terminal states; downloads
 * pass through DOWNLOADING and FINALIZING as well.
 */
class TransferState {
public:
    /**
     * Transfer states:
     * IDLE        - Created, no backend work requested yet
     * STARTED     - Start requested, backend task being set up
     * DOWNLOADING - Backend is writing the object to a temporary file
     * FINALIZING  - Decrypting and placing the downloaded file
     * SUCCEEDED   - Completed successfully (terminal)
     * FAILED      - Completed with an error (terminal)
     * CANCELLED   - Cancelled by the caller (terminal)
     */
    enum class State {
        IDLE,
        STARTED,
        DOWNLOADING,
        FINALIZING,
        SUCCEEDED,
        FAILED,
        CANCELLED
    };

    TransferState() : current_state_(State::IDLE) {}

    State get_state() const { return current_state_; }

    bool is_terminal() const {
        return current_state_ == State::SUCCEEDED ||
               current_state_ == State::FAILED ||
               current_state_ == State::CANCELLED;
    }

    // True once start was requested, including every terminal state reached from it
    bool has_started() const {
        return current_state_ != State::IDLE;
    }

    /**
     * Attempt to transition to a new state.
     * @param new_state The target state
     * @return true if transition was successful, false if invalid
     */
    bool transition_to(State new_state) {
        if (!is_valid_transition(current_state_, new_state)) {
            return false;
        }
        current_state_ = new_state;
        return true;
    }

    static bool is_valid_transition(State from, State to) {
        switch (from) {
            case State::IDLE:
                return to == State::STARTED ||
                       to == State::CANCELLED;

            case State::STARTED:
                return to == State::DOWNLOADING ||
                       to == State::SUCCEEDED ||
                       to == State::FAILED ||
                       to == State::CANCELLED;

            case State::DOWNLOADING:
                return to == State::FINALIZING ||
                       to == State::FAILED ||
                       to == State::CANCELLED;

            case State::FINALIZING:
                return to == State::SUCCEEDED ||
                       to == State::FAILED ||
                       to == State::CANCELLED;

            case State::SUCCEEDED:
            case State::FAILED:
            case State::CANCELLED:
                return false;  // Terminal states are final

            default:
                return false;
        }
    }

    static std::string state_to_string(State state) {
        switch (state) {
            case State::IDLE:        return "IDLE";
            case State::STARTED:     return "STARTED";
            case State::DOWNLOADING: return "DOWNLOADING";
            case State::FINALIZING:  return "FINALIZING";
            case State::SUCCEEDED:   return "SUCCEEDED";
            case State::FAILED:      return "FAILED";
            case State::CANCELLED:   return "CANCELLED";
            default:                 return "UNKNOWN";
        }
    }

    std::string get_state_string() const {
        return state_to_string(current_state_);
    }

private:
    State current_state_;
};

// Stream operator for TransferState::State to support test assertions and logging
inline std::ostream& operator<<(std::ostream& os, const TransferState::State& state) {
    os << TransferState::state_to_string(state);
    return os;
}

} // namespace blobxfer::transfer

#endif // BLOBXFER_TRANSFER_STATE_HPP
