#ifndef FSTORE_SESSION_CONNECTION_STATE_HPP
#define FSTORE_SESSION_CONNECTION_STATE_HPP

#include <ostream>
#include <string>

namespace fstore {
namespace session {

/**
 * Lifecycle of a client session. Transitions are validated; an invalid
 * request leaves the state unchanged.
 *
 * IDLE -> CONNECTING -> HANDSHAKING -> READY -> CLOSING -> CLOSED
 * Any non-terminal state may fall into FAILED. FAILED and CLOSED are terminal.
 */
class ConnectionState {
public:
    enum class State {
        IDLE,
        CONNECTING,
        HANDSHAKING,
        READY,
        CLOSING,
        CLOSED,
        FAILED
    };

    ConnectionState() : current_state_(State::IDLE) {}

    State get_state() const { return current_state_; }

    bool is_terminal() const {
        return current_state_ == State::CLOSED || current_state_ == State::FAILED;
    }

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
                return to == State::CONNECTING || to == State::CLOSED;
            case State::CONNECTING:
                return to == State::HANDSHAKING || to == State::FAILED;
            case State::HANDSHAKING:
                return to == State::READY || to == State::FAILED;
            case State::READY:
                return to == State::CLOSING || to == State::FAILED;
            case State::CLOSING:
                return to == State::CLOSED;
            case State::CLOSED:
            case State::FAILED:
                return false;
        }
        return false;
    }

    static std::string state_to_string(State state) {
        switch (state) {
            case State::IDLE:        return "IDLE";
            case State::CONNECTING:  return "CONNECTING";
            case State::HANDSHAKING: return "HANDSHAKING";
            case State::READY:       return "READY";
            case State::CLOSING:     return "CLOSING";
            case State::CLOSED:      return "CLOSED";
            case State::FAILED:      return "FAILED";
            default:                 return "UNKNOWN";
        }
    }

    std::string get_state_string() const {
        return state_to_string(current_state_);
    }

private:
    State current_state_;
};

inline std::ostream& operator<<(std::ostream& os, const ConnectionState::State& state) {
    os << ConnectionState::state_to_string(state);
    return os;
}

} // namespace session
} // namespace fstore

#endif // FSTORE_SESSION_CONNECTION_STATE_HPP
