#ifndef FSTORE_TRANSFER_STATE_HPP
#define FSTORE_TRANSFER_STATE_HPP

#include <stdexcept>
#include <string>
#include <boost/log/trivial.hpp>

namespace fstore {
namespace transfer {

enum class PushState {
  INIT,
  NEGOTIATING,
  STREAMING,
  FINALIZING,
  DONE,
  FAILED
};

enum class PullState {
  INIT,
  OPENING,
  TRANSFERRING,
  CLOSING,
  DONE,
  FAILED
};

// INIT -> NEGOTIATING -> STREAMING -> FINALIZING -> DONE, FAILED from any live state
inline bool is_valid_transition(PushState from, PushState to) {
  if (to == PushState::FAILED) {
    return from != PushState::DONE && from != PushState::FAILED;
  }
  switch (from) {
    case PushState::INIT:        return to == PushState::NEGOTIATING;
    case PushState::NEGOTIATING: return to == PushState::STREAMING;
    case PushState::STREAMING:   return to == PushState::FINALIZING;
    case PushState::FINALIZING:  return to == PushState::DONE;
    default:                     return false;
  }
}

// INIT -> OPENING -> TRANSFERRING -> CLOSING -> DONE, FAILED from any live state
inline bool is_valid_transition(PullState from, PullState to) {
  if (to == PullState::FAILED) {
    return from != PullState::DONE && from != PullState::FAILED;
  }
  switch (from) {
    case PullState::INIT:         return to == PullState::OPENING;
    case PullState::OPENING:      return to == PullState::TRANSFERRING;
    case PullState::TRANSFERRING: return to == PullState::CLOSING;
    case PullState::CLOSING:      return to == PullState::DONE;
    default:                      return false;
  }
}

inline const char* state_to_string(PushState state) {
  switch (state) {
    case PushState::INIT:        return "Init";
    case PushState::NEGOTIATING: return "Negotiating";
    case PushState::STREAMING:   return "Streaming";
    case PushState::FINALIZING:  return "Finalizing";
    case PushState::DONE:        return "Done";
    case PushState::FAILED:      return "Failed";
    default:                     return "Unknown";
  }
}

inline const char* state_to_string(PullState state) {
  switch (state) {
    case PullState::INIT:         return "Init";
    case PullState::OPENING:      return "Opening";
    case PullState::TRANSFERRING: return "Transferring";
    case PullState::CLOSING:      return "Closing";
    case PullState::DONE:         return "Done";
    case PullState::FAILED:       return "Failed";
    default:                      return "Unknown";
  }
}

// Current state of one engine run. An invalid transition is a programming
// error and throws std::logic_error.
template <typename State>
class StateTracker {
public:
  StateTracker(const char* component, State initial)
    : component_(component), state_(initial) {}

  State get() const { return state_; }

  void advance(State next) {
    if (!is_valid_transition(state_, next)) {
      throw std::logic_error(std::string(component_) + ": invalid transition " +
                             state_to_string(state_) + " -> " + state_to_string(next));
    }
    BOOST_LOG_TRIVIAL(trace) << component_ << ": " << state_to_string(state_) << " -> " << state_to_string(next);
    state_ = next;
  }

  // Moves to FAILED unless already terminal
  void fail(State failed) {
    if (is_valid_transition(state_, failed)) {
      advance(failed);
    }
  }

private:
  const char* component_;
  State state_;
};

} // namespace transfer
} // namespace fstore

#endif // FSTORE_TRANSFER_STATE_HPP
