#pragma once
#include <stdexcept>
#include <string>

namespace retrace::dom {

    // Lifecycle misuse of a transition
    enum class TransitionError {
        AlreadyCompleted, // Operation not applicable to a completed transition
        AlreadyRunning,   // start() on a running transition
        NotRunning,       // complete() without a prior start()
        InvalidElement    // Element identifier missing or malformed
    };

    inline const char *toString(TransitionError error) {
        switch (error) {
        case TransitionError::AlreadyCompleted:
            return "AlreadyCompleted";
        case TransitionError::AlreadyRunning:
            return "AlreadyRunning";
        case TransitionError::NotRunning:
            return "NotRunning";
        case TransitionError::InvalidElement:
            return "InvalidElement";
        }
        return "Unknown";
    }

    class TransitionException : public std::logic_error {
      public:
        TransitionException(TransitionError error, const std::string &message)
            : std::logic_error(std::string(toString(error)) + ": " + message), error_(error) {}

        TransitionError error() const noexcept { return error_; }

      private:
        TransitionError error_;
    };

} // namespace retrace::dom
