#include <stdexcept>
#include <string>

#ifndef LANQUEUEERROR_HPP
#define LANQUEUEERROR_HPP

enum class LanQueueErrorKind {
    Bind,
    Connect,
    Timeout,
    AuthRejected,
    Protocol
};

// What startHost(), join() and send() throw. what() is the user-facing text.
class LanQueueError : public std::runtime_error {
public:
    LanQueueError(LanQueueErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {
    }

    LanQueueErrorKind kind() const {
        return kind_;
    }

private:
    LanQueueErrorKind kind_;
};

#endif // LANQUEUEERROR_HPP
