#ifndef MANAGERERROR_HPP
#define MANAGERERROR_HPP

#include <stdexcept>
#include <string>

enum class ErrorKind
{
    INVALID_DESTINATION,
    DUPLICATE_DESTINATION,
    NOT_FOUND,
    INVALID_TRANSITION,
    TASK_BUSY,
    INVALID_CONFIG,
    NETWORK_ERROR,
    IO_ERROR,
    INSTALL_FAILED
};

const char *toString(ErrorKind kind);

// Raised by every command operation; the kind tells the caller which contract was violated
class ManagerError : public std::runtime_error
{
public:
    ManagerError(ErrorKind kind, const std::string &message);

    ErrorKind getKind() const { return _kind; }

private:
    ErrorKind _kind;
};

#endif
