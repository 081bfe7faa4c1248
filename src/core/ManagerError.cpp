#include "core/ManagerError.hpp"

const char *toString(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::INVALID_DESTINATION:
        return "InvalidDestination";
    case ErrorKind::DUPLICATE_DESTINATION:
        return "DuplicateDestination";
    case ErrorKind::NOT_FOUND:
        return "NotFound";
    case ErrorKind::INVALID_TRANSITION:
        return "InvalidTransition";
    case ErrorKind::TASK_BUSY:
        return "TaskBusy";
    case ErrorKind::INVALID_CONFIG:
        return "InvalidConfig";
    case ErrorKind::NETWORK_ERROR:
        return "NetworkError";
    case ErrorKind::IO_ERROR:
        return "IOError";
    case ErrorKind::INSTALL_FAILED:
        return "InstallFailed";
    }

    return "Unknown";
}

ManagerError::ManagerError(ErrorKind kind, const std::string &message)
    : std::runtime_error(std::string(toString(kind)) + ": " + message),
      _kind(kind)
{
}
