// File: errors.cpp
#include "errors.hpp"
#include <cerrno>

int ErrnoFor(const std::exception &ex)
{
    if (dynamic_cast<const ReservedRootError *>(&ex))
        return EPERM;
    if (dynamic_cast<const DirExistsError *>(&ex))
        return EEXIST;
    if (dynamic_cast<const NotFoundError *>(&ex))
        return ENOENT;
    if (dynamic_cast<const OperationCancelledError *>(&ex))
        return EINTR;
    if (auto *api = dynamic_cast<const ApiError *>(&ex))
    {
        if (api->httpCode() == 429)
            return EAGAIN;
        return EIO;
    }
    return EIO;
}
