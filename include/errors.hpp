#pragma once
#include <stdexcept>
#include <string>

class RdfsError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Path or object does not exist. Distinct from a failed operation.
class NotFoundError : public RdfsError
{
public:
    using RdfsError::RdfsError;
};

class DirNotFoundError : public NotFoundError
{
public:
    using NotFoundError::NotFoundError;
};

class DirExistsError : public RdfsError
{
public:
    using RdfsError::RdfsError;
};

// Reading or writing the rule file failed; the operation was aborted.
class RuleFileError : public RdfsError
{
public:
    using RdfsError::RdfsError;
};

// Directories directly under the root are reserved for rule-derived folders.
class ReservedRootError : public RdfsError
{
public:
    using RdfsError::RdfsError;
};

class OperationCancelledError : public RdfsError
{
public:
    OperationCancelledError() : RdfsError("operation cancelled") {}
};

// A direct-download link returned 503/404 for a job that is already queued for recovery.
class BrokenLinkError : public RdfsError
{
public:
    BrokenLinkError(const std::string &jobId, const std::string &message)
        : RdfsError(message), jobId_(jobId) {}

    const std::string &jobId() const { return jobId_; }

private:
    std::string jobId_;
};

// Decoded non-2xx response: {"error": ..., "error_code": ...} bodies, or the raw body.
class ApiError : public RdfsError
{
public:
    ApiError(std::string message, std::string status, long httpCode)
        : RdfsError(message + " [" + status + "]"),
          message_(std::move(message)), status_(std::move(status)), httpCode_(httpCode) {}

    const std::string &message() const { return message_; }
    const std::string &status() const { return status_; }
    long httpCode() const { return httpCode_; }

private:
    std::string message_;
    std::string status_;
    long httpCode_;
};

// errno value a filesystem frontend reports for ex.
int ErrnoFor(const std::exception &ex);
