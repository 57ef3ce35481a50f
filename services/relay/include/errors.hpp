#pragma once
#include <stdexcept>
#include <string>

class RelayError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bad or missing input; never reaches the remote agent.
class ValidationError : public RelayError {
public:
    using RelayError::RelayError;
};

// Transport or remote failure while creating a task.
class RemoteSubmissionError : public RelayError {
public:
    using RelayError::RelayError;
};

// The remote agent reported the task failed synchronously.
class TaskFailedError : public RelayError {
public:
    using RelayError::RelayError;
};

// Push event for a task id this session does not track.
class UnknownTaskError : public RelayError {
public:
    using RelayError::RelayError;
};

// Result fetch for an unknown or already consumed task.
class NotFoundError : public RelayError {
public:
    using RelayError::RelayError;
};
