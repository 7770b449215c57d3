#ifndef TRANSFER_ERRORS_HPP
#define TRANSFER_ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * TransferError - Base of every failure that aborts a session
 *
 * Each subclass names the stage of the handshake that failed. The message
 * carries the OS error text where one exists.
 */
class TransferError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /** Short name of the error kind, used in terminal messages */
    virtual const char* kind() const noexcept { return "TransferError"; }
};

// Host resolution or connect() on the control port failed
class ConnectError : public TransferError {
public:
    using TransferError::TransferError;
    const char* kind() const noexcept override { return "ConnectError"; }
};

// Data port unavailable or out of range
class BindError : public TransferError {
public:
    using TransferError::TransferError;
    const char* kind() const noexcept override { return "BindError"; }
};

// Listener failure, or no inbound connection before the deadline
class AcceptError : public TransferError {
public:
    using TransferError::TransferError;
    const char* kind() const noexcept override { return "AcceptError"; }
};

// Partial or failed write on the control connection
class SendError : public TransferError {
public:
    using TransferError::TransferError;
    const char* kind() const noexcept override { return "SendError"; }
};

// Malformed request or short read on the data connection
class ProtocolError : public TransferError {
public:
    using TransferError::TransferError;
    const char* kind() const noexcept override { return "ProtocolError"; }
};

// Bad command line
class UsageError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

#endif // TRANSFER_ERRORS_HPP
