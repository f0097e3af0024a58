#pragma once
/**
 * @file errors.hpp
 * @brief Error taxonomy of the mediation layer.
 *
 * Two channels:
 *  - Expected failures at the capability boundary are values: `ApiResult<T>` /
 *    `ApiStatus` carrying an `ErrorKind` and a message prefixed with the kind
 *    name ("ValidationError: level 50 V outside [-40, 40] V").
 *  - Wiring faults (duplicate registration, unknown capability) and raw
 *    adapter faults are exceptions. Wiring faults abort startup; adapter
 *    exceptions are caught inside the capability APIs and never reach a
 *    consumer module.
 */

#include "utils/result.hpp"

#include <stdexcept>
#include <string>

namespace elworkbench::broker
{

enum class ErrorKind
{
    Validation,          ///< Argument outside the instrument-safe range or otherwise invalid
    DeviceNotReady,      ///< Adapter not connected, or faulted
    DeviceCommunication, ///< Adapter reported an I/O or protocol fault mid-command
    DeviceBusy,          ///< Session queue full, or wait for the session timed out
    Cancelled,           ///< Cancellation observed at a checkpoint
    MalformedRecord,     ///< Persistent record without a valid id / name
    NoSelection,         ///< No active profile or device
    Io,                  ///< Persistence I/O failure (nothing partially written)
};

inline const char *to_string(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::Validation: return "ValidationError";
    case ErrorKind::DeviceNotReady: return "DeviceNotReadyError";
    case ErrorKind::DeviceCommunication: return "DeviceCommunicationError";
    case ErrorKind::DeviceBusy: return "DeviceBusyError";
    case ErrorKind::Cancelled: return "CancelledError";
    case ErrorKind::MalformedRecord: return "MalformedRecordError";
    case ErrorKind::NoSelection: return "NoSelectionError";
    case ErrorKind::Io: return "IoError";
    }
    return "UnknownError";
}

template <typename T>
using ApiResult = utils::Result<T, ErrorKind>;

using ApiStatus = utils::Result<void, ErrorKind>;

/// Failure with the message "<KindName>: <detail>".
template <typename T = void>
[[nodiscard]] utils::Result<T, ErrorKind> failure(ErrorKind kind, const std::string &detail)
{
    return utils::Result<T, ErrorKind>::error(kind, std::string(to_string(kind)) + ": " + detail);
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------

class DuplicateRegistrationError : public std::runtime_error
{
  public:
    explicit DuplicateRegistrationError(const std::string &name)
        : std::runtime_error("DuplicateRegistrationError: capability '" + name +
                             "' is already registered")
    {
    }
};

class CapabilityNotFoundError : public std::runtime_error
{
  public:
    explicit CapabilityNotFoundError(const std::string &name, const std::string &why = "not registered")
        : std::runtime_error("CapabilityNotFoundError: capability '" + name + "' " + why)
    {
    }
};

/// Thrown by device adapters; converted to ErrorKind::DeviceCommunication by the APIs.
class DeviceCommunicationError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// Thrown by device adapters when a command is issued outside the Connected state.
class DeviceNotReadyError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

} // namespace elworkbench::broker
