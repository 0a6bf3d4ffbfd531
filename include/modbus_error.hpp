#ifndef MODBUS_ERROR_H
#define MODBUS_ERROR_H

#include <stdexcept>
#include <utility>
#include <string>

/// @brief Flat error taxonomy shared by every component.
enum class ErrorKind {
    None,
    ConnectionError,   ///< Socket or transport failure
    Timeout,           ///< No response within the configured bound
    ProtocolError,     ///< Device returned an exception or an unusable response
    MalformedPayload,  ///< Word count does not match the descriptor
    RangeError,        ///< Value outside declared or representable bounds
    UnknownKey,        ///< Catalog miss
    ReadOnlyViolation, ///< Write to a read-only register
    WriteDisabled      ///< Write while the coordinator is read-only
};

const char* errorKindName(ErrorKind kind);

/// @brief True for errors raised by the link (retryable at the session level).
inline bool isTransportError(ErrorKind kind) {
    return kind == ErrorKind::ConnectionError || kind == ErrorKind::Timeout ||
           kind == ErrorKind::ProtocolError;
}

/**
 * @class ModbusError
 * @brief Exception carrying an ErrorKind tag.
 *
 * Thrown by the catalog, codec and transport session. The polling coordinator
 * catches it and reports it as an OperationResult or a notification.
 *
 * A ProtocolError is either a well-formed exception response from the device
 * (the stream is still in step) or a malformed frame (it may not be).
 */
class ModbusError : public std::runtime_error {
public:
    ModbusError(ErrorKind kind, const std::string& message, bool exception_response = false)
        : std::runtime_error(message), error_kind(kind), device_exception(exception_response) {}

    ErrorKind kind() const noexcept { return error_kind; }

    /// @brief True when the device answered with a Modbus exception code.
    bool isExceptionResponse() const noexcept { return device_exception; }

private:
    ErrorKind error_kind;
    bool device_exception;
};

/**
 * @struct OperationResult
 * @brief Outcome of a refresh or write as seen by a collaborator.
 */
struct OperationResult {
    ErrorKind error = ErrorKind::None;
    std::string message;

    bool ok() const { return error == ErrorKind::None; }

    static OperationResult success() { return {}; }
    static OperationResult failure(ErrorKind kind, std::string msg) { return {kind, std::move(msg)}; }
    static OperationResult from(const ModbusError& e) { return {e.kind(), e.what()}; }
};

#endif // MODBUS_ERROR_H
