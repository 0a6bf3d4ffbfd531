#include "modbus_error.hpp"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::ConnectionError: return "ConnectionError";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::ProtocolError: return "ProtocolError";
        case ErrorKind::MalformedPayload: return "MalformedPayload";
        case ErrorKind::RangeError: return "RangeError";
        case ErrorKind::UnknownKey: return "UnknownKey";
        case ErrorKind::ReadOnlyViolation: return "ReadOnlyViolation";
        case ErrorKind::WriteDisabled: return "WriteDisabled";
    }
    return "Unknown";
}
