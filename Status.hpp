#ifndef STATUS_HPP
#define STATUS_HPP

#include <string>

// Outcome of a protocol operation. Nothing in the core throws; every
// failure ends up as one of these.
enum class Status {
    Ok,
    AlreadyInState,   // socket already switched the requested way, nothing sent
    NoResponse,       // wait elapsed with no matching datagram
    SendTimeout,      // socket never became writable
    TransportError,   // socket error while sending, or session closed
    ReceiveError,     // socket error while waiting for a reply
    DeviceNotFound,   // discovery lookup miss
    WrongDeviceClass, // operation not supported by the device class
    StorageError      // signal file could not be read or written
};

inline std::string status_name(Status status) {
    switch (status) {
        case Status::Ok: return "ok";
        case Status::AlreadyInState: return "already in requested state";
        case Status::NoResponse: return "no response";
        case Status::SendTimeout: return "send timeout";
        case Status::TransportError: return "transport error";
        case Status::ReceiveError: return "receive error";
        case Status::DeviceNotFound: return "device not found";
        case Status::WrongDeviceClass: return "wrong device class";
        case Status::StorageError: return "storage error";
    }
    return "unknown";
}

inline bool succeeded(Status status) {
    return status == Status::Ok || status == Status::AlreadyInState;
}

#endif // STATUS_HPP
