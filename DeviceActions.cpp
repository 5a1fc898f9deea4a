#include "DeviceActions.hpp"
#include "DeviceSession.hpp"
#include "SignalStore.hpp"

namespace {
    DeviceActions::Outcome fail(Status status, const std::string& message) {
        DeviceActions::Outcome o;
        o.status = status;
        o.message = message;
        return o;
    }
}

namespace DeviceActions {

Outcome query_power(const DeviceIdentity& device, bool connected) {
    if (device.device_class != DeviceClass::Socket) {
        return fail(Status::WrongDeviceClass, "not a socket");
    }
    auto session = DeviceSession::open(device, connected);
    if (!session) return fail(Status::TransportError, "cannot open socket");

    auto on = session->power_state();
    if (!on) return fail(Status::NoResponse, "device did not answer");
    return Outcome{Status::Ok, std::string("Is enabled: ") + (*on ? "yes" : "no")};
}

Outcome switch_power(const DeviceIdentity& device, bool on, bool connected) {
    auto session = DeviceSession::open(device, connected);
    if (!session) return fail(Status::TransportError, "cannot open socket");

    Status st = session->set_power(on);
    const char* word = on ? "on" : "off";
    switch (st) {
        case Status::Ok: return Outcome{st, std::string("Switched ") + word + "."};
        case Status::AlreadyInState: return Outcome{st, std::string("Already ") + word + "."};
        default: return fail(st, std::string("Switching ") + word + " failed: " + status_name(st));
    }
}

Outcome learn_to_file(const DeviceIdentity& device, const std::string& path, SignalKind kind,
                      int timeout_s, bool connected) {
    auto session = DeviceSession::open(device, connected);
    if (!session) return fail(Status::TransportError, "cannot open socket");

    LearnResult learned = session->learn_signal(kind, timeout_s);
    session->close();
    if (learned.status != Status::Ok) {
        return fail(learned.status, "Learning failed: " + status_name(learned.status));
    }
    if (!SignalStore::save(path, *learned.signal)) {
        return fail(Status::StorageError, "Signal captured but could not be saved to " + path);
    }
    return Outcome{Status::Ok, "Signal saved to \"" + path + "\" (" +
                                   std::to_string(learned.signal->bytes.size()) + " bytes)."};
}

Outcome emit_from_file(const DeviceIdentity& device, const std::string& path, SignalKind kind,
                       bool connected) {
    auto signal = SignalStore::load(path, kind);
    if (!signal) return fail(Status::StorageError, "Cannot read signal from " + path);

    auto session = DeviceSession::open(device, connected);
    if (!session) return fail(Status::TransportError, "cannot open socket");

    Status st = session->emit_signal(*signal);
    if (st != Status::Ok) return fail(st, "Emit failed: " + status_name(st));
    return Outcome{Status::Ok, "Done."};
}

} // namespace DeviceActions
