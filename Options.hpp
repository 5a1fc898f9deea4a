#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include <optional>
#include <ostream>
#include <string>
#include "DeviceIdentity.hpp"
#include "Discovery.hpp"
#include "DeviceSession.hpp"
#include "Log.hpp"

struct Options {
    Log::Level log_level = Log::Level::Warn;
    std::string ip;
    std::optional<HardwareId> mac;
    std::optional<DeviceClass> device_class;
    std::optional<bool> power;       // --switch
    std::string emit_file;
    std::string teach_file;
    SignalKind signal_kind = SignalKind::Infrared;
    int learn_timeout_s = DeviceSession::DEFAULT_LEARN_TIMEOUT_S;
    int scan_window_s = Discovery::DEFAULT_SCAN_WINDOW_S;
    std::string if_name;
    bool connected = false;
    bool ui = false;
    bool help = false;

    // --mac and --type together let the front end skip discovery
    bool identity_given() const { return mac.has_value() && device_class.has_value(); }
    bool has_action() const { return power.has_value() || !emit_file.empty() || !teach_file.empty(); }
};

// false with `error` set on a bad option or value
bool parse_options(int argc, char* argv[], Options& out, std::string& error);
void print_usage(std::ostream& os, const char* prog);

#endif // OPTIONS_HPP
