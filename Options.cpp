#include "Options.hpp"
#include <getopt.h>
#include <cstdlib>

namespace {
    bool parse_positive(const char* text, int& out) {
        char* end = nullptr;
        long v = std::strtol(text, &end, 10);
        if (end == text || *end != '\0' || v <= 0 || v > 3600) return false;
        out = static_cast<int>(v);
        return true;
    }

    bool parse_switch(const std::string& text, bool& out) {
        if (text == "on" || text == "ON" || text == "1") { out = true; return true; }
        if (text == "off" || text == "OFF" || text == "0") { out = false; return true; }
        return false;
    }
}

bool parse_options(int argc, char* argv[], Options& out, std::string& error) {
    static const struct option long_opts[] = {
        {"loglevel", required_argument, nullptr, 'L'},
        {"ip", required_argument, nullptr, 'i'},
        {"mac", required_argument, nullptr, 'm'},
        {"type", required_argument, nullptr, 'T'},
        {"switch", required_argument, nullptr, 's'},
        {"emit", required_argument, nullptr, 'e'},
        {"teach", required_argument, nullptr, 't'},
        {"rf", no_argument, nullptr, 'r'},
        {"timeout", required_argument, nullptr, 'w'},
        {"scan", required_argument, nullptr, 'W'},
        {"interface", required_argument, nullptr, 'I'},
        {"connect", no_argument, nullptr, 'c'},
        {"ui", no_argument, nullptr, 'u'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    // getopt keeps global state; 0 makes glibc start over
    optind = 0;
    opterr = 0;
    int ch;
    while ((ch = getopt_long(argc, argv, "L:i:m:T:s:e:t:rw:W:I:cuh", long_opts, nullptr)) != -1) {
        switch (ch) {
            case 'L':
                if (!Log::parse_level(optarg, out.log_level)) { error = "bad log level: " + std::string(optarg); return false; }
                break;
            case 'i':
                out.ip = optarg;
                break;
            case 'm':
                out.mac = parse_hardware_id(optarg);
                if (!out.mac) { error = "bad MAC address: " + std::string(optarg); return false; }
                break;
            case 'T':
                out.device_class = parse_device_class(optarg);
                if (!out.device_class) { error = "bad device type: " + std::string(optarg); return false; }
                break;
            case 's': {
                bool on = false;
                if (!parse_switch(optarg, on)) { error = "switch expects on or off, got " + std::string(optarg); return false; }
                out.power = on;
                break;
            }
            case 'e':
                out.emit_file = optarg;
                break;
            case 't':
                out.teach_file = optarg;
                break;
            case 'r':
                out.signal_kind = SignalKind::RF433;
                break;
            case 'w':
                if (!parse_positive(optarg, out.learn_timeout_s)) { error = "bad timeout: " + std::string(optarg); return false; }
                break;
            case 'W':
                if (!parse_positive(optarg, out.scan_window_s)) { error = "bad scan window: " + std::string(optarg); return false; }
                break;
            case 'I':
                out.if_name = optarg;
                break;
            case 'c':
                out.connected = true;
                break;
            case 'u':
                out.ui = true;
                break;
            case 'h':
                out.help = true;
                break;
            default:
                error = "unknown option";
                if (optopt) error += std::string(" -") + static_cast<char>(optopt);
                return false;
        }
    }

    if (optind < argc) {
        error = "unexpected argument: " + std::string(argv[optind]);
        return false;
    }
    if (out.has_action() && out.ip.empty()) {
        error = "--switch, --emit and --teach need --ip";
        return false;
    }
    if (!out.emit_file.empty() && !out.teach_file.empty()) {
        error = "--emit and --teach are exclusive";
        return false;
    }
    if (out.mac.has_value() != out.device_class.has_value()) {
        error = "--mac and --type go together";
        return false;
    }
    return true;
}

void print_usage(std::ostream& os, const char* prog) {
    os << "usage: " << prog << " [options]\n"
       << "  -L, --loglevel LEVEL   debug, info, warn, error (default warn)\n"
       << "  -i, --ip ADDR          device address\n"
       << "  -m, --mac HEX          hardware id, with --type skips discovery\n"
       << "  -T, --type TYPE        socket or irda\n"
       << "  -s, --switch on|off    switch a socket\n"
       << "  -e, --emit FILE        emit a stored signal\n"
       << "  -t, --teach FILE       learn a signal into FILE\n"
       << "  -r, --rf               signal is RF433 rather than infrared\n"
       << "  -w, --timeout SEC      learn timeout (default " << DeviceSession::DEFAULT_LEARN_TIMEOUT_S << ")\n"
       << "  -W, --scan SEC         discovery window (default " << Discovery::DEFAULT_SCAN_WINDOW_S << ")\n"
       << "  -I, --interface NAME   broadcast on this interface only\n"
       << "  -c, --connect          connect the device socket to the device\n"
       << "  -u, --ui               interactive device panel\n"
       << "  -h, --help             this text\n"
       << "Without options every device found on the network is listed.\n";
}
