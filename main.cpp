#include "Discovery.hpp"
#include "DeviceActions.hpp"
#include "Options.hpp"
#include "UI.hpp"
#include "UIQt.hpp"
#include <QApplication>
#include <cstdlib>
#include <iostream>

namespace {

int run_panel(int argc, char* argv[], const Discovery& discovery, const Options& opts) {
    // Qt needs a display, otherwise fall back to the ncurses panel
    if (std::getenv("DISPLAY") || std::getenv("WAYLAND_DISPLAY")) {
        QApplication app(argc, argv);
        UIQt w(discovery, opts);
        w.show();
        return app.exec();
    }

    UI ui(discovery, opts);
    if (!ui.init()) {
        std::cerr << "UI init failed\n";
        return 1;
    }
    ui.run();
    return 0;
}

int report(const DeviceActions::Outcome& outcome) {
    std::cout << outcome.message << "\n";
    return succeeded(outcome.status) ? 0 : 2;
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    std::string error;
    if (!parse_options(argc, argv, opts, error)) {
        std::cerr << error << "\n";
        print_usage(std::cerr, argv[0]);
        return 1;
    }
    if (opts.help) {
        print_usage(std::cout, argv[0]);
        return 0;
    }
    Log::set_level(opts.log_level);

    Discovery discovery(opts.scan_window_s, PacketCodec::PORT, opts.if_name);

    if (opts.ui) return run_panel(argc, argv, discovery, opts);

    if (opts.ip.empty()) {
        for (const auto& [ip, device] : discovery.discover_all()) {
            std::cout << describe(device) << "\n";
        }
        return 0;
    }

    DeviceIdentity device;
    if (opts.identity_given()) {
        device.address = Endpoint{opts.ip, PacketCodec::PORT};
        device.hardware_id = *opts.mac;
        device.device_class = *opts.device_class;
    } else {
        DiscoverResult found = discovery.discover_one(opts.ip);
        if (found.status != Status::Ok) {
            std::cerr << "Device ip=" << opts.ip << ": " << status_name(found.status) << "\n";
            return 2;
        }
        device = *found.device;
    }
    std::cout << describe(device) << "\n";

    if (opts.power) return report(DeviceActions::switch_power(device, *opts.power, opts.connected));
    if (!opts.emit_file.empty()) {
        return report(DeviceActions::emit_from_file(device, opts.emit_file, opts.signal_kind, opts.connected));
    }
    if (!opts.teach_file.empty()) {
        return report(DeviceActions::learn_to_file(device, opts.teach_file, opts.signal_kind,
                                                   opts.learn_timeout_s, opts.connected));
    }
    if (device.device_class == DeviceClass::Socket) {
        return report(DeviceActions::query_power(device, opts.connected));
    }
    return 0;
}
