#include "UI.hpp"
#include "DeviceActions.hpp"
#include <ncurses.h>
#include <chrono>
#include <thread>

UI::UI(const Discovery& discovery, const Options& options)
    : discovery_(discovery), options_(options), running_(false), initialized_(false), selected_(0) {}

UI::~UI() {
    if (initialized_) endwin();
}

bool UI::init() {
    if (initscr() == nullptr) return false;
    initialized_ = true;
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE); // non-blocking getch
    curs_set(0);
    return true;
}

const DeviceIdentity* UI::selected_device() const {
    if (devices_.empty() || selected_ >= devices_.size()) return nullptr;
    return &devices_[selected_];
}

void UI::draw() {
    clear();
    mvprintw(0, 0, "OrviboLAN - devices (%zu found, scan window %ds)", devices_.size(), discovery_.scan_window());

    mvprintw(2, 0, "   %-16s  %-14s  %s", "IP", "MAC", "Type");
    int row = 3;
    for (size_t i = 0; i < devices_.size(); ++i) {
        const auto& d = devices_[i];
        if (i == selected_) attron(A_REVERSE);
        mvprintw(row++, 0, "%2zu %-16s  %-14s  %s", i + 1, d.address.ip.c_str(),
                 format_hardware_id(d.hardware_id).c_str(), device_class_name(d.device_class).c_str());
        if (i == selected_) attroff(A_REVERSE);
    }
    if (devices_.empty()) mvprintw(row++, 0, "   (none, press d to discover)");

    mvprintw(LINES - 3, 0, "%s", status_.c_str());
    mvprintw(LINES - 2, 0, "Commands: q=quit, d=discover, up/down=select, o=on, f=off, p=power state, l=learn, e=emit");
    refresh();
}

void UI::show_busy(const std::string& text) {
    status_ = text;
    draw();
}

std::string UI::prompt(const char* label) {
    // prompt in blocking mode: temporarily enable echo and blocking
    nodelay(stdscr, FALSE);
    echo();
    curs_set(1);
    char buf[256] = {0};
    move(LINES - 4, 0);
    clrtoeol();
    mvprintw(LINES - 4, 0, "%s", label);
    getnstr(buf, sizeof(buf) - 1);
    noecho();
    curs_set(0);
    nodelay(stdscr, TRUE);
    return buf;
}

void UI::rediscover() {
    show_busy("Discovering...");
    DeviceMap found = discovery_.discover_all();
    devices_.clear();
    for (const auto& [ip, device] : found) devices_.push_back(device);
    if (selected_ >= devices_.size()) selected_ = 0;
    status_ = "Discovery finished, " + std::to_string(devices_.size()) + " device(s).";
}

void UI::handle_input() {
    int ch = getch();
    if (ch == ERR) return;
    if (ch == 'q' || ch == 'Q') {
        running_ = false;
        return;
    }
    if (ch == 'd' || ch == 'D') {
        rediscover();
        return;
    }
    if (ch == KEY_UP) {
        if (selected_ > 0) --selected_;
        return;
    }
    if (ch == KEY_DOWN) {
        if (selected_ + 1 < devices_.size()) ++selected_;
        return;
    }

    const DeviceIdentity* device = selected_device();
    if (!device) {
        status_ = "No device selected.";
        return;
    }

    if (ch == 'o' || ch == 'f') {
        bool on = ch == 'o';
        show_busy(std::string("Switching ") + (on ? "on" : "off") + " " + device->address.ip + "...");
        status_ = DeviceActions::switch_power(*device, on, options_.connected).message;
        return;
    }
    if (ch == 'p') {
        show_busy("Querying " + device->address.ip + "...");
        status_ = DeviceActions::query_power(*device, options_.connected).message;
        return;
    }
    if (ch == 'l') {
        std::string path = prompt("Save learned signal to file: ");
        if (path.empty()) return;
        show_busy("Point the remote at the device and press a button...");
        status_ = DeviceActions::learn_to_file(*device, path, options_.signal_kind, options_.learn_timeout_s,
                                               options_.connected).message;
        return;
    }
    if (ch == 'e') {
        std::string path = prompt("Emit signal from file: ");
        if (path.empty()) return;
        show_busy("Emitting...");
        status_ = DeviceActions::emit_from_file(*device, path, options_.signal_kind, options_.connected).message;
        return;
    }
}

void UI::run() {
    running_ = true;
    rediscover();
    while (running_) {
        draw();
        handle_input();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}
