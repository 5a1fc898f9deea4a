#ifndef UI_HPP
#define UI_HPP

#include <string>
#include <vector>
#include "Discovery.hpp"
#include "Options.hpp"

// ncurses device panel: lists discovered devices and runs commands on the
// selected one. Commands block the panel until they complete or time out.
class UI {
public:
    UI(const Discovery& discovery, const Options& options);
    ~UI();

    // Initialize ncurses, returns false on failure
    bool init();
    // Run the main UI loop (returns when user quits)
    void run();

private:
    const Discovery& discovery_;
    const Options& options_;
    bool running_;
    bool initialized_;
    std::vector<DeviceIdentity> devices_;
    size_t selected_;
    std::string status_;

    void draw();
    void handle_input();
    void rediscover();
    const DeviceIdentity* selected_device() const;
    std::string prompt(const char* label);
    void show_busy(const std::string& text);
};

#endif // UI_HPP
