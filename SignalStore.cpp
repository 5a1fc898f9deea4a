#include "SignalStore.hpp"
#include "Log.hpp"
#include <fstream>
#include <sys/stat.h>

namespace SignalStore {

bool save(const std::string& path, const LearnedSignal& signal) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        Log::error("SignalStore", "cannot open " + path + " for writing");
        return false;
    }
    out.write(reinterpret_cast<const char*>(signal.bytes.data()), static_cast<std::streamsize>(signal.bytes.size()));
    out.close();
    if (!out) {
        Log::error("SignalStore", "write to " + path + " failed");
        return false;
    }
    return true;
}

std::optional<LearnedSignal> load(const std::string& path, SignalKind kind) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        Log::error("SignalStore", "cannot stat " + path);
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        Log::error("SignalStore", "cannot open " + path);
        return std::nullopt;
    }

    LearnedSignal signal;
    signal.kind = kind;
    signal.bytes.resize(static_cast<size_t>(st.st_size));
    if (!signal.bytes.empty()) {
        in.read(reinterpret_cast<char*>(signal.bytes.data()), static_cast<std::streamsize>(signal.bytes.size()));
        if (in.gcount() != static_cast<std::streamsize>(signal.bytes.size())) {
            Log::error("SignalStore", "short read from " + path);
            return std::nullopt;
        }
    }
    if (signal.bytes.empty()) {
        Log::warn("SignalStore", path + " is empty");
    }
    return signal;
}

} // namespace SignalStore
