#ifndef SIGNAL_STORE_HPP
#define SIGNAL_STORE_HPP

#include <optional>
#include <string>
#include "LearnedSignal.hpp"

// Signals are stored as the raw captured bytes, nothing else. The kind is
// not recorded and has to be supplied when loading.
namespace SignalStore {
    bool save(const std::string& path, const LearnedSignal& signal);
    std::optional<LearnedSignal> load(const std::string& path, SignalKind kind = SignalKind::Infrared);
}

#endif // SIGNAL_STORE_HPP
