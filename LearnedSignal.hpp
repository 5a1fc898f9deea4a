#ifndef LEARNED_SIGNAL_HPP
#define LEARNED_SIGNAL_HPP

#include <string>
#include "PacketCodec.hpp"

enum class SignalKind { Infrared, RF433 };

// Captured IR/RF433 code. The bytes are opaque and replayed as-is.
struct LearnedSignal {
    Bytes bytes;
    SignalKind kind = SignalKind::Infrared;
};

inline std::string signal_kind_name(SignalKind kind) {
    return kind == SignalKind::RF433 ? "rf433" : "ir";
}

#endif // LEARNED_SIGNAL_HPP
