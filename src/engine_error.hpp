#pragma once

#include <stdexcept>
#include <string>

// --- Engine Errors ---

enum class EngineErrorKind {
    SPAWN_FAILURE,      // executable missing or pipe/fork/exec failed
    STDIO_UNAVAILABLE,  // pipe ends could not be opened as streams
    WRITE_FAILURE,      // command could not be written to the engine
    CHANNEL_CLOSED,     // engine output ended before a bestmove arrived
    SESSION_CLOSED      // session stopped or never started
};

inline const char *to_string(EngineErrorKind kind) {
    switch (kind) {
        case EngineErrorKind::SPAWN_FAILURE: return "spawn failure";
        case EngineErrorKind::STDIO_UNAVAILABLE: return "stdio unavailable";
        case EngineErrorKind::WRITE_FAILURE: return "write failure";
        case EngineErrorKind::CHANNEL_CLOSED: return "channel closed";
        case EngineErrorKind::SESSION_CLOSED: return "session closed";
    }
    return "unknown";
}

class EngineError : public std::runtime_error {
   private:
    EngineErrorKind kind_;

   public:
    EngineError(EngineErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    EngineErrorKind kind() const { return kind_; }
};
