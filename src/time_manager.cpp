#include "time_manager.hpp"

#include <algorithm>

TimeManager::TimeManager(const TimeControl &initial_tc, int timeout_buffer_ms)
    : tc(initial_tc), timeout_buffer_ms(timeout_buffer_ms) {}

void TimeManager::update(Color player_who_moved, long long elapsed_ms) {
    if (player_who_moved == Color::WHITE) {
        tc.wtime_ms -= static_cast<int>(elapsed_ms);
        tc.wtime_ms += tc.winc_ms;
    } else {
        tc.btime_ms -= static_cast<int>(elapsed_ms);
        tc.btime_ms += tc.binc_ms;
    }
}

bool TimeManager::is_out_of_time(Color player) const {
    // Apply timeout buffer to prevent premature timeouts
    if (player == Color::WHITE) {
        return tc.wtime_ms <= -timeout_buffer_ms;
    } else {
        return tc.btime_ms <= -timeout_buffer_ms;
    }
}

int TimeManager::get_time_ms(Color player) const {
    return player == Color::WHITE ? tc.wtime_ms : tc.btime_ms;
}

TimeControl TimeManager::current() const {
    TimeControl clamped = tc;
    clamped.wtime_ms = std::max(clamped.wtime_ms, 0);
    clamped.btime_ms = std::max(clamped.btime_ms, 0);
    return clamped;
}

void TimeManager::set_timeout_buffer(int buffer_ms) {
    timeout_buffer_ms = buffer_ms;
}
