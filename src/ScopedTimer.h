#pragma once

#include <chrono>

class ScopedTimer {
public:
    ScopedTimer() = default;

    // in seconds, with millisecond precision
    double elapsed() const noexcept {
        return static_cast<double>(elapsedMs().count()) / 1000.0;
    }

    std::chrono::milliseconds elapsedMs() const noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time_);
    }

private:
    const std::chrono::steady_clock::time_point start_time_{std::chrono::steady_clock::now()};
};
