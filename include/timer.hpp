#ifndef FRNN_TIMER_HPP
#define FRNN_TIMER_HPP

#include <chrono>

namespace frnn {

// Monotonic elapsed time since construction or the last restart().
class Stopwatch {
public:
    using Clock = std::chrono::steady_clock;

    Stopwatch() : start_(Clock::now()) {}

    void restart() { start_ = Clock::now(); }

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

private:
    Clock::time_point start_;
};

}  // namespace frnn

#endif  // FRNN_TIMER_HPP
