#ifndef PARLEY_UTILS_CLOCK_HPP
#define PARLEY_UTILS_CLOCK_HPP

#include <chrono>

namespace parley {
namespace utils {

/**
 * @brief Source of the current time
 *
 * Every timestamp the store records goes through this interface so that
 * tests can drive eviction and recency grouping with a fixed clock.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual std::chrono::system_clock::time_point now() const = 0;
};

class SystemClock : public Clock {
public:
    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }
};

} // namespace utils
} // namespace parley

#endif // PARLEY_UTILS_CLOCK_HPP
