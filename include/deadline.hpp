#pragma once

#include "errors.hpp"
#include <chrono>
#include <string>

namespace roto {

// Wall-clock budget of one job attempt.
class Deadline {
public:
    using clock = std::chrono::steady_clock;

    Deadline() : at_(clock::time_point::max()) {}
    explicit Deadline(std::chrono::seconds budget) : at_(clock::now() + budget) {}

    bool expired() const { return clock::now() >= at_; }

    std::chrono::seconds remaining() const {
        if (at_ == clock::time_point::max()) {
            return std::chrono::seconds::max();
        }
        auto left = std::chrono::duration_cast<std::chrono::seconds>(at_ - clock::now());
        return left.count() > 0 ? left : std::chrono::seconds(0);
    }

    bool bounded() const { return at_ != clock::time_point::max(); }

    void check(const std::string& what) const {
        if (expired()) {
            throw JobTimeoutError("Job deadline exceeded during " + what);
        }
    }

private:
    clock::time_point at_;
};

} // namespace roto
