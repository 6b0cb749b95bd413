#pragma once
#include <chrono>

namespace herder {

// Single-shot passive timeout, started at construction
class deadline {
public:
    using clock = std::chrono::steady_clock;
    using duration = std::chrono::milliseconds;

    explicit deadline(duration budget);

    bool expired() const;
    duration elapsed() const;
    duration remaining() const;
    duration budget() const { return budget_; }

    // Sleeps for step, cut short so it never sleeps past the deadline.
    // Returns false if the deadline had already expired.
    bool sleep_for(duration step) const;

private:
    clock::time_point start_;
    duration budget_;
};

} // namespace herder
