#pragma once

#include <chrono>
#include <memory>

namespace voicenote {

// Monotonic time source. Recorder durations are measured against it so
// tests can substitute a manual clock.
class IClock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~IClock() = default;
    virtual TimePoint Now() const = 0;
};

class SteadyClock : public IClock {
public:
    TimePoint Now() const override { return std::chrono::steady_clock::now(); }
};

inline std::shared_ptr<IClock> MakeSteadyClock() {
    return std::make_shared<SteadyClock>();
}

} // namespace voicenote
