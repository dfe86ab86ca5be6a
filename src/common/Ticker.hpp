#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace voicenote {

// Calls a function on a fixed interval from a worker thread until stopped.
class Ticker {
public:
    using TickCallback = std::function<void()>;

    Ticker() = default;
    ~Ticker();

    Ticker(const Ticker&) = delete;
    Ticker& operator=(const Ticker&) = delete;

    void Start(std::chrono::milliseconds interval, TickCallback callback);

    // Waits for the worker to exit. When called from inside the tick
    // callback the worker is detached and exits once the callback returns.
    void Stop();

    bool IsRunning() const;

private:
    struct SharedState {
        std::mutex mutex;
        std::condition_variable wakeup;
        bool running = false;
        TickCallback callback;
    };

    static void Run(std::shared_ptr<SharedState> state, std::chrono::milliseconds interval);

    std::shared_ptr<SharedState> _state;
    std::unique_ptr<std::thread> _thread;
};

} // namespace voicenote
