#include "Ticker.hpp"

namespace voicenote {

Ticker::~Ticker() {
    Stop();
}

void Ticker::Start(std::chrono::milliseconds interval, TickCallback callback) {
    Stop();
    _state = std::make_shared<SharedState>();
    _state->callback = std::move(callback);
    _state->running = true;
    _thread = std::make_unique<std::thread>(&Ticker::Run, _state, interval);
}

void Ticker::Stop() {
    if (!_state) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(_state->mutex);
        _state->running = false;
    }
    _state->wakeup.notify_all();

    if (_thread && _thread->joinable()) {
        if (_thread->get_id() == std::this_thread::get_id()) {
            _thread->detach();
        } else {
            _thread->join();
        }
    }
    _thread.reset();
    _state.reset();
}

bool Ticker::IsRunning() const {
    if (!_state) {
        return false;
    }
    std::lock_guard<std::mutex> lock(_state->mutex);
    return _state->running;
}

void Ticker::Run(std::shared_ptr<SharedState> state, std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(state->mutex);
    while (state->running) {
        if (state->wakeup.wait_for(lock, interval, [&state]() { return !state->running; })) {
            break;
        }

        TickCallback callback = state->callback;
        lock.unlock();
        if (callback) {
            callback();
        }
        lock.lock();
    }
}

} // namespace voicenote
