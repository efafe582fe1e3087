#include "SimulationClock.hpp"

#include "core/SimulationHost.hpp"
#include "log/Log.hpp"

namespace schedview {

SimulationClock::SimulationClock(SimulationHost& host, std::chrono::milliseconds interval,
                                 bool startPaused)
    : host_(host), interval_(interval), paused_(startPaused) {
    host_.setPaused(startPaused);
}

SimulationClock::~SimulationClock() {
    stop();
}

bool SimulationClock::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return true;
    }
    if (interval_.count() <= 0) {
        return false;
    }
    stopRequested_ = false;
    clockThread_ = std::thread(&SimulationClock::clockLoop, this);
    running_ = true;
    return true;
}

bool SimulationClock::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return true;
        }
        stopRequested_ = true;
    }
    cv_.notify_all();
    if (clockThread_.joinable()) {
        clockThread_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    return true;
}

void SimulationClock::pause() {
    setPaused(true);
    log::info("[||] clock paused");
}

void SimulationClock::resume() {
    setPaused(false);
    log::info("[>] clock resumed");
}

void SimulationClock::setPaused(bool paused) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (paused_ == paused) {
            return;
        }
        paused_ = paused;
    }
    host_.setPaused(paused);
    host_.publish();
}

bool SimulationClock::isPaused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

std::uint64_t SimulationClock::ticksIssued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ticksIssued_;
}

void SimulationClock::clockLoop() {
    using Clock = std::chrono::steady_clock;
    auto deadline = Clock::now() + interval_;
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_until(lock, deadline, [this] { return stopRequested_; })) {
                return;
            }
            if (paused_) {
                deadline = Clock::now() + interval_;
                continue;
            }
        }
        // Wait for the tick so requests never pile up behind a slow owner.
        host_.requestTick().wait();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++ticksIssued_;
        }
        deadline += interval_;
        auto now = Clock::now();
        if (deadline < now) {
            deadline = now + interval_;
        }
    }
}

} // namespace schedview
