#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace schedview {

class SimulationHost;

/**
 * Drives the simulation by requesting one tick from the host every
 * interval, whether or not any client is connected. It is the only
 * component that requests ticks.
 */
class SimulationClock {
public:
    /**
     * @param host        Owner of the engine
     * @param interval    Time between tick requests
     * @param startPaused Begin in the paused state
     */
    SimulationClock(SimulationHost& host, std::chrono::milliseconds interval,
                    bool startPaused = false);
    ~SimulationClock();

    SimulationClock(const SimulationClock&) = delete;
    SimulationClock& operator=(const SimulationClock&) = delete;

    /** Start the clock thread. */
    bool start();

    /** Stop the clock thread and wait for it. A tick in flight completes first. */
    bool stop();

    /** Stop requesting ticks from the next boundary on. */
    void pause();

    /** Resume requesting ticks. */
    void resume();

    bool isPaused() const;
    std::chrono::milliseconds interval() const { return interval_; }

    /** Number of ticks this clock has requested and seen completed. */
    std::uint64_t ticksIssued() const;

private:
    void clockLoop();
    void setPaused(bool paused);

    SimulationHost& host_;
    const std::chrono::milliseconds interval_;
    std::thread clockThread_;
    mutable std::mutex mutex_;    ///< Protects the flags below.
    std::condition_variable cv_;  ///< Wakes the loop on stop.
    bool running_{false};
    bool stopRequested_{false};
    bool paused_{false};
    std::uint64_t ticksIssued_{0};
};

} // namespace schedview
