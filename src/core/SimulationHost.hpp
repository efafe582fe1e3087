#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <thread>

#include "core/EngineResult.hpp"
#include "core/SchedulingEngine.hpp"
#include "core/Snapshot.hpp"

namespace schedview {

/**
 * SimulationHost owns the SchedulingEngine and is the only place it is
 * touched. Ticks, injections and policy changes are queued as requests and
 * applied one at a time on a dedicated owner thread, so every snapshot that
 * leaves the host is a completed tick.
 *
 * Requests posted while the owner thread is not running are applied inline
 * on the caller's thread under the same lock.
 */
class SimulationHost {
public:
    using SnapshotListener = std::function<void(const Snapshot&)>;

    explicit SimulationHost(SchedulingEngine engine);
    ~SimulationHost();

    SimulationHost(const SimulationHost&) = delete;
    SimulationHost& operator=(const SimulationHost&) = delete;

    /** Start the owner thread. */
    bool start();

    /** Drain queued requests and join the owner thread. */
    bool stop();

    /**
     * Receive every published snapshot. Called on the owner thread, so the
     * listener must not block. Set before start().
     */
    void setSnapshotListener(SnapshotListener listener);

    /** Advance one tick and publish the result. */
    std::future<Snapshot> requestTick();

    /** Forward an add-process request to the engine. */
    std::future<EngineResult> submitProcess(ProcessSpec spec);

    /** Change the scheduling policy if the run has not started. */
    std::future<EngineResult> submitPolicy(SchedulingPolicy policy);

    /** Current state without advancing. */
    std::future<Snapshot> requestSnapshot();

    /** Publish the current state without advancing, e.g. after a pause. */
    void publish();

    /** Mirror the clock's pause flag into outgoing snapshots. */
    void setPaused(bool paused) { paused_ = paused; }

private:
    void ownerLoop();
    void post(std::function<void()> job);
    Snapshot decorate(Snapshot snap) const;

    SchedulingEngine engine_;                     ///< Touched only while holding engineMutex_.
    SnapshotListener listener_;
    std::deque<std::function<void()>> requests_;  ///< Pending mutations in arrival order.
    std::thread ownerThread_;
    std::mutex queueMutex_;                       ///< Protects requests_ and the flags below.
    std::mutex engineMutex_;                      ///< Serializes request execution.
    std::condition_variable cv_;
    bool running_{false};
    bool stopRequested_{false};
    std::atomic<bool> paused_{false};
};

} // namespace schedview
