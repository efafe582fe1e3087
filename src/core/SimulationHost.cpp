#include "SimulationHost.hpp"

#include <memory>
#include <utility>

namespace schedview {

SimulationHost::SimulationHost(SchedulingEngine engine)
    : engine_(std::move(engine)) {}

SimulationHost::~SimulationHost() {
    stop();
}

bool SimulationHost::start() {
    std::lock_guard<std::mutex> lock(queueMutex_);
    if (running_) {
        return true;
    }
    stopRequested_ = false;
    ownerThread_ = std::thread(&SimulationHost::ownerLoop, this);
    running_ = true;
    return true;
}

bool SimulationHost::stop() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_) {
            return true;
        }
        stopRequested_ = true;
    }
    cv_.notify_all();
    if (ownerThread_.joinable()) {
        ownerThread_.join();
    }
    std::lock_guard<std::mutex> lock(queueMutex_);
    running_ = false;
    return true;
}

void SimulationHost::setSnapshotListener(SnapshotListener listener) {
    std::lock_guard<std::mutex> lock(engineMutex_);
    listener_ = std::move(listener);
}

std::future<Snapshot> SimulationHost::requestTick() {
    auto promise = std::make_shared<std::promise<Snapshot>>();
    auto future = promise->get_future();
    post([this, promise] {
        Snapshot snap = decorate(engine_.tick());
        if (listener_) {
            listener_(snap);
        }
        promise->set_value(std::move(snap));
    });
    return future;
}

std::future<EngineResult> SimulationHost::submitProcess(ProcessSpec spec) {
    auto promise = std::make_shared<std::promise<EngineResult>>();
    auto future = promise->get_future();
    post([this, promise, spec = std::move(spec)] {
        promise->set_value(engine_.addProcess(spec));
    });
    return future;
}

std::future<EngineResult> SimulationHost::submitPolicy(SchedulingPolicy policy) {
    auto promise = std::make_shared<std::promise<EngineResult>>();
    auto future = promise->get_future();
    post([this, promise, policy = std::move(policy)] {
        promise->set_value(engine_.setPolicy(policy));
    });
    return future;
}

std::future<Snapshot> SimulationHost::requestSnapshot() {
    auto promise = std::make_shared<std::promise<Snapshot>>();
    auto future = promise->get_future();
    post([this, promise] {
        promise->set_value(decorate(engine_.snapshot()));
    });
    return future;
}

void SimulationHost::publish() {
    post([this] {
        if (listener_) {
            listener_(decorate(engine_.snapshot()));
        }
    });
}

void SimulationHost::post(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (running_ && !stopRequested_) {
            requests_.push_back(std::move(job));
            cv_.notify_one();
            return;
        }
    }
    std::lock_guard<std::mutex> lock(engineMutex_);
    job();
}

void SimulationHost::ownerLoop() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            cv_.wait(lock, [this] { return stopRequested_ || !requests_.empty(); });
            if (requests_.empty()) {
                return;
            }
            job = std::move(requests_.front());
            requests_.pop_front();
        }
        std::lock_guard<std::mutex> lock(engineMutex_);
        job();
    }
}

Snapshot SimulationHost::decorate(Snapshot snap) const {
    snap.paused = paused_;
    return snap;
}

} // namespace schedview
