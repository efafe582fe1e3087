#include "SchedulingPolicy.hpp"

#include <algorithm>
#include <cctype>
#include <tuple>

namespace schedview {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

template <typename KeyFn>
const Process* minBy(const std::vector<const Process*>& ready, KeyFn key) {
    auto it = std::min_element(ready.begin(), ready.end(),
                               [&key](const Process* a, const Process* b) {
                                   return key(*a) < key(*b);
                               });
    return it == ready.end() ? nullptr : *it;
}

} // namespace

const char* policyName(const SchedulingPolicy& policy) {
    return std::visit(overloaded{
        [](const Fcfs&) { return "FCFS"; },
        [](const Sjf&) { return "SJF"; },
        [](const Srtf&) { return "SRTF"; },
        [](const RoundRobin&) { return "RR"; },
        [](const PriorityFirst&) { return "PRIORITY"; },
    }, policy);
}

std::optional<int> policyQuantum(const SchedulingPolicy& policy) {
    if (const auto* rr = std::get_if<RoundRobin>(&policy)) {
        return rr->quantum;
    }
    return std::nullopt;
}

std::optional<SchedulingPolicy> parsePolicy(const std::string& name, int quantum) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "FCFS") return SchedulingPolicy{Fcfs{}};
    if (upper == "SJF") return SchedulingPolicy{Sjf{}};
    if (upper == "SRTF") return SchedulingPolicy{Srtf{}};
    if (upper == "RR") return SchedulingPolicy{RoundRobin{quantum}};
    if (upper == "PRIORITY") return SchedulingPolicy{PriorityFirst{}};
    return std::nullopt;
}

const Process* selectNext(const SchedulingPolicy& policy,
                          const std::vector<const Process*>& ready) {
    return std::visit(overloaded{
        [&ready](const Fcfs&) {
            return minBy(ready, [](const Process& p) { return std::make_tuple(p.arrival_tick, p.id); });
        },
        [&ready](const Sjf&) {
            return minBy(ready, [](const Process& p) { return std::make_tuple(p.remaining, p.id); });
        },
        [&ready](const Srtf&) {
            return minBy(ready, [](const Process& p) { return std::make_tuple(p.remaining, p.id); });
        },
        // Tail of the queue is the largest ready sequence.
        [&ready](const RoundRobin&) {
            return minBy(ready, [](const Process& p) { return std::make_tuple(p.ready_seq, p.id); });
        },
        [&ready](const PriorityFirst&) {
            return minBy(ready, [](const Process& p) { return std::make_tuple(p.priority, p.id); });
        },
    }, policy);
}

bool shouldPreempt(const SchedulingPolicy& policy, const Process& running,
                   int sliceUsed, const std::vector<const Process*>& ready) {
    if (const auto* rr = std::get_if<RoundRobin>(&policy)) {
        return sliceUsed >= rr->quantum;
    }
    if (std::holds_alternative<Srtf>(policy)) {
        const Process* best = selectNext(policy, ready);
        return best != nullptr && best->remaining < running.remaining;
    }
    return false;
}

} // namespace schedview
