#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "process/Process.hpp"

namespace schedview {

/// First come, first served. Never preempts.
struct Fcfs {};

/// Shortest job first, judged on remaining ticks. Never preempts.
struct Sjf {};

/// Shortest remaining time first. Re-evaluated every tick.
struct Srtf {};

/// Round robin with a fixed time slice.
struct RoundRobin {
    int quantum{2}; ///< Consecutive ticks a process may hold the CPU.
};

/// Static priority, lower value runs first. Never preempts.
struct PriorityFirst {};

/**
 * Scheduling algorithm of a run, carrying only the parameters that
 * algorithm needs.
 */
using SchedulingPolicy = std::variant<Fcfs, Sjf, Srtf, RoundRobin, PriorityFirst>;

/** Wire name of the policy: "FCFS", "SJF", "SRTF", "RR" or "PRIORITY". */
const char* policyName(const SchedulingPolicy& policy);

/** Quantum for RR, nothing for the other policies. */
std::optional<int> policyQuantum(const SchedulingPolicy& policy);

/**
 * Build a policy from its wire name (case-insensitive). The quantum is used
 * only for "RR". Returns std::nullopt for an unknown name.
 */
std::optional<SchedulingPolicy> parsePolicy(const std::string& name, int quantum);

/**
 * Choose which Ready process gets a free CPU.
 * @param policy Active algorithm
 * @param ready  Processes currently in state READY (may be empty)
 * @return The chosen process or nullptr if `ready` is empty
 */
const Process* selectNext(const SchedulingPolicy& policy,
                          const std::vector<const Process*>& ready);

/**
 * Decide whether the running process must give up the CPU before the next
 * slot executes.
 * @param policy    Active algorithm
 * @param running   Process holding the CPU
 * @param sliceUsed Consecutive slots it has run since it was selected
 * @param ready     Processes currently in state READY
 */
bool shouldPreempt(const SchedulingPolicy& policy, const Process& running,
                   int sliceUsed, const std::vector<const Process*>& ready);

} // namespace schedview
