#ifndef REACHABILITYDETECTOR_H
#define REACHABILITYDETECTOR_H

#include "detector.hpp"
#include "workvector.hpp"

/**
 * Work/Finish reduction (generalized Banker's detection). Correct for single- and
 * multi-instance systems.
 *
 * Scan order is ascending pid and the scan restarts from P0 after every grant,
 * so the safe sequence is the lexicographically smallest one the rule admits.
 */
class ReachabilityDetector : public Detector {
    private:
        void trace_initial_state(const SystemState& state, DetectionResult* result) const;
    public:
        DetectionMode mode() const;
        std::string name() const;
        DetectionResult detect(const SystemState& state) const;
};

// Replays order from Available, checking request <= Work before releasing each allocation.
bool replay_safe_sequence(const SystemState& state, const std::vector<ProcessID>& order, ResourceVector* final_work);

#endif
