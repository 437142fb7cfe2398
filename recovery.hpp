#ifndef RECOVERY_H
#define RECOVERY_H

#include <cstddef>
#include <set>
#include <string>
#include <vector>
#include "detector.hpp"

#ifdef DEADFRAME_TERMINATION_SEARCH_LIMIT
const size_t TERMINATION_SEARCH_LIMIT = DEADFRAME_TERMINATION_SEARCH_LIMIT;
#else
const size_t TERMINATION_SEARCH_LIMIT = 65536;
#endif

enum RecoveryAction {
    RECOVERY_TERMINATE,
    RECOVERY_PREEMPT
};

struct RecoveryConfig {
    // Upper bound on candidate subsets the termination search may evaluate.
    size_t termination_search_limit = TERMINATION_SEARCH_LIMIT;
    bool verify_preemption = true;
};

struct RecoverySuggestion {
    RecoveryAction action = RECOVERY_TERMINATE;

    // RECOVERY_TERMINATE
    std::vector<ProcessID> terminated = {};

    // RECOVERY_PREEMPT
    ResourceID resource_id = -1;
    ProcessID donor_id = -1;
    ProcessID recipient_id = -1;

    // Termination sets are always verified. A preemption is verified only when
    // re-detection showed at least one deadlocked process getting unblocked.
    bool verified = false;
    bool simulated = false;
    bool outcome_deadlocked = false;
    std::set<ProcessID> outcome_deadlocked_processes = {};
    std::vector<ProcessID> unblocked = {};

    std::vector<std::string> explanation = {};

    bool speculative() const { return action == RECOVERY_PREEMPT && !verified; }
    std::string description() const;
};

/**
 * Works on the output of one detector and re-runs that same detector on
 * hypothetical states. Never mutates its inputs.
 */
class RecoveryEngine {
    private:
        const Detector* detector;
        RecoveryConfig config;

        bool remainder_recovers(const SystemState& state, const std::vector<ProcessID>& terminated,
                                std::vector<std::string>* explanation) const;
        RecoverySuggestion simulate_transfer(const SystemState& state, const DetectionResult& result,
                                             ResourceID rid, ProcessID donor, ProcessID recipient) const;
        void check_preconditions(const SystemState& state, const DetectionResult& result) const;
    public:
        RecoveryEngine(const Detector* detector, RecoveryConfig config = RecoveryConfig());

        /**
         * All termination sets of the smallest size that leave the remaining
         * processes deadlock-free, in lexicographic pid order. Throws
         * SearchBoundError instead of returning a partial answer.
         */
        std::vector<RecoverySuggestion> minimal_termination_sets(const SystemState& state, const DetectionResult& result,
                                                                 size_t* evaluated_subsets = nullptr) const;

        // One (resource, donor, recipient) candidate per holder/requester pair inside the deadlocked set.
        std::vector<RecoverySuggestion> preemption_candidates(const SystemState& state, const DetectionResult& result) const;

        // Termination sets first, then preemption candidates.
        std::vector<RecoverySuggestion> suggest(const SystemState& state, const DetectionResult& result) const;
};

// Parses a positive decimal search limit. Signs, blanks and values past SIZE_MAX are rejected.
bool parse_search_limit(const std::string& text, size_t* limit);

// Binomial coefficient, saturating at SIZE_MAX.
size_t count_combinations(size_t pool_size, size_t choose);
// Advances indices to the next k-combination of [0, pool_size) in lexicographic order.
bool next_combination(std::vector<size_t>* indices, size_t pool_size);

#endif
