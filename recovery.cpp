#include <algorithm>
#include <cstdint>
#include <iterator>
#include <sstream>
#include "recovery.hpp"
#include "workvector.hpp"

std::string RecoverySuggestion::description() const {
    std::stringstream stream;
    if(action == RECOVERY_TERMINATE) {
        stream << "Terminate " << terminated.size() << " process(es): ";
        for(size_t k = 0; k < terminated.size(); k++) {
            if(k > 0) stream << ", ";
            stream << process_label(terminated[k]);
        }
    } else {
        stream << "Preempt one instance of " << resource_label(resource_id) << " from " << process_label(donor_id)
               << " and give it to " << process_label(recipient_id) << (verified ? " [verified]" : " [speculative]");
    }
    return stream.str();
}

bool parse_search_limit(const std::string& text, size_t* limit) {
    if(text.empty()) return false;
    size_t value = 0;
    for(char digit: text) {
        if(digit < '0' || digit > '9') return false;
        size_t next = static_cast<size_t>(digit - '0');
        if(value > (SIZE_MAX - next) / 10) return false;
        value = value * 10 + next;
    }
    if(value == 0) return false;
    *limit = value;
    return true;
}

size_t count_combinations(size_t pool_size, size_t choose) {
    if(choose > pool_size) return 0;
    choose = std::min(choose, pool_size - choose);
    size_t result = 1;
    for(size_t k = 1; k <= choose; k++) {
        size_t factor = pool_size - choose + k;
        // result * factor / k stays integral at every step.
        if(result > SIZE_MAX / factor) return SIZE_MAX;
        result = result * factor / k;
    }
    return result;
}

bool next_combination(std::vector<size_t>* indices, size_t pool_size) {
    const size_t k = indices->size();
    for(size_t position = k; position-- > 0;) {
        if((*indices)[position] < pool_size - k + position) {
            (*indices)[position] += 1;
            for(size_t rest = position + 1; rest < k; rest++) {
                (*indices)[rest] = (*indices)[rest - 1] + 1;
            }
            return true;
        }
    }
    return false;
}

RecoveryEngine::RecoveryEngine(const Detector* detector, RecoveryConfig config) : detector(detector), config(config) {
    if(detector == nullptr) {
        throw PreconditionError("recovery engine needs a detector");
    }
}

void RecoveryEngine::check_preconditions(const SystemState& state, const DetectionResult& result) const {
    if(!result.deadlocked) {
        throw PreconditionError("recovery requested for a result that is not deadlocked");
    }
    if(result.mode != detector->mode()) {
        throw PreconditionError("recovery detector " + mode_name(detector->mode()) +
                                " does not match the detection mode " + mode_name(result.mode));
    }
    for(ProcessID pid: result.deadlocked_processes) {
        if(pid < 0 || pid >= state.process_count()) {
            throw PreconditionError("detection result names " + process_label(pid) + ", which is not part of the state");
        }
    }
}

bool RecoveryEngine::remainder_recovers(const SystemState& state, const std::vector<ProcessID>& terminated,
                                        std::vector<std::string>* explanation) const {
    ResourceVector released = state.available();
    for(ProcessID pid: terminated) {
        for(size_t j = 0; j < released.size(); j++) released[j] += state.allocation(pid)[j];
    }
    explanation->push_back("Terminating releases held resources, Available becomes " + format_vector(released));

    if(terminated.size() == static_cast<size_t>(state.process_count())) {
        explanation->push_back("All processes terminated.");
        return true;
    }

    std::vector<ProcessID> surviving = {};
    SystemState reduced = state.without_processes(terminated, &surviving);
    DetectionResult outcome = detector->detect(reduced);
    if(outcome.deadlocked) {
        return false;
    }

    std::stringstream line;
    if(outcome.mode == REACHABILITY) {
        line << "Remaining processes can all finish: ";
        for(size_t k = 0; k < outcome.safe_sequence.size(); k++) {
            if(k > 0) line << " -> ";
            line << process_label(surviving[outcome.safe_sequence[k]]);
        }
    } else {
        line << "No wait-for cycle remains among ";
        for(size_t k = 0; k < surviving.size(); k++) {
            if(k > 0) line << ", ";
            line << process_label(surviving[k]);
        }
    }
    explanation->push_back(line.str());
    return true;
}

std::vector<RecoverySuggestion> RecoveryEngine::minimal_termination_sets(const SystemState& state, const DetectionResult& result,
                                                                         size_t* evaluated_subsets) const {
    check_preconditions(state, result);

    const std::vector<ProcessID> pool(result.deadlocked_processes.begin(), result.deadlocked_processes.end());
    std::vector<RecoverySuggestion> suggestions = {};
    size_t evaluated = 0;

    for(size_t size = 1; size <= pool.size(); size++) {
        // A whole level is evaluated or none of it, so an answer is never partial.
        size_t needed = count_combinations(pool.size(), size);
        if(needed > config.termination_search_limit - evaluated) {
            size_t required = needed > SIZE_MAX - evaluated ? SIZE_MAX : evaluated + needed;
            std::stringstream message;
            message << "deadlocked set too large for exhaustive minimal-set search: " << pool.size()
                    << " deadlocked processes need " << required << " candidate subsets up to size " << size
                    << ", limit is " << config.termination_search_limit;
            throw SearchBoundError(message.str(), config.termination_search_limit, required);
        }

        std::vector<size_t> indices(size);
        for(size_t k = 0; k < size; k++) indices[k] = k;

        do {
            std::vector<ProcessID> subset = {};
            for(size_t index: indices) subset.push_back(pool[index]);
            evaluated++;

            std::vector<std::string> explanation = {};
            if(remainder_recovers(state, subset, &explanation)) {
                RecoverySuggestion suggestion;
                suggestion.action = RECOVERY_TERMINATE;
                suggestion.terminated = subset;
                suggestion.verified = true;
                suggestion.simulated = true;
                suggestion.explanation = explanation;
                suggestions.push_back(suggestion);
            }
        } while(next_combination(&indices, pool.size()));

        if(!suggestions.empty()) break;
    }

    if(evaluated_subsets != nullptr) *evaluated_subsets = evaluated;
    return suggestions;
}

RecoverySuggestion RecoveryEngine::simulate_transfer(const SystemState& state, const DetectionResult& result,
                                                     ResourceID rid, ProcessID donor, ProcessID recipient) const {
    RecoverySuggestion suggestion;
    suggestion.action = RECOVERY_PREEMPT;
    suggestion.resource_id = rid;
    suggestion.donor_id = donor;
    suggestion.recipient_id = recipient;

    if(!config.verify_preemption) {
        suggestion.explanation.push_back("Transfer not simulated, effect unknown.");
        return suggestion;
    }

    SystemState hypothetical = state.with_transfer(rid, donor, recipient);
    DetectionResult outcome = detector->detect(hypothetical);
    suggestion.simulated = true;
    suggestion.outcome_deadlocked = outcome.deadlocked;
    suggestion.outcome_deadlocked_processes = outcome.deadlocked_processes;
    std::set_difference(result.deadlocked_processes.begin(), result.deadlocked_processes.end(),
                        outcome.deadlocked_processes.begin(), outcome.deadlocked_processes.end(),
                        std::back_inserter(suggestion.unblocked));
    suggestion.verified = !suggestion.unblocked.empty();

    if(suggestion.verified) {
        std::stringstream line;
        line << "Re-detection after the transfer unblocks ";
        for(size_t k = 0; k < suggestion.unblocked.size(); k++) {
            if(k > 0) line << ", ";
            line << process_label(suggestion.unblocked[k]);
        }
        suggestion.explanation.push_back(line.str());
        suggestion.explanation.push_back(outcome.deadlocked ? "Some processes remain deadlocked."
                                                            : "No deadlock remains after the transfer.");
    } else {
        suggestion.explanation.push_back("Re-detection after the transfer unblocks nobody.");
    }
    suggestion.explanation.push_back(process_label(donor) + " must be rolled back and re-acquire " + resource_label(rid) + " later.");
    return suggestion;
}

std::vector<RecoverySuggestion> RecoveryEngine::preemption_candidates(const SystemState& state, const DetectionResult& result) const {
    check_preconditions(state, result);

    std::vector<RecoverySuggestion> suggestions = {};
    for(ResourceID j = 0; j < state.resource_count(); j++) {
        for(ProcessID donor: result.deadlocked_processes) {
            if(state.allocation(donor)[j] <= 0) continue;
            for(ProcessID recipient: result.deadlocked_processes) {
                if(recipient == donor || state.request(recipient)[j] <= 0) continue;
                suggestions.push_back(simulate_transfer(state, result, j, donor, recipient));
            }
        }
    }
    return suggestions;
}

std::vector<RecoverySuggestion> RecoveryEngine::suggest(const SystemState& state, const DetectionResult& result) const {
    std::vector<RecoverySuggestion> suggestions = minimal_termination_sets(state, result);
    std::vector<RecoverySuggestion> preemptions = preemption_candidates(state, result);
    suggestions.insert(suggestions.end(), preemptions.begin(), preemptions.end());
    return suggestions;
}
