#include <sstream>
#include "reachabilitydetector.hpp"

DetectionMode ReachabilityDetector::mode() const {
    return REACHABILITY;
}

std::string ReachabilityDetector::name() const {
    return "Matrix (Work/Finish)";
}

void ReachabilityDetector::trace_initial_state(const SystemState& state, DetectionResult* result) const {
    std::stringstream size_line;
    size_line << "System: " << state.process_count() << " processes, " << state.resource_count() << " resource types";
    result->trace.push_back(TraceStep { TRACE_HEADER, -1, -1, -1, {}, "=== Matrix-Based Deadlock Detection ===" });
    result->trace.push_back(TraceStep { TRACE_HEADER, -1, -1, -1, {}, size_line.str() });
    result->trace.push_back(TraceStep { TRACE_HEADER, -1, -1, -1, {}, "Initial State:" });
    result->trace.push_back(TraceStep { TRACE_HEADER, -1, -1, -1, {}, "  Available: " + format_vector(state.available()) });
    for(ProcessID i = 0; i < state.process_count(); i++) {
        result->trace.push_back(TraceStep { TRACE_HEADER, i, -1, -1, {},
            "  " + process_label(i) + ": Allocation = " + format_vector(state.allocation(i)) +
            ", Request = " + format_vector(state.request(i)) });
    }
}

DetectionResult ReachabilityDetector::detect(const SystemState& state) const {
    const int n = state.process_count();
    DetectionResult result;
    result.mode = REACHABILITY;
    trace_initial_state(state, &result);

    WorkVector work(state.available());
    std::vector<bool> finish(n, false);

    std::stringstream init_line;
    init_line << "Step 1: Work = Available = " << work.to_string() << ", Finish[i] = False for all " << n << " processes";
    result.trace.push_back(TraceStep { TRACE_INITIALIZE, -1, -1, -1, work.values(), init_line.str() });
    result.trace.push_back(TraceStep { TRACE_HEADER, -1, -1, -1, {}, "Step 2: Find processes that can complete" });

    bool progress = true;
    while(progress) {
        progress = false;
        for(ProcessID i = 0; i < n; i++) {
            if(finish[i] || !work.covers(state.request(i))) continue;

            ResourceVector before = work.values();
            work.release_into(state.allocation(i));
            finish[i] = true;
            result.safe_sequence.push_back(i);

            std::stringstream grant_line;
            grant_line << "  Iteration " << result.safe_sequence.size() << ": " << process_label(i)
                       << " Request = " << format_vector(state.request(i)) << " <= Work = " << format_vector(before)
                       << ", releases Allocation = " << format_vector(state.allocation(i))
                       << ", Work = " << work.to_string();
            result.trace.push_back(TraceStep { TRACE_GRANT, i, -1, -1, before, grant_line.str() });

            progress = true;
            break;
        }
    }

    result.finish = finish;
    result.final_work = work.values();

    for(ProcessID i = 0; i < n; i++) {
        if(finish[i]) continue;
        result.deadlocked_processes.insert(i);
        ResourceID shortfall = work.first_shortfall(state.request(i));
        std::stringstream blocked_line;
        blocked_line << "  " << process_label(i) << ": Request = " << format_vector(state.request(i))
                     << " exceeds Work = " << work.to_string() << " at " << resource_label(shortfall);
        result.trace.push_back(TraceStep { TRACE_BLOCKED, i, shortfall, -1, work.values(), blocked_line.str() });
    }

    result.deadlocked = !result.deadlocked_processes.empty();
    if(result.deadlocked) {
        std::stringstream members;
        members << "Result: DEADLOCK DETECTED, deadlocked processes: {";
        bool first = true;
        for(ProcessID pid: result.deadlocked_processes) {
            if(!first) members << ", ";
            members << process_label(pid);
            first = false;
        }
        members << "}";
        result.trace.push_back(TraceStep { TRACE_VERDICT, -1, -1, -1, work.values(), members.str() });
        result.safe_sequence.clear();
    } else {
        std::stringstream order;
        order << "Result: NO DEADLOCK, safe sequence: ";
        for(size_t k = 0; k < result.safe_sequence.size(); k++) {
            if(k > 0) order << " -> ";
            order << process_label(result.safe_sequence[k]);
        }
        result.trace.push_back(TraceStep { TRACE_VERDICT, -1, -1, -1, work.values(), order.str() });
    }

    return result;
}

bool replay_safe_sequence(const SystemState& state, const std::vector<ProcessID>& order, ResourceVector* final_work) {
    WorkVector work(state.available());
    std::vector<bool> seen(state.process_count(), false);
    for(ProcessID pid: order) {
        if(pid < 0 || pid >= state.process_count() || seen[pid]) return false;
        if(!work.covers(state.request(pid))) return false;
        work.release_into(state.allocation(pid));
        seen[pid] = true;
    }
    if(final_work != nullptr) *final_work = work.values();
    return true;
}
