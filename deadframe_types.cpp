#include "deadframe_types.hpp"

std::vector<ProcessID> DeadlockCycle::closed_path() const {
    std::vector<ProcessID> path = processes;
    if(!processes.empty()) {
        path.push_back(processes.front());
    }
    return path;
}

std::string mode_name(DetectionMode mode) {
    switch(mode) {
        case WAIT_FOR_GRAPH:
            return "WFG";
        case REACHABILITY:
            return "MATRIX";
    }
    return "UNKNOWN";
}

std::string process_label(ProcessID pid) {
    return "P" + std::to_string(pid);
}

std::string resource_label(ResourceID rid) {
    return "R" + std::to_string(rid);
}
