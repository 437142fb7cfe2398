#include <sstream>
#include "report.hpp"
#include "waitfordetector.hpp"
#include "workvector.hpp"

static std::string join_processes(const std::vector<ProcessID>& pids, const std::string& separator) {
    std::stringstream stream;
    for(size_t k = 0; k < pids.size(); k++) {
        if(k > 0) stream << separator;
        stream << process_label(pids[k]);
    }
    return stream.str();
}

std::string format_trace(const DetectionResult& result) {
    std::stringstream stream;
    for(auto const& step: result.trace) {
        stream << step.message << std::endl;
    }
    return stream.str();
}

std::string format_summary(const DetectionResult& result) {
    std::stringstream stream;
    std::vector<ProcessID> deadlocked(result.deadlocked_processes.begin(), result.deadlocked_processes.end());

    stream << "Mode: " << mode_name(result.mode) << std::endl;
    stream << "Deadlocked: " << (result.deadlocked ? "yes" : "no") << std::endl;
    if(result.deadlocked) {
        stream << "Deadlocked processes: {" << join_processes(deadlocked, ", ") << "}" << std::endl;
    }
    if(result.mode == WAIT_FOR_GRAPH) {
        for(auto const& cycle: result.cycles) {
            stream << format_cycle(cycle) << std::endl;
        }
    } else {
        if(!result.deadlocked) {
            stream << "Safe sequence: " << join_processes(result.safe_sequence, " -> ") << std::endl;
        }
        stream << "Final Work: " << format_vector(result.final_work) << std::endl;
    }
    return stream.str();
}

// MODE,DEADLOCKED,PIDS separated by spaces,CYCLES or SAFE SEQUENCE
std::string format_summary_csv(const DetectionResult& result) {
    std::stringstream stream;
    stream << mode_name(result.mode) << "," << (result.deadlocked ? 1 : 0) << ",";
    bool first = true;
    for(ProcessID pid: result.deadlocked_processes) {
        if(!first) stream << " ";
        stream << pid;
        first = false;
    }
    stream << ",";
    if(result.mode == WAIT_FOR_GRAPH) {
        for(size_t c = 0; c < result.cycles.size(); c++) {
            if(c > 0) stream << ";";
            std::vector<ProcessID> path = result.cycles[c].closed_path();
            for(size_t k = 0; k < path.size(); k++) {
                if(k > 0) stream << " ";
                stream << path[k];
            }
        }
    } else {
        for(size_t k = 0; k < result.safe_sequence.size(); k++) {
            if(k > 0) stream << " ";
            stream << result.safe_sequence[k];
        }
    }
    stream << std::endl;
    return stream.str();
}

std::string format_recovery_report(const std::vector<RecoverySuggestion>& suggestions) {
    if(suggestions.empty()) {
        return "No recovery strategies found.\n";
    }

    std::vector<const RecoverySuggestion*> terminations = {};
    std::vector<const RecoverySuggestion*> preemptions = {};
    for(auto const& suggestion: suggestions) {
        if(suggestion.action == RECOVERY_TERMINATE) terminations.push_back(&suggestion);
        else preemptions.push_back(&suggestion);
    }

    const std::string rule(60, '=');
    const std::string thin_rule(60, '-');
    std::stringstream stream;
    stream << rule << std::endl << "RECOVERY STRATEGIES" << std::endl << rule << std::endl;

    if(!terminations.empty()) {
        stream << "OPTION 1: Process Termination" << std::endl << thin_rule << std::endl;
        int index = 1;
        for(auto suggestion: terminations) {
            stream << "  " << index++ << ". " << suggestion->description() << std::endl;
            for(auto const& line: suggestion->explanation) {
                stream << "     " << line << std::endl;
            }
        }
        stream << std::endl;
    }

    if(!preemptions.empty()) {
        stream << "OPTION 2: Resource Preemption" << std::endl << thin_rule << std::endl;
        int index = 1;
        for(auto suggestion: preemptions) {
            stream << "  " << index++ << ". " << suggestion->description() << std::endl;
            for(auto const& line: suggestion->explanation) {
                stream << "     " << line << std::endl;
            }
        }
        stream << "Speculative suggestions were not shown to unblock any process." << std::endl;
    }

    stream << rule << std::endl;
    return stream.str();
}
