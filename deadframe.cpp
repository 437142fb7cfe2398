#include <chrono>
#include "deadframe.hpp"
#include "reachabilitydetector.hpp"
#include "waitfordetector.hpp"

std::unique_ptr<Detector> create_detector(DetectionMode mode) {
    if(mode == WAIT_FOR_GRAPH) {
        return std::unique_ptr<Detector>(new WaitForDetector());
    }
    return std::unique_ptr<Detector>(new ReachabilityDetector());
}

DeadFrame::DeadFrame(DetectionMode mode) : detector(create_detector(mode)), detection_mode(mode) {}

void DeadFrame::set_mode(DetectionMode mode) {
    detector = create_detector(mode);
    detection_mode = mode;
}

DetectionMode DeadFrame::get_mode() const {
    return detection_mode;
}

const Detector& DeadFrame::get_detector() const {
    return *detector;
}

DetectionMode DeadFrame::mode_for(const SystemState& state) {
    return state.is_single_instance() ? WAIT_FOR_GRAPH : REACHABILITY;
}

DetectionResult DeadFrame::detect(const SystemState& state) {
    if(detection_mode == WAIT_FOR_GRAPH && !state.is_single_instance()) {
        throw PreconditionError("wait-for graph detection requested, but the state has multi-instance resources");
    }

#ifdef COLLECT_STATISTICS
    auto start = std::chrono::steady_clock::now();
#endif

    DetectionResult result = detector->detect(state);

#ifdef COLLECT_STATISTICS
    auto end = std::chrono::steady_clock::now();
    report_statistic(detector->name() + " detection time in microseconds",
                     std::to_string(std::chrono::duration_cast<std::chrono::microseconds>(end - start).count()));
    report_statistic("Wait-for edges", std::to_string(result.wait_for_edges.size()));
    report_statistic("Cycles", std::to_string(result.cycles.size()));
    report_statistic("Deadlocked processes", std::to_string(result.deadlocked_processes.size()));
#endif

    return result;
}

std::vector<RecoverySuggestion> DeadFrame::recover(const SystemState& state, const DetectionResult& result) {
    RecoveryEngine engine(detector.get(), recovery_config);

#ifdef COLLECT_STATISTICS
    auto start = std::chrono::steady_clock::now();
    size_t evaluated = 0;
    std::vector<RecoverySuggestion> suggestions = engine.minimal_termination_sets(state, result, &evaluated);
    std::vector<RecoverySuggestion> preemptions = engine.preemption_candidates(state, result);
    suggestions.insert(suggestions.end(), preemptions.begin(), preemptions.end());
    auto end = std::chrono::steady_clock::now();
    report_statistic("Recovery time in microseconds",
                     std::to_string(std::chrono::duration_cast<std::chrono::microseconds>(end - start).count()));
    report_statistic("Termination subsets evaluated", std::to_string(evaluated));
    return suggestions;
#else
    return engine.suggest(state, result);
#endif
}

#ifdef COLLECT_STATISTICS
void DeadFrame::report_statistic(StatisticKey key, StatisticValue value) {
    statistics.push_back(StatisticReport { key, value });
}
#endif
