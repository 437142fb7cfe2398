#include <map>
#include <sstream>
#include "waitfordetector.hpp"

DetectionMode WaitForDetector::mode() const {
    return WAIT_FOR_GRAPH;
}

std::string WaitForDetector::name() const {
    return "Wait-For Graph";
}

// Edges come out sorted by (waiting pid, resource id, holder pid).
std::vector<WaitForEdge> WaitForDetector::build_edges(const SystemState& state) const {
    const int n = state.process_count();
    const int m = state.resource_count();

    // Per-resource holder index keeps construction at O(n*m + e).
    std::vector<std::vector<ProcessID>> holders(m);
    for(ProcessID k = 0; k < n; k++) {
        for(ResourceID j = 0; j < m; j++) {
            if(state.allocation(k)[j] > 0) holders[j].push_back(k);
        }
    }

    std::vector<WaitForEdge> edges = {};
    for(ProcessID i = 0; i < n; i++) {
        for(ResourceID j = 0; j < m; j++) {
            // Only pending requests produce edges.
            if(state.request(i)[j] <= 0) continue;
            for(ProcessID k: holders[j]) {
                edges.push_back(WaitForEdge { i, k, j });
            }
        }
    }
    return edges;
}

WaitForDetector::WaitForGraph WaitForDetector::build_graph(const std::vector<WaitForEdge>& edges, int process_count) const {
    std::vector<std::map<ProcessID, ResourceID>> adjacency(process_count);
    for(auto const& edge: edges) {
        // emplace keeps the first, i.e. lowest, resource id for the pair.
        adjacency[edge.from].emplace(edge.to, edge.resource_id);
    }

    WaitForGraph graph(process_count);
    for(int i = 0; i < process_count; i++) {
        for(auto const& [holder, resource_id]: adjacency[i]) {
            graph[i].push_back(Neighbour { holder, resource_id });
        }
    }
    return graph;
}

/**
 * Every elementary cycle is reported exactly once, rooted at its smallest pid.
 * Roots are taken in ascending order and every root is marked explored once its
 * search is done, so later searches never enter it again.
 */
std::vector<DeadlockCycle> WaitForDetector::find_cycles(const WaitForGraph& graph) const {
    const size_t n = graph.size();
    std::vector<bool> on_path(n, false);
    std::vector<bool> explored(n, false);
    std::vector<DeadlockCycle> cycles = {};
    std::vector<WaitForEdge> chain_stack = {};

    for(size_t root = 0; root < n; root++) {
        if(graph[root].empty()) {
            explored[root] = true;
            continue;
        }
        on_path[root] = true;
        dfs(graph, &chain_stack, static_cast<ProcessID>(root), &on_path, explored, &cycles);
        on_path[root] = false;
        explored[root] = true;
    }
    return cycles;
}

void WaitForDetector::dfs(const WaitForGraph& graph, std::vector<WaitForEdge>* chain_stack, ProcessID root,
                          std::vector<bool>* on_path, const std::vector<bool>& explored, std::vector<DeadlockCycle>* cycles) const {
    ProcessID visiting = chain_stack->empty() ? root : chain_stack->back().to;

    for(auto const& neighbour: graph[visiting]) {
        WaitForEdge edge = WaitForEdge { visiting, neighbour.holder, neighbour.resource_id };

        if(neighbour.holder == root) {
            DeadlockCycle cycle;
            for(auto const& chain_edge: *chain_stack) {
                cycle.processes.push_back(chain_edge.from);
                cycle.edges.push_back(chain_edge);
            }
            cycle.processes.push_back(edge.from);
            cycle.edges.push_back(edge);
            cycles->push_back(cycle);
            continue;
        }

        // Cycles through an explored node or through a non-root node already on
        // the path are rooted elsewhere and get reported from there.
        if(explored[neighbour.holder] || (*on_path)[neighbour.holder]) continue;

        (*on_path)[neighbour.holder] = true;
        chain_stack->push_back(edge);
        dfs(graph, chain_stack, root, on_path, explored, cycles);
        chain_stack->pop_back();
        (*on_path)[neighbour.holder] = false;
    }
}

DetectionResult WaitForDetector::detect(const SystemState& state) const {
    DetectionResult result;
    result.mode = WAIT_FOR_GRAPH;

    std::stringstream size_line;
    size_line << "System: " << state.process_count() << " processes, " << state.resource_count() << " resource types";
    result.trace.push_back(TraceStep { TRACE_HEADER, -1, -1, -1, {}, "=== Wait-For Graph Deadlock Detection ===" });
    result.trace.push_back(TraceStep { TRACE_HEADER, -1, -1, -1, {}, size_line.str() });

    if(!state.is_single_instance()) {
        result.trace.push_back(TraceStep { TRACE_WARNING, -1, -1, -1, {},
            "WARNING: not every resource type has a single instance, wait-for cycles may miss or misreport deadlocks; use matrix detection" });
    }

    result.trace.push_back(TraceStep { TRACE_HEADER, -1, -1, -1, {}, "Step 1: Building Wait-For Graph" });
    result.wait_for_edges = build_edges(state);
    if(result.wait_for_edges.empty()) {
        result.trace.push_back(TraceStep { TRACE_HEADER, -1, -1, -1, {}, "  No wait-for edges found (no process is waiting)." });
    }
    for(auto const& edge: result.wait_for_edges) {
        result.trace.push_back(TraceStep { TRACE_EDGE, edge.from, edge.resource_id, edge.to, {}, "  " + format_edge(edge) });
    }

    result.trace.push_back(TraceStep { TRACE_HEADER, -1, -1, -1, {}, "Step 2: Detecting Cycles using DFS" });
    result.cycles = find_cycles(build_graph(result.wait_for_edges, state.process_count()));
    if(result.cycles.empty()) {
        result.trace.push_back(TraceStep { TRACE_HEADER, -1, -1, -1, {}, "  No cycles found in wait-for graph." });
    }
    for(auto const& cycle: result.cycles) {
        result.trace.push_back(TraceStep { TRACE_CYCLE, cycle.processes.front(), cycle.edges.front().resource_id,
                                           cycle.edges.front().to, {}, "  " + format_cycle(cycle) });
        result.deadlocked_processes.insert(cycle.processes.begin(), cycle.processes.end());
    }

    result.deadlocked = !result.deadlocked_processes.empty();
    if(result.deadlocked) {
        std::stringstream members;
        members << "Result: DEADLOCK DETECTED, processes in cycles: {";
        bool first = true;
        for(ProcessID pid: result.deadlocked_processes) {
            if(!first) members << ", ";
            members << process_label(pid);
            first = false;
        }
        members << "}";
        result.trace.push_back(TraceStep { TRACE_VERDICT, -1, -1, -1, {}, members.str() });
    } else {
        result.trace.push_back(TraceStep { TRACE_VERDICT, -1, -1, -1, {}, "Result: NO DEADLOCK" });
    }

    return result;
}

std::string format_edge(const WaitForEdge& edge) {
    return process_label(edge.from) + " -> " + process_label(edge.to) + " (" + resource_label(edge.resource_id) + ")";
}

std::string format_cycle(const DeadlockCycle& cycle) {
    std::stringstream stream;
    stream << "Cycle: ";
    for(auto const& edge: cycle.edges) {
        stream << process_label(edge.from) << " -" << resource_label(edge.resource_id) << "-> ";
    }
    if(!cycle.processes.empty()) {
        stream << process_label(cycle.processes.front());
    }
    return stream.str();
}
