#ifndef WAITFORDETECTOR_H
#define WAITFORDETECTOR_H

#include <vector>
#include "detector.hpp"

/**
 * Cycle detection over the wait-for relation. Exact for single-instance systems,
 * on multi-instance states it still runs but records a warning in the trace.
 */
class WaitForDetector : public Detector {
    private:
        struct Neighbour {
            ProcessID holder;
            // Lowest resource id linking the two processes.
            ResourceID resource_id;
        };

        typedef std::vector<std::vector<Neighbour>> WaitForGraph;

        WaitForGraph build_graph(const std::vector<WaitForEdge>& edges, int process_count) const;
        void dfs(const WaitForGraph& graph, std::vector<WaitForEdge>* chain_stack, ProcessID root,
                 std::vector<bool>* on_path, const std::vector<bool>& explored, std::vector<DeadlockCycle>* cycles) const;
        std::vector<DeadlockCycle> find_cycles(const WaitForGraph& graph) const;
    public:
        DetectionMode mode() const;
        std::string name() const;
        std::vector<WaitForEdge> build_edges(const SystemState& state) const;
        DetectionResult detect(const SystemState& state) const;
};

std::string format_edge(const WaitForEdge& edge);
std::string format_cycle(const DeadlockCycle& cycle);

#endif
