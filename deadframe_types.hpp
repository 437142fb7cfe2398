#ifndef DEADFRAME_TYPES_H
#define DEADFRAME_TYPES_H

#include <set>
#include <string>
#include <vector>

typedef int ProcessID;
typedef int ResourceID;
typedef int InstanceCount;
typedef std::vector<InstanceCount> ResourceVector;
typedef std::vector<ResourceVector> ResourceMatrix;
#ifdef COLLECT_STATISTICS
typedef std::string StatisticKey;
typedef std::string StatisticValue;
#endif

enum DetectionMode {
    WAIT_FOR_GRAPH,
    REACHABILITY
};

typedef struct
{
    ProcessID pid;
    std::string name;
} Process;

typedef struct
{
    ResourceID rid;
    std::string name;
    InstanceCount instances;
} ResourceType;

// from waits for a resource currently held by to.
typedef struct
{
    ProcessID from;
    ProcessID to;
    ResourceID resource_id;
} WaitForEdge;

struct DeadlockCycle {
    // Rotated so the smallest pid comes first, the closing edge is implied.
    std::vector<ProcessID> processes = {};
    // edges[k] links processes[k] to processes[(k + 1) % size].
    std::vector<WaitForEdge> edges = {};

    std::vector<ProcessID> closed_path() const;
};

enum TraceAction {
    TRACE_HEADER,
    TRACE_WARNING,
    TRACE_EDGE,
    TRACE_CYCLE,
    TRACE_INITIALIZE,
    TRACE_GRANT,
    TRACE_BLOCKED,
    TRACE_VERDICT
};

struct TraceStep {
    TraceAction action;
    ProcessID process_id = -1;
    ResourceID resource_id = -1;
    ProcessID target_id = -1;
    // Work before the step for TRACE_GRANT, the final Work for TRACE_BLOCKED.
    ResourceVector work = {};
    std::string message;
};

struct DetectionResult {
    DetectionMode mode = REACHABILITY;
    bool deadlocked = false;
    std::set<ProcessID> deadlocked_processes = {};
    std::vector<TraceStep> trace = {};

    // Wait-For Detector only.
    std::vector<WaitForEdge> wait_for_edges = {};
    std::vector<DeadlockCycle> cycles = {};

    // Reachability Detector only.
    std::vector<ProcessID> safe_sequence = {};
    std::vector<bool> finish = {};
    ResourceVector final_work = {};
};

#ifdef COLLECT_STATISTICS
typedef struct
{
    StatisticKey statistics_key;
    StatisticValue statistics_value;
} StatisticReport;
#endif

std::string mode_name(DetectionMode mode);
std::string process_label(ProcessID pid);
std::string resource_label(ResourceID rid);

#endif
