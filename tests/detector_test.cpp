#include <gtest/gtest.h>
#include <random>
#include "../deadframe.hpp"
#include "../reachabilitydetector.hpp"
#include "../samples.hpp"
#include "../waitfordetector.hpp"

std::vector<Process> make_processes(int count) {
    std::vector<Process> processes = {};
    for(int i = 0; i < count; i++) processes.push_back(Process { i, process_label(i) });
    return processes;
}

std::vector<ResourceType> make_resource_types(std::vector<InstanceCount> instances) {
    std::vector<ResourceType> resource_types = {};
    for(size_t j = 0; j < instances.size(); j++) {
        resource_types.push_back(ResourceType { static_cast<ResourceID>(j), resource_label(static_cast<ResourceID>(j)), instances[j] });
    }
    return resource_types;
}

SystemState scenario_a() {
    return SystemState::create(make_processes(3), make_resource_types({1, 1, 1}),
                               {0, 0, 0},
                               {{1, 0, 0}, {0, 1, 0}, {0, 0, 1}},
                               {{0, 1, 0}, {0, 0, 1}, {1, 0, 0}});
}

SystemState scenario_b() {
    return SystemState::create(make_processes(2), make_resource_types({1, 1}),
                               {0, 0},
                               {{1, 0}, {0, 1}},
                               {{0, 0}, {0, 0}});
}

SystemState scenario_c() {
    return SystemState::create(make_processes(3), make_resource_types({8, 4, 4}),
                               {3, 3, 2},
                               {{0, 1, 0}, {2, 0, 0}, {3, 0, 2}},
                               {{0, 0, 0}, {1, 0, 2}, {0, 0, 0}});
}

// P0 <-> P1 deadlock, P2 waits on P0 without being part of the cycle.
SystemState transitively_blocked() {
    return SystemState::create(make_processes(3), make_resource_types({1, 1}),
                               {0, 0},
                               {{1, 0}, {0, 1}, {0, 0}},
                               {{0, 1}, {1, 0}, {1, 0}});
}

// Random single-instance state: every resource is free or held by exactly one process.
SystemState random_single_instance_state(std::mt19937* generator, int n, int m) {
    std::uniform_int_distribution<int> holder(-1, n - 1);
    std::bernoulli_distribution wants(0.3);

    ResourceVector available(m, 0);
    ResourceMatrix allocation(n, ResourceVector(m, 0));
    ResourceMatrix request(n, ResourceVector(m, 0));
    for(int j = 0; j < m; j++) {
        int k = holder(*generator);
        if(k < 0) available[j] = 1;
        else allocation[k][j] = 1;
    }
    for(int i = 0; i < n; i++) {
        for(int j = 0; j < m; j++) {
            if(wants(*generator)) request[i][j] = 1;
        }
    }
    std::vector<InstanceCount> instances(m, 1);
    return SystemState::create(make_processes(n), make_resource_types(instances), available, allocation, request);
}

std::vector<std::string> trace_messages(const DetectionResult& result) {
    std::vector<std::string> messages = {};
    for(auto& step: result.trace) messages.push_back(step.message);
    return messages;
}

TEST(WaitForDetectorTest, ScenarioA) {
    WaitForDetector detector;
    DetectionResult result = detector.detect(scenario_a());

    ASSERT_TRUE(result.deadlocked);
    ASSERT_EQ(result.deadlocked_processes, std::set<ProcessID>({0, 1, 2}));
    ASSERT_EQ(result.cycles.size(), 1);
    ASSERT_EQ(result.cycles.at(0).closed_path(), std::vector<ProcessID>({0, 1, 2, 0}));

    std::vector<ResourceID> resources = {};
    for(auto& edge: result.cycles.at(0).edges) resources.push_back(edge.resource_id);
    ASSERT_EQ(resources, std::vector<ResourceID>({1, 2, 0}));
}

TEST(WaitForDetectorTest, EdgesAreSortedAndLabeled) {
    WaitForDetector detector;
    std::vector<WaitForEdge> edges = detector.build_edges(scenario_a());

    ASSERT_EQ(edges.size(), 3);
    ASSERT_EQ(edges.at(0).from, 0);
    ASSERT_EQ(edges.at(0).to, 1);
    ASSERT_EQ(edges.at(0).resource_id, 1);
    ASSERT_EQ(edges.at(2).from, 2);
    ASSERT_EQ(edges.at(2).to, 0);
    ASSERT_EQ(edges.at(2).resource_id, 0);
}

TEST(WaitForDetectorTest, ScenarioBHasNoEdges) {
    WaitForDetector detector;
    DetectionResult result = detector.detect(scenario_b());

    ASSERT_FALSE(result.deadlocked);
    ASSERT_TRUE(result.deadlocked_processes.empty());
    ASSERT_TRUE(result.wait_for_edges.empty());
    ASSERT_TRUE(result.cycles.empty());
}

TEST(WaitForDetectorTest, TransitivelyBlockedProcessIsNotDeadlocked) {
    WaitForDetector detector;
    DetectionResult result = detector.detect(transitively_blocked());

    ASSERT_TRUE(result.deadlocked);
    ASSERT_EQ(result.deadlocked_processes, std::set<ProcessID>({0, 1}));
    ASSERT_EQ(result.cycles.size(), 1);
}

TEST(WaitForDetectorTest, ReportsEveryElementaryCycle) {
    // 0 -> 1, 1 -> 0, 1 -> 2, 2 -> 0
    SystemState state = SystemState::create(make_processes(3), make_resource_types({1, 1, 1}),
                                            {0, 0, 0},
                                            {{1, 0, 0}, {0, 1, 0}, {0, 0, 1}},
                                            {{0, 1, 0}, {1, 0, 1}, {1, 0, 0}});
    WaitForDetector detector;
    DetectionResult result = detector.detect(state);

    ASSERT_EQ(result.cycles.size(), 2);
    ASSERT_EQ(result.cycles.at(0).processes, std::vector<ProcessID>({0, 1}));
    ASSERT_EQ(result.cycles.at(1).processes, std::vector<ProcessID>({0, 1, 2}));
    ASSERT_EQ(result.deadlocked_processes, std::set<ProcessID>({0, 1, 2}));
}

TEST(WaitForDetectorTest, CycleThroughFinishedNodeIsStillFound) {
    // 0 -> 1, 0 -> 2, 1 -> 0, 2 -> 1: P2 only lies on 0 -> 2 -> 1 -> 0.
    SystemState state = SystemState::create(make_processes(3), make_resource_types({1, 1, 1}),
                                            {0, 0, 0},
                                            {{1, 0, 0}, {0, 1, 0}, {0, 0, 1}},
                                            {{0, 1, 1}, {1, 0, 0}, {0, 1, 0}});
    WaitForDetector detector;
    DetectionResult result = detector.detect(state);

    ASSERT_EQ(result.cycles.size(), 2);
    ASSERT_EQ(result.cycles.at(1).closed_path(), std::vector<ProcessID>({0, 2, 1, 0}));
    ASSERT_EQ(result.deadlocked_processes, std::set<ProcessID>({0, 1, 2}));
}

TEST(WaitForDetectorTest, RequestingOwnResourceIsASelfCycle) {
    SystemState state = SystemState::create(make_processes(1), make_resource_types({1}), {0}, {{1}}, {{1}});
    WaitForDetector detector;
    DetectionResult result = detector.detect(state);

    ASSERT_TRUE(result.deadlocked);
    ASSERT_EQ(result.cycles.size(), 1);
    ASSERT_EQ(result.cycles.at(0).closed_path(), std::vector<ProcessID>({0, 0}));
}

TEST(WaitForDetectorTest, LongCycle) {
    const int n = 5;
    ResourceMatrix allocation(n, ResourceVector(n, 0));
    ResourceMatrix request(n, ResourceVector(n, 0));
    for(int i = 0; i < n; i++) {
        allocation[i][i] = 1;
        request[i][(i + 1) % n] = 1;
    }
    SystemState state = SystemState::create(make_processes(n), make_resource_types(std::vector<InstanceCount>(n, 1)),
                                            ResourceVector(n, 0), allocation, request);
    WaitForDetector detector;
    DetectionResult result = detector.detect(state);

    ASSERT_EQ(result.cycles.size(), 1);
    ASSERT_EQ(result.cycles.at(0).closed_path(), std::vector<ProcessID>({0, 1, 2, 3, 4, 0}));
}

TEST(WaitForDetectorTest, WarnsOnMultiInstanceState) {
    WaitForDetector detector;
    DetectionResult result = detector.detect(sample_multi_instance_deadlock());

    bool warned = false;
    for(auto& step: result.trace) warned = warned || step.action == TRACE_WARNING;
    ASSERT_TRUE(warned);
}

TEST(ReachabilityDetectorTest, ScenarioB) {
    ReachabilityDetector detector;
    DetectionResult result = detector.detect(scenario_b());

    ASSERT_FALSE(result.deadlocked);
    ASSERT_EQ(result.safe_sequence, std::vector<ProcessID>({0, 1}));
    ASSERT_EQ(result.final_work, ResourceVector({1, 1}));
}

TEST(ReachabilityDetectorTest, ScenarioC) {
    SystemState state = scenario_c();
    ReachabilityDetector detector;
    DetectionResult result = detector.detect(state);

    ASSERT_FALSE(result.deadlocked);
    ASSERT_EQ(result.safe_sequence, std::vector<ProcessID>({0, 1, 2}));
    ASSERT_EQ(result.final_work, ResourceVector({8, 4, 4}));
    ASSERT_EQ(result.finish, std::vector<bool>({true, true, true}));

    ResourceVector replayed = {};
    ASSERT_TRUE(replay_safe_sequence(state, result.safe_sequence, &replayed));
    ASSERT_EQ(replayed, result.final_work);
    // Finishing P2 before P1 is just as valid.
    ASSERT_TRUE(replay_safe_sequence(state, {0, 2, 1}, nullptr));
}

TEST(ReachabilityDetectorTest, ReplayRejectsInvalidOrders) {
    SystemState state = sample_single_instance_no_deadlock();
    // P0 needs R1, which P1 still holds.
    ASSERT_FALSE(replay_safe_sequence(state, {0, 1, 2}, nullptr));
    ASSERT_FALSE(replay_safe_sequence(state, {1, 1}, nullptr));
    ASSERT_TRUE(replay_safe_sequence(state, {1, 0, 2}, nullptr));
}

TEST(ReachabilityDetectorTest, MultiInstanceDeadlock) {
    ReachabilityDetector detector;
    DetectionResult result = detector.detect(sample_multi_instance_deadlock());

    ASSERT_TRUE(result.deadlocked);
    ASSERT_EQ(result.deadlocked_processes, std::set<ProcessID>({0, 1, 2}));
    ASSERT_TRUE(result.safe_sequence.empty());
    ASSERT_EQ(result.final_work, ResourceVector({0, 0, 0}));
}

TEST(ReachabilityDetectorTest, PartialDeadlockLeavesFreeProcessOut) {
    SystemState state = SystemState::create(make_processes(3), make_resource_types({1, 1, 1}),
                                            {0, 0, 1},
                                            {{1, 0, 0}, {0, 1, 0}, {0, 0, 0}},
                                            {{0, 1, 0}, {1, 0, 0}, {0, 0, 1}});
    ReachabilityDetector detector;
    DetectionResult result = detector.detect(state);

    ASSERT_TRUE(result.deadlocked);
    ASSERT_EQ(result.deadlocked_processes, std::set<ProcessID>({0, 1}));
    ASSERT_EQ(result.finish, std::vector<bool>({false, false, true}));
}

TEST(ReachabilityDetectorTest, TransitivelyBlockedCountsAsDeadlocked) {
    ReachabilityDetector detector;
    DetectionResult result = detector.detect(transitively_blocked());
    ASSERT_EQ(result.deadlocked_processes, std::set<ProcessID>({0, 1, 2}));
}

TEST(ReachabilityDetectorTest, TraceRecordsGrantsInOrder) {
    SystemState state = sample_multi_instance_no_deadlock();
    ReachabilityDetector detector;
    DetectionResult result = detector.detect(state);

    ASSERT_FALSE(result.deadlocked);
    std::vector<ProcessID> granted = {};
    WorkVector work(state.available());
    for(auto& step: result.trace) {
        if(step.action != TRACE_GRANT) continue;
        ASSERT_EQ(step.work, work.values());
        granted.push_back(step.process_id);
        work.release_into(state.allocation(step.process_id));
    }
    ASSERT_EQ(granted, result.safe_sequence);
    ASSERT_EQ(work.values(), ResourceVector({10, 5, 7}));
}

TEST(CrossDetectorTest, SamplesAgreeOnSingleInstance) {
    WaitForDetector wait_for;
    ReachabilityDetector reachability;
    for(auto& name: sample_names()) {
        SystemState state = load_sample(name);
        if(!state.is_single_instance()) continue;
        ASSERT_EQ(wait_for.detect(state).deadlocked, reachability.detect(state).deadlocked) << name;
    }
}

TEST(CrossDetectorTest, RandomSingleInstanceStatesAgree) {
    std::mt19937 generator(1208);
    WaitForDetector wait_for;
    ReachabilityDetector reachability;
    for(int round = 0; round < 500; round++) {
        SystemState state = random_single_instance_state(&generator, 2 + round % 5, 1 + round % 6);
        DetectionResult cycles = wait_for.detect(state);
        DetectionResult matrix = reachability.detect(state);
        ASSERT_EQ(cycles.deadlocked, matrix.deadlocked) << "round " << round;
        // Cycle members can never finish.
        for(ProcessID pid: cycles.deadlocked_processes) {
            ASSERT_EQ(matrix.deadlocked_processes.count(pid), 1) << "round " << round;
        }
    }
}

TEST(CrossDetectorTest, DetectionIsIdempotent) {
    WaitForDetector wait_for;
    ReachabilityDetector reachability;
    SystemState state = transitively_blocked();

    DetectionResult first = wait_for.detect(state);
    DetectionResult second = wait_for.detect(state);
    ASSERT_EQ(first.deadlocked, second.deadlocked);
    ASSERT_EQ(first.deadlocked_processes, second.deadlocked_processes);
    ASSERT_EQ(trace_messages(first), trace_messages(second));

    first = reachability.detect(state);
    second = reachability.detect(state);
    ASSERT_EQ(first.deadlocked, second.deadlocked);
    ASSERT_EQ(first.deadlocked_processes, second.deadlocked_processes);
    ASSERT_EQ(trace_messages(first), trace_messages(second));
}

TEST(DeadFrameTest, ModeFollowsInstanceCounts) {
    ASSERT_EQ(DeadFrame::mode_for(scenario_a()), WAIT_FOR_GRAPH);
    ASSERT_EQ(DeadFrame::mode_for(scenario_c()), REACHABILITY);
}

TEST(DeadFrameTest, WaitForOnMultiInstanceIsRejected) {
    DeadFrame* deadFrame = new DeadFrame(WAIT_FOR_GRAPH);
    ASSERT_EQ(deadFrame->get_mode(), WAIT_FOR_GRAPH);
    ASSERT_THROW(deadFrame->detect(scenario_c()), PreconditionError);

    deadFrame->set_mode(REACHABILITY);
    ASSERT_EQ(deadFrame->get_mode(), REACHABILITY);
    ASSERT_EQ(deadFrame->get_detector().mode(), REACHABILITY);
    ASSERT_FALSE(deadFrame->detect(scenario_c()).deadlocked);
    delete deadFrame;
}

TEST(DeadFrameTest, DetectLeavesStateUntouched) {
    SystemState state = scenario_a();
    DeadFrame deadFrame(DeadFrame::mode_for(state));
    deadFrame.detect(state);
    ASSERT_EQ(state, scenario_a());
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
