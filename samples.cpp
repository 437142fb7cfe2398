#include <map>
#include <stdexcept>
#include "samples.hpp"

static std::vector<Process> numbered_processes(int count) {
    std::vector<Process> processes = {};
    for(int i = 0; i < count; i++) processes.push_back(Process { i, process_label(i) });
    return processes;
}

static std::vector<ResourceType> resource_types_with(const std::vector<InstanceCount>& instances) {
    std::vector<ResourceType> resource_types = {};
    for(size_t j = 0; j < instances.size(); j++) {
        resource_types.push_back(ResourceType { static_cast<ResourceID>(j), resource_label(static_cast<ResourceID>(j)), instances[j] });
    }
    return resource_types;
}

// P0 -> P1 -> P2 -> P0, each holding the resource the previous one wants.
SystemState sample_single_instance_deadlock() {
    return SystemState::create(numbered_processes(3), resource_types_with({1, 1, 1}),
                               {0, 0, 0},
                               {{1, 0, 0}, {0, 1, 0}, {0, 0, 1}},
                               {{0, 1, 0}, {0, 0, 1}, {1, 0, 0}});
}

// P1 and P2 finish, then P0 gets R1.
SystemState sample_single_instance_no_deadlock() {
    return SystemState::create(numbered_processes(3), resource_types_with({1, 1, 1}),
                               {0, 0, 0},
                               {{1, 0, 0}, {0, 1, 0}, {0, 0, 1}},
                               {{0, 1, 0}, {0, 0, 0}, {0, 0, 0}});
}

SystemState sample_multi_instance_deadlock() {
    return SystemState::create(numbered_processes(3), resource_types_with({2, 2, 2}),
                               {0, 0, 0},
                               {{1, 0, 1}, {1, 1, 0}, {0, 1, 1}},
                               {{1, 1, 0}, {0, 1, 1}, {1, 0, 1}});
}

// Textbook detection example, every process finishes.
SystemState sample_multi_instance_no_deadlock() {
    return SystemState::create(numbered_processes(5), resource_types_with({10, 5, 7}),
                               {3, 3, 2},
                               {{0, 1, 0}, {2, 0, 0}, {3, 0, 2}, {2, 1, 1}, {0, 0, 2}},
                               {{0, 0, 0}, {1, 0, 2}, {0, 0, 0}, {1, 0, 0}, {0, 0, 2}});
}

SystemState sample_empty() {
    return SystemState::empty(3, 3);
}

static const std::map<std::string, SystemState (*)()> samples = {
    {"single-deadlock",    sample_single_instance_deadlock},
    {"single-no-deadlock", sample_single_instance_no_deadlock},
    {"multi-deadlock",     sample_multi_instance_deadlock},
    {"multi-no-deadlock",  sample_multi_instance_no_deadlock},
    {"empty",              sample_empty}};

std::vector<std::string> sample_names() {
    std::vector<std::string> names = {};
    for(auto const& sample: samples) names.push_back(sample.first);
    return names;
}

bool is_sample_supported(const std::string& name) {
    return samples.find(name) != samples.end();
}

SystemState load_sample(const std::string& name) {
    auto sample = samples.find(name);
    if(sample == samples.end()) {
        throw std::out_of_range("sample '" + name + "' not found");
    }
    return sample->second();
}
