#include <algorithm>
#include <sstream>
#include <utility>
#include "systemstate.hpp"

SystemState::SystemState(std::vector<Process> processes, std::vector<ResourceType> resource_types,
                         ResourceVector available, ResourceMatrix allocation, ResourceMatrix request)
    : _processes(std::move(processes)), _resource_types(std::move(resource_types)), _available(std::move(available)),
      _allocation(std::move(allocation)), _request(std::move(request)) {}

SystemState SystemState::create(std::vector<Process> processes, std::vector<ResourceType> resource_types,
                                ResourceVector available, ResourceMatrix allocation, ResourceMatrix request) {
    SystemState state(std::move(processes), std::move(resource_types), std::move(available),
                      std::move(allocation), std::move(request));
    state.validate();
    return state;
}

SystemState SystemState::empty(int process_count, int resource_count) {
    std::vector<Process> processes = {};
    std::vector<ResourceType> resource_types = {};
    for(int i = 0; i < process_count; i++) {
        processes.push_back(Process { i, process_label(i) });
    }
    for(int j = 0; j < resource_count; j++) {
        resource_types.push_back(ResourceType { j, resource_label(j), 1 });
    }
    ResourceVector available(std::max(resource_count, 0), 1);
    ResourceMatrix zeros(std::max(process_count, 0), ResourceVector(std::max(resource_count, 0), 0));
    return create(processes, resource_types, available, zeros, zeros);
}

void SystemState::validate() const {
    const size_t n = _processes.size();
    const size_t m = _resource_types.size();

    if(n == 0) {
        throw ValidationError(EMPTY_SYSTEM, "system must contain at least one process");
    }
    if(m == 0) {
        throw ValidationError(EMPTY_SYSTEM, "system must contain at least one resource type");
    }

    // Ids double as display indices, so they have to be dense and 0-based.
    for(size_t i = 0; i < n; i++) {
        if(_processes[i].pid != static_cast<ProcessID>(i)) {
            std::stringstream message;
            message << "process at position " << i << " has pid " << _processes[i].pid << ", expected " << i;
            throw ValidationError(IDENTITY, message.str(), static_cast<int>(i));
        }
    }
    for(size_t j = 0; j < m; j++) {
        if(_resource_types[j].rid != static_cast<ResourceID>(j)) {
            std::stringstream message;
            message << "resource type at position " << j << " has rid " << _resource_types[j].rid << ", expected " << j;
            throw ValidationError(IDENTITY, message.str(), -1, static_cast<int>(j));
        }
        if(_resource_types[j].instances < 1) {
            std::stringstream message;
            message << "resource " << j << " must have at least one instance, got " << _resource_types[j].instances;
            throw ValidationError(INSTANCE_COUNT, message.str(), -1, static_cast<int>(j));
        }
    }

    if(_available.size() != m) {
        std::stringstream message;
        message << "dimension mismatch: available has " << _available.size() << " entries, expected " << m;
        throw ValidationError(DIMENSION, message.str());
    }
    validate_matrix(_allocation, "allocation");
    validate_matrix(_request, "request");

    for(size_t j = 0; j < m; j++) {
        if(_available[j] < 0) {
            std::stringstream message;
            message << "negative value at available[" << j << "]";
            throw ValidationError(NEGATIVE_VALUE, message.str(), -1, static_cast<int>(j));
        }
    }
    for(size_t i = 0; i < n; i++) {
        for(size_t j = 0; j < m; j++) {
            if(_allocation[i][j] < 0) {
                std::stringstream message;
                message << "negative value at allocation[" << i << "][" << j << "]";
                throw ValidationError(NEGATIVE_VALUE, message.str(), static_cast<int>(i), static_cast<int>(j));
            }
            if(_request[i][j] < 0) {
                std::stringstream message;
                message << "negative value at request[" << i << "][" << j << "]";
                throw ValidationError(NEGATIVE_VALUE, message.str(), static_cast<int>(i), static_cast<int>(j));
            }
        }
    }

    // available[j] + sum_i allocation[i][j] == instances[j], summed in long long.
    for(size_t j = 0; j < m; j++) {
        long long allocated = 0;
        for(auto const& row: _allocation) allocated += row[j];
        if(_available[j] + allocated != _resource_types[j].instances) {
            std::stringstream message;
            message << "resource conservation violated for resource " << j << ": available(" << _available[j]
                    << ")+allocated(" << allocated << ") != total(" << _resource_types[j].instances << ")";
            throw ValidationError(CONSERVATION, message.str(), -1, static_cast<int>(j));
        }
    }

    for(size_t i = 0; i < n; i++) {
        for(size_t j = 0; j < m; j++) {
            if(_request[i][j] > _resource_types[j].instances) {
                std::stringstream message;
                message << "request[" << i << "][" << j << "] = " << _request[i][j]
                        << " exceeds total instances of resource " << j << " (" << _resource_types[j].instances << ")";
                throw ValidationError(REQUEST_EXCEEDS_TOTAL, message.str(), static_cast<int>(i), static_cast<int>(j));
            }
        }
    }
}

void SystemState::validate_matrix(const ResourceMatrix& matrix, const char* matrix_name) const {
    if(matrix.size() != _processes.size()) {
        std::stringstream message;
        message << "dimension mismatch: " << matrix_name << " has " << matrix.size() << " rows, expected "
                << _processes.size();
        throw ValidationError(DIMENSION, message.str());
    }
    for(size_t i = 0; i < matrix.size(); i++) {
        if(matrix[i].size() != _resource_types.size()) {
            std::stringstream message;
            message << "dimension mismatch: " << matrix_name << "[" << i << "] has " << matrix[i].size()
                    << " columns, expected " << _resource_types.size();
            throw ValidationError(DIMENSION, message.str(), static_cast<int>(i));
        }
    }
}

int SystemState::process_count() const {
    return static_cast<int>(_processes.size());
}

int SystemState::resource_count() const {
    return static_cast<int>(_resource_types.size());
}

const std::vector<Process>& SystemState::processes() const {
    return _processes;
}

const std::vector<ResourceType>& SystemState::resource_types() const {
    return _resource_types;
}

const ResourceVector& SystemState::available() const {
    return _available;
}

const ResourceMatrix& SystemState::allocation() const {
    return _allocation;
}

const ResourceMatrix& SystemState::request() const {
    return _request;
}

const ResourceVector& SystemState::allocation(ProcessID pid) const {
    return _allocation.at(pid);
}

const ResourceVector& SystemState::request(ProcessID pid) const {
    return _request.at(pid);
}

InstanceCount SystemState::instances(ResourceID rid) const {
    return _resource_types.at(rid).instances;
}

InstanceCount SystemState::allocated_total(ResourceID rid) const {
    InstanceCount total = 0;
    for(auto const& row: _allocation) {
        total += row[rid];
    }
    return total;
}

bool SystemState::is_single_instance() const {
    return std::all_of(_resource_types.begin(), _resource_types.end(),
                       [](const ResourceType& resource_type) { return resource_type.instances == 1; });
}

SystemState SystemState::without_processes(const std::vector<ProcessID>& terminated, std::vector<ProcessID>* surviving_pids) const {
    std::vector<bool> removed(_processes.size(), false);
    for(ProcessID pid: terminated) {
        if(pid < 0 || pid >= process_count()) {
            throw PreconditionError("cannot terminate unknown process " + std::to_string(pid));
        }
        removed[pid] = true;
    }

    std::vector<Process> processes = {};
    ResourceVector available = _available;
    ResourceMatrix allocation = {};
    ResourceMatrix request = {};
    if(surviving_pids != nullptr) surviving_pids->clear();

    for(size_t i = 0; i < _processes.size(); i++) {
        if(removed[i]) {
            for(size_t j = 0; j < available.size(); j++) {
                available[j] += _allocation[i][j];
            }
            continue;
        }
        processes.push_back(Process { static_cast<ProcessID>(processes.size()), _processes[i].name });
        allocation.push_back(_allocation[i]);
        request.push_back(_request[i]);
        if(surviving_pids != nullptr) surviving_pids->push_back(static_cast<ProcessID>(i));
    }

    if(processes.empty()) {
        throw PreconditionError("terminating every process leaves no state to analyze");
    }

    return create(processes, _resource_types, available, allocation, request);
}

SystemState SystemState::with_transfer(ResourceID rid, ProcessID donor, ProcessID recipient) const {
    if(rid < 0 || rid >= resource_count()) {
        throw PreconditionError("cannot transfer unknown resource " + std::to_string(rid));
    }
    if(donor < 0 || donor >= process_count() || recipient < 0 || recipient >= process_count() || donor == recipient) {
        throw PreconditionError("transfer needs two distinct known processes");
    }
    if(_allocation[donor][rid] < 1) {
        throw PreconditionError(process_label(donor) + " holds no instance of " + resource_label(rid));
    }
    if(_request[recipient][rid] < 1) {
        throw PreconditionError(process_label(recipient) + " does not request " + resource_label(rid));
    }

    ResourceMatrix allocation = _allocation;
    ResourceMatrix request = _request;
    allocation[donor][rid] -= 1;
    allocation[recipient][rid] += 1;
    request[recipient][rid] -= 1;

    // Total held is unchanged, so Available recomputes to the same vector.
    ResourceVector available = _available;
    for(size_t j = 0; j < available.size(); j++) {
        InstanceCount held = 0;
        for(auto const& row: allocation) held += row[j];
        available[j] = _resource_types[j].instances - held;
    }

    return create(_processes, _resource_types, available, allocation, request);
}

bool SystemState::operator==(const SystemState& other) const {
    if(_processes.size() != other._processes.size() || _resource_types.size() != other._resource_types.size()) {
        return false;
    }
    for(size_t i = 0; i < _processes.size(); i++) {
        if(_processes[i].pid != other._processes[i].pid || _processes[i].name != other._processes[i].name) return false;
    }
    for(size_t j = 0; j < _resource_types.size(); j++) {
        const ResourceType& mine = _resource_types[j];
        const ResourceType& theirs = other._resource_types[j];
        if(mine.rid != theirs.rid || mine.name != theirs.name || mine.instances != theirs.instances) return false;
    }
    return _available == other._available && _allocation == other._allocation && _request == other._request;
}

bool SystemState::operator!=(const SystemState& other) const {
    return !(*this == other);
}
