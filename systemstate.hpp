#ifndef SYSTEMSTATE_H
#define SYSTEMSTATE_H

#include <vector>
#include "deadframe_types.hpp"
#include "deadframe_errors.hpp"

/**
 * Snapshot of a resource-allocation system: n processes, m resource types,
 * Available[m], Allocation[n][m] and Request[n][m].
 *
 * Only create() and the derived factories below produce instances, and all of
 * them validate the complete state before returning it. Once built the state is
 * a read-only value and can be shared between detector calls on any thread.
 */
class SystemState {
    private:
        std::vector<Process> _processes;
        std::vector<ResourceType> _resource_types;
        ResourceVector _available;
        ResourceMatrix _allocation;
        ResourceMatrix _request;

        SystemState(std::vector<Process> processes, std::vector<ResourceType> resource_types,
                    ResourceVector available, ResourceMatrix allocation, ResourceMatrix request);
        void validate() const;
        void validate_matrix(const ResourceMatrix& matrix, const char* matrix_name) const;
    public:
        static SystemState create(std::vector<Process> processes, std::vector<ResourceType> resource_types,
                                  ResourceVector available, ResourceMatrix allocation, ResourceMatrix request);
        // n processes and m single-instance resources, everything free.
        static SystemState empty(int process_count, int resource_count);

        int process_count() const;
        int resource_count() const;
        const std::vector<Process>& processes() const;
        const std::vector<ResourceType>& resource_types() const;
        const ResourceVector& available() const;
        const ResourceMatrix& allocation() const;
        const ResourceMatrix& request() const;
        const ResourceVector& allocation(ProcessID pid) const;
        const ResourceVector& request(ProcessID pid) const;
        InstanceCount instances(ResourceID rid) const;
        InstanceCount allocated_total(ResourceID rid) const;

        bool is_single_instance() const;

        /**
         * Hypothetical state with the given processes terminated: their
         * allocations go back to Available and their requests vanish. Surviving
         * processes are renumbered densely, surviving_pids maps new pid to old pid.
         * Throws PreconditionError when nothing would survive.
         */
        SystemState without_processes(const std::vector<ProcessID>& terminated, std::vector<ProcessID>* surviving_pids) const;

        // One instance of rid moves from donor to recipient and satisfies one unit of the recipient's request.
        SystemState with_transfer(ResourceID rid, ProcessID donor, ProcessID recipient) const;

        bool operator==(const SystemState& other) const;
        bool operator!=(const SystemState& other) const;
};

#endif
