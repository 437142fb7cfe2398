#ifndef WORKVECTOR_H
#define WORKVECTOR_H

#include <string>
#include <vector>
#include "deadframe_types.hpp"

/**
 * Private scratch copy of the free instances per resource type.
 * Detectors own one each, the SystemState it was copied from is never touched.
 */
class WorkVector {
    public:
        ResourceVector _work = {};
        WorkVector();
        WorkVector(const ResourceVector& available);
        InstanceCount find(ResourceID resource_id) const;
        bool covers(const ResourceVector& request) const;
        ResourceID first_shortfall(const ResourceVector& request) const;
        void release_into(const ResourceVector& allocation);
        ResourceVector values() const;
        std::string to_string() const;
};

std::string format_vector(const ResourceVector& vector);

#endif
