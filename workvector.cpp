#include <sstream>
#include "workvector.hpp"

WorkVector::WorkVector() {}
WorkVector::WorkVector(const ResourceVector& available) : _work(available) {}

InstanceCount WorkVector::find(ResourceID resource_id) const {
    if(resource_id < 0 || static_cast<size_t>(resource_id) >= _work.size()) {
        return 0;
    }
    return _work[resource_id];
}

/**
 * Component-wise request <= Work. One failing component fails the whole comparison.
 */
bool WorkVector::covers(const ResourceVector& request) const {
    return first_shortfall(request) < 0;
}

ResourceID WorkVector::first_shortfall(const ResourceVector& request) const {
    for(size_t j = 0; j < request.size(); j++) {
        if(request[j] > find(static_cast<ResourceID>(j))) {
            return static_cast<ResourceID>(j);
        }
    }
    return -1;
}

// A finishing process hands back everything it holds.
void WorkVector::release_into(const ResourceVector& allocation) {
    if(_work.size() < allocation.size()) {
        _work.resize(allocation.size(), 0);
    }
    for(size_t j = 0; j < allocation.size(); j++) {
        _work[j] += allocation[j];
    }
}

ResourceVector WorkVector::values() const {
    return _work;
}

std::string WorkVector::to_string() const {
    return format_vector(_work);
}

std::string format_vector(const ResourceVector& vector) {
    std::stringstream stream;
    stream << "[";
    for(size_t j = 0; j < vector.size(); j++) {
        if(j > 0) stream << ", ";
        stream << vector[j];
    }
    stream << "]";
    return stream.str();
}
