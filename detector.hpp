#ifndef DETECTOR_H
#define DETECTOR_H

#include <string>
#include "deadframe_types.hpp"
#include "systemstate.hpp"

class Detector {
    public:
        virtual ~Detector() {}
        virtual DetectionMode mode() const = 0;
        virtual std::string name() const = 0;
        // Pure function of the state, safe to call concurrently on a shared state.
        virtual DetectionResult detect(const SystemState& state) const = 0;
};

#endif
