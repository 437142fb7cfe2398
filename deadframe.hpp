#ifndef DEADFRAME_H
#define DEADFRAME_H

#include <memory>
#include <string>
#include <vector>
#include "deadframe_types.hpp"
#include "detector.hpp"
#include "recovery.hpp"

/**
 * Entry point for the shell: owns the detector for the caller's chosen mode,
 * runs detection and hands deadlocked results to the Recovery Engine.
 *
 * The mode is the caller's bookkeeping. DeadFrame checks it against the state
 * but never switches algorithms by itself.
 */
class DeadFrame {
    private:
        std::unique_ptr<Detector> detector;
        DetectionMode detection_mode;
    public:
        RecoveryConfig recovery_config = {};
#ifdef COLLECT_STATISTICS
        std::vector<StatisticReport> statistics = {};
        void report_statistic(StatisticKey key, StatisticValue value);
#endif
        explicit DeadFrame(DetectionMode mode);
        void set_mode(DetectionMode mode);
        DetectionMode get_mode() const;
        const Detector& get_detector() const;

        // The dispatch rule callers use to pick a mode: WFG iff every resource has one instance.
        static DetectionMode mode_for(const SystemState& state);

        // Throws PreconditionError when WFG mode is used on a multi-instance state.
        DetectionResult detect(const SystemState& state);
        std::vector<RecoverySuggestion> recover(const SystemState& state, const DetectionResult& result);
};

std::unique_ptr<Detector> create_detector(DetectionMode mode);

#endif
