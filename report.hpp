#ifndef REPORT_H
#define REPORT_H

#include <string>
#include <vector>
#include "deadframe_types.hpp"
#include "recovery.hpp"

std::string format_trace(const DetectionResult& result);
// Verdict, deadlocked set, cycles or safe sequence, without the step trace.
std::string format_summary(const DetectionResult& result);
std::string format_summary_csv(const DetectionResult& result);
std::string format_recovery_report(const std::vector<RecoverySuggestion>& suggestions);

#endif
