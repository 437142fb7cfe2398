#ifndef SAMPLES_H
#define SAMPLES_H

#include <string>
#include <vector>
#include "systemstate.hpp"

SystemState sample_single_instance_deadlock();
SystemState sample_single_instance_no_deadlock();
SystemState sample_multi_instance_deadlock();
SystemState sample_multi_instance_no_deadlock();
SystemState sample_empty();

std::vector<std::string> sample_names();
bool is_sample_supported(const std::string& name);
// Throws std::out_of_range for unknown names.
SystemState load_sample(const std::string& name);

#endif
