#ifndef STATEIO_H
#define STATEIO_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "systemstate.hpp"
#include "recovery.hpp"

const std::string STATE_SCHEMA_VERSION = "1.0";

nlohmann::json state_to_json(const SystemState& state);
// Throws ValidationError (rule FORMAT for structural problems) and never returns a partial state.
SystemState state_from_json(const nlohmann::json& data);

void save_state(const SystemState& state, const std::string& path);
SystemState load_state(const std::string& path);

nlohmann::json result_to_json(const DetectionResult& result);
nlohmann::json suggestions_to_json(const std::vector<RecoverySuggestion>& suggestions);

#endif
