#include <cstdint>
#include <fstream>
#include <limits>
#include "stateio.hpp"

nlohmann::json state_to_json(const SystemState& state) {
    nlohmann::json data;
    data["schema_version"] = STATE_SCHEMA_VERSION;

    data["processes"] = nlohmann::json::array();
    for(auto const& process: state.processes()) {
        data["processes"].push_back({ {"pid", process.pid}, {"name", process.name} });
    }
    data["resource_types"] = nlohmann::json::array();
    for(auto const& resource_type: state.resource_types()) {
        data["resource_types"].push_back({ {"rid", resource_type.rid}, {"name", resource_type.name}, {"instances", resource_type.instances} });
    }
    data["available"] = state.available();
    data["allocation"] = state.allocation();
    data["request"] = state.request();
    return data;
}

// Only JSON integers that fit InstanceCount are accepted.
static int read_integer(const nlohmann::json& value, const std::string& where, int row, int column) {
    if(!value.is_number_integer()) {
        throw ValidationError(FORMAT, where + " must be an integer, got " + value.dump(), row, column);
    }
    if(value.is_number_unsigned()) {
        if(value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<InstanceCount>::max())) {
            throw ValidationError(FORMAT, where + " is out of range: " + value.dump(), row, column);
        }
        return static_cast<int>(value.get<std::uint64_t>());
    }
    std::int64_t number = value.get<std::int64_t>();
    if(number < std::numeric_limits<InstanceCount>::min() || number > std::numeric_limits<InstanceCount>::max()) {
        throw ValidationError(FORMAT, where + " is out of range: " + value.dump(), row, column);
    }
    return static_cast<int>(number);
}

static const nlohmann::json& read_array(const nlohmann::json& value, const std::string& where, int row) {
    if(!value.is_array()) {
        throw ValidationError(FORMAT, where + " must be an array", row);
    }
    return value;
}

static ResourceVector read_vector(const nlohmann::json& value, const std::string& where, int row) {
    ResourceVector vector = {};
    for(auto const& entry: read_array(value, where, row)) {
        int column = static_cast<int>(vector.size());
        vector.push_back(read_integer(entry, where + "[" + std::to_string(column) + "]", row, column));
    }
    return vector;
}

static ResourceMatrix read_matrix(const nlohmann::json& value, const std::string& where) {
    ResourceMatrix matrix = {};
    for(auto const& row: read_array(value, where, -1)) {
        int i = static_cast<int>(matrix.size());
        matrix.push_back(read_vector(row, where + "[" + std::to_string(i) + "]", i));
    }
    return matrix;
}

SystemState state_from_json(const nlohmann::json& data) {
    if(!data.is_object()) {
        throw ValidationError(FORMAT, "state document must be a JSON object");
    }
    if(!data.contains("schema_version")) {
        throw ValidationError(FORMAT, "missing schema_version in JSON");
    }
    for(const char* key: { "processes", "resource_types", "available", "allocation", "request" }) {
        if(!data.contains(key)) {
            throw ValidationError(FORMAT, std::string("missing field ") + key + " in JSON");
        }
    }

    // Remaining type errors (names, missing keys) surface from nlohmann as json::exception.
    try {
        std::vector<Process> processes = {};
        for(auto const& process: read_array(data.at("processes"), "processes", -1)) {
            int i = static_cast<int>(processes.size());
            processes.push_back(Process {
                read_integer(process.at("pid"), "processes[" + std::to_string(i) + "].pid", i, -1),
                process.at("name").get<std::string>()
            });
        }
        std::vector<ResourceType> resource_types = {};
        for(auto const& resource_type: read_array(data.at("resource_types"), "resource_types", -1)) {
            int j = static_cast<int>(resource_types.size());
            std::string where = "resource_types[" + std::to_string(j) + "]";
            resource_types.push_back(ResourceType {
                read_integer(resource_type.at("rid"), where + ".rid", -1, j),
                resource_type.at("name").get<std::string>(),
                read_integer(resource_type.at("instances"), where + ".instances", -1, j)
            });
        }

        ResourceVector available = read_vector(data.at("available"), "available", -1);
        ResourceMatrix allocation = read_matrix(data.at("allocation"), "allocation");
        ResourceMatrix request = read_matrix(data.at("request"), "request");
        return SystemState::create(processes, resource_types, available, allocation, request);
    } catch(const nlohmann::json::exception& e) {
        throw ValidationError(FORMAT, std::string("malformed state document: ") + e.what());
    }
}

void save_state(const SystemState& state, const std::string& path) {
    std::ofstream file(path);
    if(!file.good()) {
        throw std::runtime_error("cannot write state file " + path);
    }
    file << state_to_json(state).dump(2) << std::endl;
}

SystemState load_state(const std::string& path) {
    std::ifstream file(path);
    if(!file.good()) {
        throw std::runtime_error("cannot read state file " + path);
    }
    nlohmann::json data;
    try {
        file >> data;
    } catch(const nlohmann::json::parse_error& e) {
        throw ValidationError(FORMAT, std::string("state file is not valid JSON: ") + e.what());
    }
    return state_from_json(data);
}

nlohmann::json result_to_json(const DetectionResult& result) {
    nlohmann::json data;
    data["mode"] = mode_name(result.mode);
    data["deadlocked"] = result.deadlocked;
    data["deadlocked_processes"] = result.deadlocked_processes;

    data["trace"] = nlohmann::json::array();
    for(auto const& step: result.trace) {
        data["trace"].push_back(step.message);
    }

    if(result.mode == WAIT_FOR_GRAPH) {
        data["wait_for_edges"] = nlohmann::json::array();
        for(auto const& edge: result.wait_for_edges) {
            data["wait_for_edges"].push_back({ {"from", edge.from}, {"to", edge.to}, {"resource", edge.resource_id} });
        }
        data["cycles"] = nlohmann::json::array();
        for(auto const& cycle: result.cycles) {
            nlohmann::json resources = nlohmann::json::array();
            for(auto const& edge: cycle.edges) resources.push_back(edge.resource_id);
            data["cycles"].push_back({ {"processes", cycle.closed_path()}, {"resources", resources} });
        }
    } else {
        data["safe_sequence"] = result.safe_sequence;
        data["finish"] = result.finish;
        data["final_work"] = result.final_work;
    }
    return data;
}

nlohmann::json suggestions_to_json(const std::vector<RecoverySuggestion>& suggestions) {
    nlohmann::json data = nlohmann::json::array();
    for(auto const& suggestion: suggestions) {
        nlohmann::json entry;
        entry["description"] = suggestion.description();
        entry["explanation"] = suggestion.explanation;
        if(suggestion.action == RECOVERY_TERMINATE) {
            entry["action"] = "terminate";
            entry["processes"] = suggestion.terminated;
        } else {
            entry["action"] = "preempt";
            entry["resource"] = suggestion.resource_id;
            entry["donor"] = suggestion.donor_id;
            entry["recipient"] = suggestion.recipient_id;
            entry["verified"] = suggestion.verified;
            entry["speculative"] = suggestion.speculative();
            entry["simulated"] = suggestion.simulated;
            if(suggestion.simulated) {
                entry["outcome_deadlocked"] = suggestion.outcome_deadlocked;
                entry["outcome_deadlocked_processes"] = suggestion.outcome_deadlocked_processes;
                entry["unblocked"] = suggestion.unblocked;
            }
        }
        data.push_back(entry);
    }
    return data;
}
