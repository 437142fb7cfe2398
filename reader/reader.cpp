#include <iostream>
#include <string>
#include <sstream>
#include <fstream>
#include <vector>
#include <map>
#include <chrono>
#include <ctime>
#include <cstring>
#include <filesystem>
#include <unistd.h>
#include <iomanip>
#include "../deadframe.hpp"
#include "../report.hpp"
#include "../samples.hpp"
#include "../stateio.hpp"

const std::map<std::string, std::string> supported_modes = {
        {"WFG",    "Wait-for graph cycle detection (single-instance resources)"},
        {"MATRIX", "Work/Finish reachability detection (any resources)"},
        {"AUTO",   "WFG if every resource has one instance, MATRIX otherwise"}};

bool is_mode_supported(std::string mode) {
    return supported_modes.find(mode) != supported_modes.end();
}

DetectionMode resolve_mode(const std::string &mode, const SystemState &state) {
    if (mode == "WFG") return WAIT_FOR_GRAPH;
    if (mode == "MATRIX") return REACHABILITY;
    return DeadFrame::mode_for(state);
}

std::string stringifyStringVector(const std::vector<std::string> &v) {
    std::stringstream stream;
    for (auto string: v) {
        stream << string << " ";
    }
    return stream.str();
}

int main(int argc, char *argv[]) {

    const std::string usageString =
            "Usage: ./reader [WFG|MATRIX|AUTO]... [--recover] [--search-limit N] [--no-verify] [--csv|--json] [-v] "
            "[-o dir] [--no-console] [--timestamp] (/path/to/state.json | --sample NAME | --list-samples)\n";

    if (argc >= 2 && std::string(argv[argc - 1]) == "--list-samples") {
        for (auto &name: sample_names()) {
            std::cout << name << std::endl;
        }
        return 0;
    }

    if ((argc < 2)) {
        std::cout << "Not enough arguments specified. " << usageString;
        return 1;
    }

    // Unfortunately necessary as switch statements cannot be done easily over strings/char arrays.
    std::map<std::string, int> validCLIFlags = {
            {"--sample",       0},
            {"--recover",      1},
            {"-v",             2},
            {"--verbose",      2},
            {"--csv",          3},
            {"-o",             4},
            {"--output",       4},
            {"--no-console",   5},
            {"--timestamp",    6},
            {"--json",         7},
            {"--search-limit", 8},
            {"--no-verify",    9},
    };

    std::vector<std::string> enabledModes = {};
    bool sampleInput = false;
    bool recover = false;
    bool outputToFile = false;
    bool verboseMode = false;
    bool hideResultsFromStdout = false;
    bool csvOutput = false;
    bool jsonOutput = false;
    bool addTimestampToOutput = false;
    RecoveryConfig recoveryConfig = {};
    std::filesystem::path baseOutputPath("./");

    // The last element is always the state file or the sample name.
    for (int i = 1; i < argc - 1; i++) {
        if (strlen(argv[i]) >= 2 && strncmp("-", argv[i], 1) == 0) {
            auto foundFlag = validCLIFlags.find(std::string(argv[i]));
            if (foundFlag == validCLIFlags.end()) {
                std::cout << "Invalid flag " << argv[i] << " specified. " << usageString;
                return 1;
            }

            switch (foundFlag->second) {
                case 0: // --sample the last argument names a built-in sample instead of a file
                    sampleInput = true;
                    break;
                case 1: // --recover computes recovery suggestions for deadlocked states
                    recover = true;
                    break;
                case 2: // -v / --verbose prints the full step trace.
                    verboseMode = true;
                    break;
                case 3:
                    csvOutput = true;
                    break;
                case 4: // -o / --output Enables writing the results to files in the specified directory.
                    if (outputToFile || i + 1 >= argc - 1)
                        break; // Ignore subsequent output flags!
                    outputToFile = true;
                    baseOutputPath = std::filesystem::path(argv[i + 1]);
                    i++;
                    break;
                case 5: // disables the results getting printed to the console.
                    hideResultsFromStdout = true;
                    break;
                case 6:
                    addTimestampToOutput = true;
                    break;
                case 7:
                    jsonOutput = true;
                    break;
                case 8: // --search-limit caps the termination subset search
                    if (i + 1 >= argc - 1) {
                        std::cout << "--search-limit needs a value. " << usageString;
                        return 1;
                    }
                    if (!parse_search_limit(argv[i + 1], &recoveryConfig.termination_search_limit)) {
                        std::cout << "Invalid search limit " << argv[i + 1]
                                  << ", expected a positive whole number." << std::endl;
                        return 1;
                    }
                    i++;
                    break;
                case 9:
                    recoveryConfig.verify_preemption = false;
                    break;
            }
        } else if (is_mode_supported(std::string(argv[i]))) {
            enabledModes.push_back(std::string(argv[i]));
        } else {
            std::cout << "An invalid argument " << argv[i] << " was specified." << std::endl;
            return 1;
        }
    }

    if (csvOutput && jsonOutput) {
        std::cout << "--csv and --json cannot be combined. " << usageString;
        return 1;
    }

    // If neither the console will show any results nor any output file was enabled, exit.
    if (hideResultsFromStdout && !outputToFile) {
        std::cout << "All possible outputs were disabled. Hint: specify an output file with -o or remove --no-console. "
                  << usageString;
        return 1;
    }

    if (outputToFile) {
        if (!std::filesystem::is_directory(baseOutputPath)) {
            std::cout << "The given output path " << baseOutputPath << " is not a directory." << std::endl;
            return 1;
        }

        if (access(baseOutputPath.string().c_str(), W_OK) != 0) {
            std::cout << "The given output path " << baseOutputPath << " cannot be written to." << std::endl;
            return 1;
        }
    }

    if (enabledModes.empty()) {
        enabledModes.push_back("AUTO");
    }

    const std::string input(argv[argc - 1]);
    std::string inputName;
    std::vector<SystemState> loaded = {};
    try {
        if (sampleInput) {
            if (!is_sample_supported(input)) {
                std::cout << "Unknown sample " << input << ". Available: "
                          << stringifyStringVector(sample_names()) << std::endl;
                return 1;
            }
            loaded.push_back(load_sample(input));
            inputName = input;
        } else {
            std::filesystem::path statePath(input);
            if (!std::filesystem::exists(statePath)) {
                std::cout << "The specified state file " << statePath << " cannot be found." << std::endl;
                return 1;
            }
            loaded.push_back(load_state(statePath.string()));
            inputName = statePath.filename().string();
        }
    } catch (const ValidationError &e) {
        std::cout << "Invalid system state: " << e.what() << std::endl;
        return 1;
    } catch (const std::runtime_error &e) {
        std::cout << e.what() << std::endl;
        return 1;
    }
    const SystemState &state = loaded.front();

    std::cout << "Analyzing state " << inputName << " (" << state.process_count() << " processes, "
              << state.resource_count() << " resource types, "
              << (state.is_single_instance() ? "single-instance" : "multi-instance") << ")" << std::endl
              << "Enabled modes: " << stringifyStringVector(enabledModes) << std::endl
              << "Verbose: " << verboseMode << " CSV: " << csvOutput << " JSON: " << jsonOutput << std::endl;

    int exitCode = 0;
    for (auto &modeName: enabledModes) {
        DetectionMode mode = resolve_mode(modeName, state);
        DeadFrame deadFrame(mode);
        deadFrame.recovery_config = recoveryConfig;
        std::cout << "Beginning analysis using " << deadFrame.get_detector().name() << std::endl;
        auto start_time = std::chrono::steady_clock::now();

        DetectionResult result;
        std::vector<RecoverySuggestion> suggestions = {};
        try {
            result = deadFrame.detect(state);
            if (recover && result.deadlocked) {
                suggestions = deadFrame.recover(state, result);
            }
        } catch (const PreconditionError &e) {
            std::cout << modeName << " cannot analyze this state: " << e.what() << std::endl;
            exitCode = 1;
            continue;
        } catch (const SearchBoundError &e) {
            std::cout << "Recovery search aborted: " << e.what() << std::endl
                      << "Hint: raise the bound with --search-limit." << std::endl;
            exitCode = 1;
            continue;
        }
        auto end_time = std::chrono::steady_clock::now();

        std::stringstream resultStream;
        if (jsonOutput) {
            nlohmann::json document = result_to_json(result);
            if (recover) document["recovery"] = suggestions_to_json(suggestions);
            resultStream << document.dump(2) << std::endl;
        } else if (csvOutput) {
            resultStream << format_summary_csv(result);
        } else {
            if (verboseMode) resultStream << format_trace(result) << std::endl;
            resultStream << format_summary(result);
            if (recover && result.deadlocked) resultStream << std::endl << format_recovery_report(suggestions);
        }

        if (hideResultsFromStdout) {
            std::cout << "Results will only be written to the specified output directory." << std::endl;
        } else {
            std::cout << resultStream.str();
        }

        if (outputToFile) {
            std::stringstream fileName;
            fileName << "/" << mode_name(mode) << "_" << inputName;
            if (addTimestampToOutput) {
                fileName << "_";
                auto t = std::time(nullptr);
                auto tm = *std::localtime(&t);
                fileName << std::put_time(&tm, "%d-%m-%Y_%H-%M-%S");
            }
            if (jsonOutput)
                fileName << ".json";
            else if (csvOutput)
                fileName << ".csv";
            else
                fileName << ".txt";

            std::ofstream resultOutput(std::filesystem::path(baseOutputPath.string() + fileName.str()));
            resultOutput << resultStream.str();
        }

#ifdef COLLECT_STATISTICS
        for (auto &stat: deadFrame.statistics) {
            if (csvOutput) {
                std::cout << stat.statistics_key << "," << stat.statistics_value << std::endl;
            } else {
                std::cout << stat.statistics_key << ": " << stat.statistics_value << std::endl;
            }
        }
#endif // COLLECT_STATISTICS

        std::cout << "Analyzed in "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count() << "ms."
                  << std::endl;
        std::cout << (result.deadlocked ? "Deadlock detected." : "No deadlock.") << std::endl;
    }

    return exitCode;
}
