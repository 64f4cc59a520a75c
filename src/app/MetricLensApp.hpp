/**
 * @file MetricLensApp.hpp
 * @brief Command-line front end: load a dataset, scan for correlations, print suggestions.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace metriclens::app {

/**
 * @struct CommandLine
 * @brief Parsed arguments of the metriclens executable.
 */
struct CommandLine {
    std::string datasetPath;
    std::optional<int> days;              ///< Look-back window; defaults to the configured analysis window.
    std::string settingsDir = ".";        ///< Directory holding settings.json.
    std::vector<std::string> metricKeys;  ///< Empty = all metrics in the dataset.
    std::optional<std::string> exportPath;
};

/**
 * @class MetricLensApp
 * @brief Wires the JSON store, the engine and the exporter together for one run.
 */
class MetricLensApp {
public:
    /**
     * @brief Runs the tool.
     * @return Exit code (0 for success, 1 for usage or load errors).
     */
    int Run(int argc, char** argv);

    /**
     * @brief Parses argv.
     * @return nullopt (after printing the reason) when the arguments are invalid.
     */
    static std::optional<CommandLine> ParseArguments(const std::vector<std::string>& args);

private:
    static void PrintUsage();

    /** @brief One analysis run; errors propagate to Run. */
    int Execute(const CommandLine& cmd);
};

} // namespace metriclens::app
