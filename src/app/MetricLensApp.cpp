/**
 * @file MetricLensApp.cpp
 * @brief Implementation of MetricLensApp.
 */

#include "app/MetricLensApp.hpp"
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include "application/CorrelationEngine.hpp"
#include "application/MetricCatalog.hpp"
#include "application/SuggestionGenerator.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/CorrelationExporter.hpp"
#include "infrastructure/JsonMetricStore.hpp"

namespace metriclens::app {

namespace {

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

} // namespace

void MetricLensApp::PrintUsage() {
    std::cerr << "Usage: metriclens <dataset.json> [--days N] [--settings DIR] [--metrics a,b,...] [--export FILE]"
              << std::endl;
}

std::optional<CommandLine> MetricLensApp::ParseArguments(const std::vector<std::string>& args) {
    CommandLine cmd;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto needValue = [&](const char* flag) -> std::optional<std::string> {
            if (i + 1 >= args.size()) {
                std::cerr << "[MetricLensApp] Missing value for " << flag << std::endl;
                return std::nullopt;
            }
            return args[++i];
        };

        if (arg == "--days") {
            auto v = needValue("--days");
            if (!v) return std::nullopt;
            try {
                size_t used = 0;
                int days = std::stoi(*v, &used);
                if (used != v->size() || days < 0) throw std::invalid_argument(*v);
                cmd.days = days;
            } catch (const std::exception&) {
                std::cerr << "[MetricLensApp] Invalid --days value: " << *v << std::endl;
                return std::nullopt;
            }
        } else if (arg == "--settings") {
            auto v = needValue("--settings");
            if (!v) return std::nullopt;
            cmd.settingsDir = *v;
        } else if (arg == "--metrics") {
            auto v = needValue("--metrics");
            if (!v) return std::nullopt;
            cmd.metricKeys = splitList(*v);
        } else if (arg == "--export") {
            auto v = needValue("--export");
            if (!v) return std::nullopt;
            cmd.exportPath = *v;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "[MetricLensApp] Unknown option: " << arg << std::endl;
            return std::nullopt;
        } else if (cmd.datasetPath.empty()) {
            cmd.datasetPath = arg;
        } else {
            std::cerr << "[MetricLensApp] Unexpected argument: " << arg << std::endl;
            return std::nullopt;
        }
    }

    if (cmd.datasetPath.empty()) {
        std::cerr << "[MetricLensApp] No dataset given." << std::endl;
        return std::nullopt;
    }
    return cmd;
}

int MetricLensApp::Run(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto cmd = ParseArguments(args);
    if (!cmd) {
        PrintUsage();
        return 1;
    }

    try {
        return Execute(*cmd);
    } catch (const std::exception& e) {
        std::cerr << "[MetricLensApp] " << e.what() << std::endl;
        return 1;
    }
}

int MetricLensApp::Execute(const CommandLine& cmd) {
    const auto config = infrastructure::ConfigLoader::LoadEngineConfig(cmd.settingsDir);
    const auto store = infrastructure::JsonMetricStore::LoadFromFile(cmd.datasetPath);
    application::MetricCatalog catalog;
    store.registerAll(catalog);

    // Anchor the window on the newest observation so archived datasets still analyse.
    const domain::CalendarDay anchor = store.latestDay().value_or(domain::CalendarDay::Today());
    application::CorrelationEngine engine(catalog, config, [anchor]() { return anchor; });

    std::vector<domain::DataMetric> selected;
    for (const auto& key : cmd.metricKeys) {
        domain::DataMetric m;
        m.key = key;
        selected.push_back(m);
    }

    const auto scan = engine.findCorrelations(selected, cmd.days.value_or(engine.config().defaultAnalysisDays));

    application::SuggestionGenerator generator;
    auto suggestions = generator.generateSuggestions(scan.results);

    std::cout << "Analysed " << scan.pairsEvaluated << " metric pairs over " << scan.range.toString() << std::endl;
    if (scan.results.empty()) {
        std::cout << "Not enough data yet to find meaningful correlations." << std::endl;
    }
    for (const auto& r : scan.results) {
        std::cout << "  " << r.description << "  [confidence " << std::fixed << std::setprecision(2)
                  << r.confidenceScore << "]" << std::endl;
    }
    for (const auto& f : scan.failures) {
        std::cout << "  (skipped " << f.metricX.key << " / " << f.metricY.key << ": " << f.message << ")" << std::endl;
    }

    if (!suggestions.empty()) {
        std::cout << std::endl << "Suggestions:" << std::endl;
    }
    for (const auto& s : suggestions) {
        std::cout << "  [P" << s.priority << "] " << s.insight << std::endl
                  << "       " << s.suggestedChange << std::endl
                  << "       " << s.expectedImpact << std::endl;
    }

    if (cmd.exportPath) {
        const std::string doc = infrastructure::CorrelationExporter::ToJson(scan, suggestions);
        if (!infrastructure::CorrelationExporter::WriteAtomically(*cmd.exportPath, doc)) {
            return 1;
        }
        std::cout << "[MetricLensApp] Exported to " << *cmd.exportPath << std::endl;
    }
    return 0;
}

} // namespace metriclens::app
