/**
 * @file CorrelationExporter.cpp
 * @brief Implementation of CorrelationExporter.
 */

#include "infrastructure/CorrelationExporter.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace metriclens::infrastructure {

namespace {

json metricToJson(const domain::DataMetric& metric) {
    json j = {
        {"key", metric.key},
        {"name", metric.displayName},
        {"category", domain::CategoryToString(metric.category)}
    };
    j["unit"] = metric.unit ? json(*metric.unit) : json(nullptr);
    return j;
}

json resultToJson(const domain::CorrelationResult& r) {
    return {
        {"id", r.id},
        {"metricX", metricToJson(r.metricX)},
        {"metricY", metricToJson(r.metricY)},
        {"correlationCoefficient", r.correlationCoefficient},
        {"confidenceScore", r.confidenceScore},
        {"sampleSize", r.sampleSize},
        {"lag", r.lag},
        {"significance", domain::SignificanceToString(r.significance)},
        {"description", r.description}
    };
}

json rangeToJson(const domain::DateRange& range) {
    return {{"first", range.first.toString()}, {"last", range.last.toString()}};
}

} // namespace

std::string CorrelationExporter::ToJson(const application::CorrelationScan& scan,
                                        const std::vector<domain::CorrelationSuggestion>& suggestions) {
    json j;
    j["range"] = rangeToJson(scan.range);
    j["pairsTotal"] = scan.pairsTotal;
    j["pairsEvaluated"] = scan.pairsEvaluated;
    j["cancelled"] = scan.cancelled;

    j["results"] = json::array();
    for (const auto& r : scan.results) {
        j["results"].push_back(resultToJson(r));
    }

    j["failures"] = json::array();
    for (const auto& f : scan.failures) {
        j["failures"].push_back({{"metricX", f.metricX.key}, {"metricY", f.metricY.key}, {"message", f.message}});
    }

    j["suggestions"] = json::array();
    for (const auto& s : suggestions) {
        j["suggestions"].push_back({
            {"id", s.id},
            {"resultId", s.result.id},
            {"insight", s.insight},
            {"suggestedChange", s.suggestedChange},
            {"expectedImpact", s.expectedImpact},
            {"priority", s.priority}
        });
    }
    return j.dump(4);
}

std::string CorrelationExporter::ToJson(const domain::MetricRelationship& relationship) {
    json j;
    j["metricX"] = metricToJson(relationship.metricX);
    j["metricY"] = metricToJson(relationship.metricY);
    j["range"] = rangeToJson(relationship.range);
    j["lag"] = relationship.lag;
    j["points"] = json::array();
    for (const auto& p : relationship.points) {
        j["points"].push_back({{"date", p.date.toString()}, {"x", p.valueX}, {"y", p.valueY}});
    }
    return j.dump(4);
}

bool CorrelationExporter::WriteAtomically(const std::string& path, const std::string& content) {
    fs::path finalPath = path;

    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[CorrelationExporter] Error creating directories: " << e.what() << std::endl;
        return false;
    }

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            std::cerr << "[CorrelationExporter] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[CorrelationExporter] Write failed during output: " << tempPath << std::endl;
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[CorrelationExporter] Rename failed: " << ec.message() << std::endl;
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

} // namespace metriclens::infrastructure
