/**
 * @file JsonMetricStore.cpp
 * @brief Implementation of JsonMetricStore.
 */

#include "infrastructure/JsonMetricStore.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include "domain/DomainErrors.hpp"

using json = nlohmann::json;

namespace metriclens::infrastructure {

namespace {

/**
 * @class DailySeriesProvider
 * @brief Read-only lookup into one metric's day -> value map.
 */
class DailySeriesProvider : public domain::ValueProvider {
public:
    explicit DailySeriesProvider(std::shared_ptr<const std::map<long, double>> values)
        : m_values(std::move(values)) {}

    std::optional<double> valueFor(const domain::CalendarDay& day) const override {
        auto it = m_values->find(day.serial());
        if (it == m_values->end()) return std::nullopt;
        return it->second;
    }

private:
    std::shared_ptr<const std::map<long, double>> m_values;
};

domain::CalendarDay parseDay(const std::string& text, const std::string& context) {
    auto day = domain::CalendarDay::Parse(text);
    if (!day) {
        throw domain::DatasetError(context + ": invalid date '" + text + "'");
    }
    return *day;
}

domain::DataMetric parseMetric(const json& m) {
    if (!m.is_object() || !m.contains("key") || !m["key"].is_string()) {
        throw domain::DatasetError("metric entry without a string 'key'");
    }
    domain::DataMetric metric;
    metric.key = m["key"].get<std::string>();
    if (metric.key.empty()) {
        throw domain::DatasetError("metric entry with an empty 'key'");
    }
    metric.displayName = m.value("name", metric.key);

    const std::string categoryName = m.value("category", std::string("health"));
    auto category = domain::CategoryFromString(categoryName);
    if (!category) {
        throw domain::DatasetError("metric '" + metric.key + "': unknown category '" + categoryName + "'");
    }
    metric.category = *category;
    if (m.contains("unit") && m["unit"].is_string()) {
        metric.unit = m["unit"].get<std::string>();
    }
    return metric;
}

} // namespace

JsonMetricStore JsonMetricStore::LoadFromFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw domain::DatasetError("cannot open " + path);
    }
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return LoadFromString(text);
}

JsonMetricStore JsonMetricStore::LoadFromString(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw domain::DatasetError(std::string("parse failure: ") + e.what());
    }
    if (!root.is_object()) {
        throw domain::DatasetError("top level must be an object");
    }

    JsonMetricStore store;
    try {
        store.parseDocument(root);
    } catch (const json::exception& e) {
        throw domain::DatasetError(std::string("unexpected value type: ") + e.what());
    }
    return store;
}

void JsonMetricStore::parseDocument(const nlohmann::json& root) {
    if (root.contains("metrics")) {
        if (!root["metrics"].is_array()) throw domain::DatasetError("'metrics' must be an array");
        for (const auto& m : root["metrics"]) {
            domain::DataMetric metric = parseMetric(m);

            DailyValues values;
            if (m.contains("values")) {
                if (!m["values"].is_object()) {
                    throw domain::DatasetError("metric '" + metric.key + "': 'values' must be an object");
                }
                for (auto it = m["values"].begin(); it != m["values"].end(); ++it) {
                    if (it.value().is_null()) continue; // explicit "no observation"
                    if (!it.value().is_number()) {
                        throw domain::DatasetError("metric '" + metric.key + "': non-numeric value on " + it.key());
                    }
                    values[parseDay(it.key(), metric.key).serial()] = it.value().get<double>();
                }
            }
            addSeries(std::move(metric), std::move(values));
        }
    }

    if (root.contains("journal")) {
        if (!root["journal"].is_array()) throw domain::DatasetError("'journal' must be an array");

        // Mean mood of all entries written on the same day.
        std::map<long, std::pair<double, int>> sums;
        for (const auto& entry : root["journal"]) {
            if (!entry.is_object() || !entry.contains("createdAt") || !entry["createdAt"].is_string()) {
                throw domain::DatasetError("journal entry without a string 'createdAt'");
            }
            if (!entry.contains("mood") || entry["mood"].is_null()) continue;
            if (!entry["mood"].is_number()) {
                throw domain::DatasetError("journal entry with non-numeric 'mood'");
            }
            const long day = parseDay(entry["createdAt"].get<std::string>(), "journal").serial();
            auto& [sum, count] = sums[day];
            sum += entry["mood"].get<double>();
            ++count;
        }

        if (!sums.empty()) {
            DailyValues mood;
            for (const auto& [day, acc] : sums) {
                mood[day] = acc.first / acc.second;
            }
            domain::DataMetric metric;
            metric.key = kJournalMoodKey;
            metric.displayName = "Journal Mood";
            metric.category = domain::MetricCategory::Mood;
            addSeries(std::move(metric), std::move(mood));
        }
    }
}

void JsonMetricStore::addSeries(domain::DataMetric metric, DailyValues values) {
    for (const auto& s : m_series) {
        if (s.metric.key == metric.key) {
            throw domain::DatasetError("duplicate metric key '" + metric.key + "'");
        }
    }
    m_series.push_back(Series{std::move(metric), std::make_shared<const DailyValues>(std::move(values))});
}

std::vector<domain::DataMetric> JsonMetricStore::metrics() const {
    std::vector<domain::DataMetric> out;
    out.reserve(m_series.size());
    for (const auto& s : m_series) out.push_back(s.metric);
    return out;
}

std::shared_ptr<const domain::ValueProvider> JsonMetricStore::providerFor(const std::string& key) const {
    for (const auto& s : m_series) {
        if (s.metric.key == key) {
            return std::make_shared<DailySeriesProvider>(s.values);
        }
    }
    return nullptr;
}

void JsonMetricStore::registerAll(application::MetricCatalog& catalog) const {
    for (const auto& s : m_series) {
        catalog.registerMetric(s.metric, std::make_shared<DailySeriesProvider>(s.values));
    }
}

std::optional<domain::CalendarDay> JsonMetricStore::latestDay() const {
    std::optional<long> latest;
    for (const auto& s : m_series) {
        if (s.values->empty()) continue;
        const long last = s.values->rbegin()->first;
        if (!latest || last > *latest) latest = last;
    }
    if (!latest) return std::nullopt;
    return domain::CalendarDay::FromSerial(*latest);
}

std::size_t JsonMetricStore::observationCount(const std::string& key) const {
    for (const auto& s : m_series) {
        if (s.metric.key == key) return s.values->size();
    }
    return 0;
}

} // namespace metriclens::infrastructure
