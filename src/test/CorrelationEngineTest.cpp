#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>
#include "application/CorrelationEngine.hpp"
#include "application/MetricCatalog.hpp"
#include "domain/DomainErrors.hpp"
#include "TestFixtures.hpp"

using namespace metriclens;
using namespace metriclens::test;
using application::CorrelationEngine;
using application::CorrelationScan;

namespace {

const auto kSleep = MakeMetric("sleepHours", "Sleep Hours", domain::MetricCategory::Sleep);
const auto kFocus = MakeMetric("focusMinutes", "Focus Minutes", domain::MetricCategory::Productivity);

domain::DayClock fixedClock(domain::CalendarDay day) {
    return [day]() { return day; };
}

void testSleepFocusScenario() {
    application::MetricCatalog catalog;
    catalog.registerMetric(kSleep, Consecutive({7, 6, 8, 5, 7, 9, 6}));
    catalog.registerMetric(kFocus, Consecutive({120, 90, 150, 60, 130, 180, 100}));

    CorrelationEngine engine(catalog, application::EngineConfig{}, fixedClock(BaseDay() + 6));
    CorrelationScan scan = engine.findCorrelations({}, 6);

    assert(scan.range.first == BaseDay() && scan.range.last == BaseDay() + 6);
    assert(scan.pairsTotal == 1 && scan.pairsEvaluated == 1 && !scan.cancelled);
    assert(scan.results.size() == 1);

    const auto& r = scan.results[0];
    // metricX is the lexically smaller key
    assert(r.metricX.key == "focusMinutes" && r.metricY.key == "sleepHours");
    assert(r.sampleSize == 7);
    assert(r.lag == 0);
    assert(Near(r.correlationCoefficient, 0.992690869152844, 1e-9));
    assert(r.significance == domain::Significance::Strong);
    assert(r.confidenceScore > 0.99);
    assert(r.id.size() == 36 && r.id[14] == '8');
    assert(r.description.find("Strong positive correlation") == 0);
}

void testInsufficientOverlap() {
    application::MetricCatalog catalog;
    catalog.registerMetric(kSleep, Consecutive({7, 6, 8, 5, 7, 9, 6}, 0));
    catalog.registerMetric(kFocus, Consecutive({120, 90, 150, 60, 130, 180, 100}, 4));

    CorrelationEngine engine(catalog, application::EngineConfig{}, fixedClock(BaseDay() + 10));
    CorrelationScan scan = engine.findCorrelations({kSleep, kFocus}, 10);
    assert(scan.results.empty() && "Three overlapping days must not produce a result.");
    assert(scan.failures.empty());
    assert(scan.pairsEvaluated == 1);

    assert(!engine.analyzeRelationship(kSleep, kFocus));
}

void testLagScenario() {
    application::MetricCatalog catalog;
    auto lead = MakeMetric("a_lead", "Lead", domain::MetricCategory::Sleep);
    auto trail = MakeMetric("b_trail", "Trail", domain::MetricCategory::Productivity);

    const std::vector<double> x{3, 7, 1, 8, 2, 9, 4, 6, 5, 10, 2, 7, 3, 9, 1, 6, 8, 4, 10, 5};
    std::vector<double> y;
    for (double v : x) y.push_back(2.0 * v + 1.0);
    catalog.registerMetric(lead, Consecutive(x, 0));
    catalog.registerMetric(trail, Consecutive(y, 2));

    CorrelationEngine engine(catalog, application::EngineConfig{}, fixedClock(BaseDay() + 19));
    CorrelationScan scan = engine.findCorrelations({}, 19);
    assert(scan.results.size() == 1);
    assert(scan.results[0].lag == 2 && "The lagged relationship must win over the same-day one.");
    assert(Near(scan.results[0].correlationCoefficient, 1.0, 1e-12));
    assert(scan.results[0].sampleSize == 20);
    assert(scan.results[0].description.find("2 days later") != std::string::npos);

    auto relationship = engine.analyzeRelationship(lead, trail, domain::DateRange{BaseDay(), BaseDay() + 19});
    assert(relationship && relationship->lag == 2);
    assert(relationship->points.size() == 20);
    assert(relationship->points.front().valueY == 2.0 * x.front() + 1.0);

    // Default analysis window is anchored on the clock
    auto viaDefault = engine.analyzeRelationship(lead, trail);
    assert(viaDefault && viaDefault->range.last == BaseDay() + 19);
    assert(viaDefault->range.first == BaseDay() + 19 - engine.config().defaultAnalysisDays);

    assert(!engine.analyzeRelationship(lead, lead) && "Self pairs have no relationship.");

    auto reversed = engine.analyzeRelationship(trail, lead, domain::DateRange{BaseDay(), BaseDay() + 19});
    assert(reversed && reversed->lag == 2);
    assert(reversed->metricX.key == "a_lead" && reversed->metricY.key == "b_trail");
}

void testLaterKeyLeadsByOneDay() {
    application::MetricCatalog catalog;

    // focusMinutes(d + 1) = 20 * sleepHours(d) - 20
    const std::vector<double> hours{7, 6, 8, 5, 7, 9, 6, 8, 7, 5, 9, 6, 7, 8, 5, 6, 9, 7, 8, 6};
    std::vector<double> minutes;
    for (double h : hours) minutes.push_back(20.0 * h - 20.0);
    catalog.registerMetric(kSleep, Consecutive(hours, 0));
    catalog.registerMetric(kFocus, Consecutive(minutes, 1));

    CorrelationEngine engine(catalog, application::EngineConfig{}, fixedClock(BaseDay() + 19));
    CorrelationScan scan = engine.findCorrelations({}, 19);
    assert(scan.results.size() == 1);

    const auto& r = scan.results[0];
    assert(r.metricX.key == "sleepHours" && r.metricY.key == "focusMinutes" && "The leading metric is metricX.");
    assert(r.lag == 1);
    assert(Near(r.correlationCoefficient, 1.0, 1e-12));
    assert(r.sampleSize == 20);
    assert(r.significance == domain::Significance::Strong);
    assert(r.description.find("Sleep Hours and Focus Minutes 1 day later") != std::string::npos);

    // Both argument orders agree with the scan
    for (const auto& rel : {engine.analyzeRelationship(kSleep, kFocus, scan.range),
                            engine.analyzeRelationship(kFocus, kSleep, scan.range)}) {
        assert(rel);
        assert(rel->metricX.key == r.metricX.key && rel->metricY.key == r.metricY.key);
        assert(rel->lag == r.lag);
        assert(rel->points.size() == r.sampleSize);
        assert(rel->points.front().valueX == 7.0 && rel->points.front().valueY == 120.0);
    }
}

// Four metrics with different strengths, used for ordering and permutation checks.
void registerPanel(application::MetricCatalog& catalog) {
    const std::vector<double> base{5, 3, 8, 6, 2, 9, 4, 7, 1, 6, 5, 8, 3, 7, 2};
    std::vector<double> strong, moderate, noise;
    const std::vector<double> jitter{2, -3, 1, 4, -2, 0, 3, -4, 2, -1, 3, -3, 1, 0, -2};
    const std::vector<double> unrelated{4, 4, 1, 7, 3, 2, 6, 5, 5, 1, 7, 3, 6, 2, 4};
    for (size_t i = 0; i < base.size(); ++i) {
        strong.push_back(base[i] * 10.0 + jitter[i]);
        moderate.push_back(base[i] + jitter[i] * 1.2);
        noise.push_back(unrelated[i]);
    }
    catalog.registerMetric(MakeMetric("base", "Base", domain::MetricCategory::Sleep), Consecutive(base));
    catalog.registerMetric(MakeMetric("strong", "Strong", domain::MetricCategory::Productivity), Consecutive(strong));
    catalog.registerMetric(MakeMetric("moderate", "Moderate", domain::MetricCategory::Mood), Consecutive(moderate));
    catalog.registerMetric(MakeMetric("noise", "Noise", domain::MetricCategory::PhoneUsage), Consecutive(noise));
}

void testOrderingAndPermutation() {
    application::MetricCatalog catalog;
    registerPanel(catalog);

    application::EngineConfig config;
    config.lagOffsets = {0};
    config.maxWorkers = 3;
    CorrelationEngine engine(catalog, config, fixedClock(BaseDay() + 14));

    auto metrics = engine.listAvailableMetrics();
    assert(metrics.size() == 4);

    CorrelationScan forward = engine.findCorrelations(metrics, 14);
    std::vector<domain::DataMetric> reversed(metrics.rbegin(), metrics.rend());
    reversed.push_back(metrics[0]); // duplicates are ignored
    CorrelationScan backward = engine.findCorrelations(reversed, 14);

    assert(forward.pairsTotal == 6 && backward.pairsTotal == 6);
    assert(!forward.results.empty());
    assert(forward.results.size() == backward.results.size());
    for (size_t i = 0; i < forward.results.size(); ++i) {
        const auto& a = forward.results[i];
        const auto& b = backward.results[i];
        assert(a.id == b.id);
        assert(a.pairKey() == b.pairKey());
        assert(a.correlationCoefficient == b.correlationCoefficient);
        assert(a.confidenceScore == b.confidenceScore);
        assert(a.description == b.description);
    }

    // Ranked by confidence x |r|, none-significance filtered
    for (size_t i = 0; i < forward.results.size(); ++i) {
        assert(forward.results[i].significance != domain::Significance::None);
        assert(forward.results[i].metricX.key < forward.results[i].metricY.key);
        if (i > 0) assert(forward.results[i - 1].strength() >= forward.results[i].strength());
    }
    assert(forward.results[0].pairKey() == "base|strong");

    // Re-running yields identical output
    CorrelationScan again = engine.findCorrelations(metrics, 14);
    assert(again.results.size() == forward.results.size());
    for (size_t i = 0; i < again.results.size(); ++i) {
        assert(again.results[i].id == forward.results[i].id);
        assert(again.results[i].correlationCoefficient == forward.results[i].correlationCoefficient);
    }
}

void testPartialFailure() {
    application::MetricCatalog catalog;
    catalog.registerMetric(kSleep, Consecutive({7, 6, 8, 5, 7, 9, 6}));
    catalog.registerMetric(kFocus, Consecutive({120, 90, 150, 60, 130, 180, 100}));
    catalog.registerMetric(MakeMetric("heartRate", "Heart Rate", domain::MetricCategory::Health),
                           [](const domain::CalendarDay&) -> std::optional<double> {
                               throw domain::ProviderUnavailableError("health store unreachable");
                           });

    application::EngineConfig config;
    config.maxWorkers = 2;
    CorrelationEngine engine(catalog, config, fixedClock(BaseDay() + 6));
    CorrelationScan scan = engine.findCorrelations({}, 6);

    assert(scan.pairsTotal == 3 && scan.pairsEvaluated == 3);
    assert(scan.results.size() == 1 && "Healthy pairs still produce results.");
    assert(scan.failures.size() == 2);
    for (const auto& f : scan.failures) {
        assert(f.metricX.key == "heartRate" || f.metricY.key == "heartRate");
        assert(f.message.find("health store unreachable") != std::string::npos);
    }

    bool propagated = false;
    try {
        engine.analyzeRelationship(kSleep, MakeMetric("heartRate", "", domain::MetricCategory::Health));
    } catch (const domain::ProviderUnavailableError&) {
        propagated = true;
    }
    assert(propagated && "analyzeRelationship reports provider failures to the caller.");
}

void testCancellationAndProgress() {
    application::MetricCatalog catalog;
    registerPanel(catalog);

    application::EngineConfig config;
    config.maxWorkers = 1;
    CorrelationEngine engine(catalog, config, fixedClock(BaseDay() + 14));

    int polls = 0;
    std::vector<float> progress;
    application::ScanControl control;
    control.isCancelled = [&polls]() { return ++polls > 2; };
    control.onProgress = [&progress](float p) { progress.push_back(p); };

    CorrelationScan scan = engine.findCorrelations({}, 14, control);
    assert(scan.cancelled);
    assert(scan.pairsEvaluated == 2 && scan.pairsTotal == 6);
    assert(progress.size() == 2);
    assert(Near(progress.back(), 2.0f / 6.0f, 1e-6));

    progress.clear();
    application::ScanControl progressOnly;
    progressOnly.onProgress = [&progress](float p) { progress.push_back(p); };
    CorrelationScan full = engine.findCorrelations({}, 14, progressOnly);
    assert(!full.cancelled && full.pairsEvaluated == 6);
    assert(progress.size() == 6 && Near(progress.back(), 1.0f, 1e-6));
}

void testInvalidInput() {
    application::MetricCatalog catalog;
    catalog.registerMetric(kSleep, Consecutive({7, 6, 8}));
    CorrelationEngine engine(catalog, application::EngineConfig{}, fixedClock(BaseDay() + 6));

    bool unknown = false;
    try {
        engine.findCorrelations({kSleep, kFocus}, 6);
    } catch (const domain::UnknownMetricError& e) {
        unknown = e.key() == "focusMinutes";
    }
    assert(unknown);

    bool negative = false;
    try {
        engine.findCorrelations({}, -1);
    } catch (const std::invalid_argument&) {
        negative = true;
    }
    assert(negative);

    // A single metric has no pairs
    CorrelationScan single = engine.findCorrelations({}, 6);
    assert(single.pairsTotal == 0 && single.results.empty() && !single.cancelled);
}

} // namespace

int main() {
    std::cout << "[Test] Starting CorrelationEngine Test..." << std::endl;

    testSleepFocusScenario();
    testInsufficientOverlap();
    testLagScenario();
    testLaterKeyLeadsByOneDay();
    testOrderingAndPermutation();
    testPartialFailure();
    testCancellationAndProgress();
    testInvalidInput();

    std::cout << "[PASS] CorrelationEngine Test." << std::endl;
    return 0;
}
