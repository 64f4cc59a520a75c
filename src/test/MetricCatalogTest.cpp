#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include "application/MetricCatalog.hpp"
#include "domain/DomainErrors.hpp"
#include "TestFixtures.hpp"

using namespace metriclens;
using namespace metriclens::test;

int main() {
    std::cout << "[Test] Starting MetricCatalog Test..." << std::endl;

    application::MetricCatalog catalog;
    auto steps = MakeMetric("steps", "Steps", domain::MetricCategory::Activity);
    auto sleep = MakeMetric("sleepHours", "Sleep Hours", domain::MetricCategory::Sleep);

    catalog.registerMetric(steps, Consecutive({1000, 2000, 3000}));
    catalog.registerMetric(sleep, [](const domain::CalendarDay& day) -> std::optional<double> {
        if (day == BaseDay()) return 7.5;
        if (day == BaseDay() + 1) return std::numeric_limits<double>::quiet_NaN();
        return std::nullopt;
    });

    // Duplicate keys are rejected and leave the catalog unchanged
    bool duplicate = false;
    try {
        catalog.registerMetric(MakeMetric("steps", "Other Steps", domain::MetricCategory::Health),
                               Consecutive({1}));
    } catch (const domain::DuplicateMetricError& e) {
        duplicate = true;
        assert(e.key() == "steps");
    }
    assert(duplicate);
    assert(catalog.size() == 2);
    assert(catalog.find("steps")->displayName == "Steps");

    // Null providers and empty keys are programming errors
    bool nullRejected = false;
    try {
        catalog.registerMetric(MakeMetric("mood", "Mood", domain::MetricCategory::Mood),
                               std::shared_ptr<const domain::ValueProvider>());
    } catch (const std::invalid_argument&) {
        nullRejected = true;
    }
    assert(nullRejected);
    assert(!catalog.contains("mood"));

    // Listing is sorted by key
    auto listed = catalog.listAvailable();
    assert(listed.size() == 2);
    assert(listed[0].key == "sleepHours");
    assert(listed[1].key == "steps");

    // Present, absent and non-finite values
    assert(catalog.valueFor(steps, BaseDay() + 2) == 3000.0);
    assert(!catalog.valueFor(steps, BaseDay() + 3));
    assert(catalog.valueFor(sleep, BaseDay()) == 7.5);
    assert(!catalog.valueFor(sleep, BaseDay() + 1) && "NaN readings count as missing.");

    bool unknown = false;
    try {
        catalog.valueFor(MakeMetric("ghost", "Ghost", domain::MetricCategory::Health), BaseDay());
    } catch (const domain::UnknownMetricError& e) {
        unknown = true;
        assert(e.key() == "ghost");
    }
    assert(unknown);

    // Callers can handle every engine error through the common base
    bool viaBase = false;
    try {
        catalog.registerMetric(steps, Consecutive({1, 2, 3}));
    } catch (const domain::MetricLensError& e) {
        viaBase = std::string(e.what()).find("steps") != std::string::npos;
    }
    assert(viaBase);

    std::cout << "[PASS] MetricCatalog Test." << std::endl;
    return 0;
}
