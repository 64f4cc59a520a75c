/**
 * @file CorrelationEngine.cpp
 * @brief Implementation of CorrelationEngine.
 */

#include "application/CorrelationEngine.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>
#include "domain/DomainErrors.hpp"
#include "domain/Identifiers.hpp"

namespace metriclens::application {

CorrelationEngine::CorrelationEngine(const MetricCatalog& catalog, EngineConfig config, domain::DayClock clock)
    : m_catalog(catalog),
      m_computer(SeriesAligner(catalog), std::move(config)),
      m_clock(clock ? std::move(clock) : domain::DayClock(&domain::CalendarDay::Today)) {}

std::vector<domain::DataMetric> CorrelationEngine::listAvailableMetrics() const {
    return m_catalog.listAvailable();
}

CorrelationScan CorrelationEngine::findCorrelations(const std::vector<domain::DataMetric>& metrics,
                                                    int minimumDays,
                                                    const ScanControl& control) const {
    if (minimumDays < 0) {
        throw std::invalid_argument("minimumDays must be non-negative (got " + std::to_string(minimumDays) + ")");
    }
    return findCorrelations(metrics, domain::DateRange::LastNDays(m_clock(), minimumDays), control);
}

CorrelationScan CorrelationEngine::findCorrelations(const std::vector<domain::DataMetric>& metrics,
                                                    const domain::DateRange& range,
                                                    const ScanControl& control) const {
    const auto resolved = resolveMetrics(metrics);

    std::vector<std::pair<std::size_t, std::size_t>> pairs;
    for (std::size_t i = 0; i < resolved.size(); ++i) {
        for (std::size_t j = i + 1; j < resolved.size(); ++j) {
            pairs.emplace_back(i, j);
        }
    }

    CorrelationScan scan;
    scan.range = range;
    scan.pairsTotal = pairs.size();

    if (config().verbose) {
        std::cout << "[CorrelationEngine] Scanning " << pairs.size() << " pairs of " << resolved.size()
                  << " metrics over " << range.toString() << std::endl;
    }

    std::vector<PairOutcome> outcomes(pairs.size());
    std::vector<std::exception_ptr> errors(pairs.size());
    std::atomic<std::size_t> nextPair{0};
    std::atomic<std::size_t> finished{0};
    std::atomic<bool> stopRequested{false};
    std::mutex controlMutex;

    auto worker = [&]() {
        while (!stopRequested) {
            if (control.isCancelled) {
                std::lock_guard<std::mutex> lock(controlMutex);
                if (control.isCancelled()) {
                    stopRequested = true;
                    break;
                }
            }

            const std::size_t index = nextPair.fetch_add(1);
            if (index >= pairs.size()) break;

            try {
                outcomes[index] = evaluatePair(resolved[pairs[index].first], resolved[pairs[index].second], range);
            } catch (...) {
                errors[index] = std::current_exception();
                stopRequested = true;
            }

            const std::size_t done = ++finished;
            if (control.onProgress) {
                std::lock_guard<std::mutex> lock(controlMutex);
                control.onProgress(static_cast<float>(done) / static_cast<float>(pairs.size()));
            }
        }
    };

    const unsigned workers = workerCount(pairs.size());
    if (workers <= 1) {
        worker();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (unsigned w = 0; w < workers; ++w) {
            pool.emplace_back(worker);
        }
        for (auto& t : pool) {
            if (t.joinable()) t.join();
        }
    }

    // Anything other than an unavailable provider is a defect and aborts the scan.
    for (const auto& error : errors) {
        if (error) std::rethrow_exception(error);
    }

    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        auto& outcome = outcomes[i];
        if (!outcome.evaluated) continue;
        ++scan.pairsEvaluated;

        if (outcome.failure) {
            const auto& x = resolved[pairs[i].first];
            const auto& y = resolved[pairs[i].second];
            std::cerr << "[CorrelationEngine] Skipping pair " << x.key << "|" << y.key << ": "
                      << *outcome.failure << std::endl;
            scan.failures.push_back(PairFailure{x, y, *outcome.failure});
            continue;
        }
        if (outcome.result && outcome.result->significance != domain::Significance::None) {
            scan.results.push_back(std::move(*outcome.result));
        }
    }

    std::sort(scan.results.begin(), scan.results.end(),
              [](const domain::CorrelationResult& a, const domain::CorrelationResult& b) {
                  const double sa = a.strength();
                  const double sb = b.strength();
                  if (sa != sb) return sa > sb;
                  if (a.sampleSize != b.sampleSize) return a.sampleSize > b.sampleSize;
                  return a.pairKey() < b.pairKey();
              });

    scan.cancelled = scan.pairsEvaluated < scan.pairsTotal;
    if (scan.cancelled) {
        std::cout << "[CorrelationEngine] Scan cancelled after " << scan.pairsEvaluated << "/" << scan.pairsTotal
                  << " pairs." << std::endl;
    } else if (config().verbose) {
        std::cout << "[CorrelationEngine] Scan complete: " << scan.results.size() << " results, "
                  << scan.failures.size() << " failed pairs." << std::endl;
    }
    return scan;
}

std::optional<domain::MetricRelationship> CorrelationEngine::analyzeRelationship(const domain::DataMetric& metricX,
                                                                                 const domain::DataMetric& metricY) const {
    return analyzeRelationship(metricX, metricY,
                               domain::DateRange::LastNDays(m_clock(), config().defaultAnalysisDays));
}

std::optional<domain::MetricRelationship> CorrelationEngine::analyzeRelationship(const domain::DataMetric& metricX,
                                                                                 const domain::DataMetric& metricY,
                                                                                 const domain::DateRange& range) const {
    auto a = resolve(metricX);
    auto b = resolve(metricY);
    if (a.key == b.key) return std::nullopt;
    // Same orientation rules as findCorrelations, whatever order the caller used.
    if (b.key < a.key) std::swap(a, b);

    auto best = m_computer.bestLag(a, b, range);
    if (!best) return std::nullopt;

    domain::MetricRelationship relationship;
    relationship.metricX = best->leader;
    relationship.metricY = best->follower;
    relationship.range = range;
    relationship.lag = best->lag;
    relationship.points = std::move(best->points);
    return relationship;
}

std::vector<domain::DataMetric> CorrelationEngine::resolveMetrics(const std::vector<domain::DataMetric>& metrics) const {
    if (metrics.empty()) {
        return m_catalog.listAvailable();
    }

    std::vector<domain::DataMetric> resolved;
    resolved.reserve(metrics.size());
    for (const auto& metric : metrics) {
        resolved.push_back(resolve(metric));
    }
    std::sort(resolved.begin(), resolved.end(),
              [](const domain::DataMetric& a, const domain::DataMetric& b) { return a.key < b.key; });
    resolved.erase(std::unique(resolved.begin(), resolved.end()), resolved.end());
    return resolved;
}

domain::DataMetric CorrelationEngine::resolve(const domain::DataMetric& metric) const {
    auto registered = m_catalog.find(metric.key);
    if (!registered) {
        throw domain::UnknownMetricError(metric.key);
    }
    return *registered;
}

CorrelationEngine::PairOutcome CorrelationEngine::evaluatePair(const domain::DataMetric& metricX,
                                                               const domain::DataMetric& metricY,
                                                               const domain::DateRange& range) const {
    PairOutcome outcome;
    outcome.evaluated = true;
    try {
        auto best = m_computer.bestLag(metricX, metricY, range);
        if (best) {
            outcome.result = MakeResult(range, *best);
        }
    } catch (const domain::ProviderUnavailableError& e) {
        outcome.failure = e.what();
    }
    return outcome;
}

unsigned CorrelationEngine::workerCount(std::size_t pairs) const {
    unsigned limit = config().maxWorkers;
    if (limit == 0) {
        limit = std::max(1u, std::thread::hardware_concurrency());
    }
    return static_cast<unsigned>(std::min<std::size_t>(limit, pairs));
}

domain::CorrelationResult CorrelationEngine::MakeResult(const domain::DateRange& range, const LaggedScore& scored) {
    domain::CorrelationResult result;
    result.metricX = scored.leader;
    result.metricY = scored.follower;
    result.correlationCoefficient = scored.score.coefficient;
    result.confidenceScore = scored.score.confidence;
    result.sampleSize = scored.score.sampleSize;
    result.lag = scored.lag;
    result.significance = CorrelationComputer::classify(scored.score.coefficient);
    result.id = domain::NameBasedUuid(result.pairKey() + "@" + std::to_string(scored.lag) + "#" + range.toString());
    result.description = Describe(result);
    return result;
}

std::string CorrelationEngine::Describe(const domain::CorrelationResult& result) {
    std::string strength = domain::SignificanceToString(result.significance);
    if (!strength.empty()) strength[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(strength[0])));

    std::ostringstream ss;
    ss << strength << (result.correlationCoefficient >= 0 ? " positive" : " negative")
       << " correlation between " << result.metricX.displayName << " and " << result.metricY.displayName;
    if (result.lag > 0) {
        ss << " " << result.lag << (result.lag == 1 ? " day" : " days") << " later";
    }
    ss << " (r = " << std::fixed << std::setprecision(2) << result.correlationCoefficient
       << ", n = " << result.sampleSize << ")";
    return ss.str();
}

} // namespace metriclens::application
