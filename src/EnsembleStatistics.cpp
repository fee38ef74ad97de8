#include "EnsembleStatistics.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace SEBM {

std::vector<double> SummaryStatistics::runMeans() const {
    std::vector<double> values;
    values.reserve(runs.size());
    for (const auto& r : runs) values.push_back(r.temperature_mean);
    return values;
}

std::vector<double> SummaryStatistics::runStdDevs() const {
    std::vector<double> values;
    values.reserve(runs.size());
    for (const auto& r : runs) values.push_back(r.temperature_std);
    return values;
}

std::vector<double> SummaryStatistics::runCoVs() const {
    std::vector<double> values;
    values.reserve(runs.size());
    for (const auto& r : runs) values.push_back(r.temperature_cov);
    return values;
}

double EnsembleStatistics::mean(const double* data, std::size_t n) {
    if (n == 0) {
        throw std::invalid_argument("EnsembleStatistics: mean of an empty series");
    }
    double sum = 0.0;
    for (std::size_t i = 0; i < n; ++i) sum += data[i];
    return sum / static_cast<double>(n);
}

double EnsembleStatistics::mean(const std::vector<double>& data) {
    return mean(data.data(), data.size());
}

double EnsembleStatistics::stdDev(const double* data, std::size_t n) {
    const double m = mean(data, n);
    double sum_sq = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double d = data[i] - m;
        sum_sq += d * d;
    }
    return std::sqrt(sum_sq / static_cast<double>(n));
}

double EnsembleStatistics::stdDev(const std::vector<double>& data) {
    return stdDev(data.data(), data.size());
}

double EnsembleStatistics::sampleStdDev(const std::vector<double>& data) {
    if (data.size() < 2) return 0.0;
    const double m = mean(data);
    double sum_sq = 0.0;
    for (double x : data) sum_sq += (x - m) * (x - m);
    return std::sqrt(sum_sq / static_cast<double>(data.size() - 1));
}

double EnsembleStatistics::coefficientOfVariation(double mean, double std_dev, int run) {
    if (mean == 0.0) {
        std::ostringstream msg;
        msg << "EnsembleStatistics: coefficient of variation undefined for zero mean";
        if (run >= 0) msg << " (run " << run << ")";
        throw UndefinedCoV(msg.str(), run);
    }
    return std_dev / mean;
}

double EnsembleStatistics::percentile(std::vector<double> data, double q) {
    if (data.empty()) {
        throw std::invalid_argument("EnsembleStatistics: percentile of an empty set");
    }
    if (!(q >= 0.0 && q <= 1.0)) {
        throw std::invalid_argument("EnsembleStatistics: percentile fraction must lie in [0, 1]");
    }
    std::sort(data.begin(), data.end());

    const double pos = q * static_cast<double>(data.size() - 1);
    const std::size_t lo = static_cast<std::size_t>(std::floor(pos));
    const std::size_t hi = std::min(lo + 1, data.size() - 1);
    const double frac = pos - static_cast<double>(lo);
    return data[lo] + frac * (data[hi] - data[lo]);
}

DistributionSummary EnsembleStatistics::describe(const std::vector<double>& data) {
    DistributionSummary d;
    d.mean = mean(data);
    d.std_dev = sampleStdDev(data);
    const auto range = std::minmax_element(data.begin(), data.end());
    d.min = *range.first;
    d.max = *range.second;
    d.p10 = percentile(data, 0.10);
    d.p50 = percentile(data, 0.50);
    d.p90 = percentile(data, 0.90);
    return d;
}

RunStatistics EnsembleStatistics::summarizeRun(const Ensemble& ensemble, std::size_t run,
                                               std::size_t burn_in_steps) {
    if (burn_in_steps >= ensemble.numSteps()) {
        throw std::invalid_argument("EnsembleStatistics: burn-in covers the whole series");
    }
    const std::size_t n = ensemble.numSteps() - burn_in_steps;
    const double* T = ensemble.temperatureRun(run) + burn_in_steps;
    const double* a = ensemble.albedoRun(run) + burn_in_steps;

    RunStatistics s;
    s.temperature_mean = mean(T, n);
    s.temperature_std = stdDev(T, n);
    s.temperature_cov = coefficientOfVariation(s.temperature_mean, s.temperature_std,
                                               static_cast<int>(run));
    s.albedo_mean = mean(a, n);
    s.albedo_std = stdDev(a, n);
    return s;
}

SummaryStatistics EnsembleStatistics::summarize(const Ensemble& ensemble,
                                                std::size_t burn_in_steps) {
    if (ensemble.numRuns() == 0 || ensemble.numSteps() == 0) {
        throw std::invalid_argument("EnsembleStatistics: empty ensemble");
    }
    if (ensemble.hasFailures()) {
        throw std::invalid_argument("EnsembleStatistics: ensemble holds diverged runs; "
                                    "summarize subset(completedRuns()) instead");
    }

    SummaryStatistics stats;
    stats.burn_in_steps = burn_in_steps;
    stats.runs.reserve(ensemble.numRuns());
    for (std::size_t r = 0; r < ensemble.numRuns(); ++r) {
        stats.runs.push_back(summarizeRun(ensemble, r, burn_in_steps));
    }

    stats.final_temperatures = ensemble.finalTemperatures();
    stats.final_temperature = describe(stats.final_temperatures);

    const std::vector<double> means = stats.runMeans();
    stats.run_mean_temperature = describe(means);
    stats.ensemble_mean_temperature = stats.run_mean_temperature.mean;
    stats.standard_error = stats.run_mean_temperature.std_dev /
                           std::sqrt(static_cast<double>(means.size()));

    return stats;
}

} // namespace SEBM
