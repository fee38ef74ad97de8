#ifndef ENSEMBLE_STATISTICS_HPP
#define ENSEMBLE_STATISTICS_HPP

#include "SEBM.hpp"
#include "StochasticEnsemble.hpp"
#include <vector>

namespace SEBM {

/**
 * @brief Cross-run distribution of a scalar
 *
 * std_dev is the sample standard deviation (n - 1). Percentiles use linear
 * interpolation between order statistics.
 */
struct DistributionSummary {
    double mean = 0.0;
    double std_dev = 0.0;
    double min = 0.0;
    double max = 0.0;
    double p10 = 0.0;
    double p50 = 0.0;
    double p90 = 0.0;
};

/**
 * @brief Temporal statistics of one realization
 *
 * Standard deviations are population values (divide by the sample count).
 */
struct RunStatistics {
    double temperature_mean = 0.0;
    double temperature_std = 0.0;
    double temperature_cov = 0.0;       // std / mean
    double albedo_mean = 0.0;
    double albedo_std = 0.0;
};

struct SummaryStatistics {
    std::vector<RunStatistics> runs;

    std::vector<double> final_temperatures;     // One per run
    DistributionSummary final_temperature;
    DistributionSummary run_mean_temperature;

    double ensemble_mean_temperature = 0.0;     // Mean of per-run means
    double standard_error = 0.0;                // std(run means) / sqrt(numRuns)

    std::size_t burn_in_steps = 0;

    std::vector<double> runMeans() const;
    std::vector<double> runStdDevs() const;
    std::vector<double> runCoVs() const;
};

/**
 * @brief Post-hoc aggregation of an Ensemble
 *
 * Temporal statistics are computed over a single run's series; cross-run
 * quantities are built from one scalar per run.
 */
class EnsembleStatistics {
public:
    /**
     * @brief Per-run and cross-run statistics
     * @param burn_in_steps Leading steps excluded from the temporal statistics
     * @throws UndefinedCoV if a run's mean temperature is exactly zero
     * @throws std::invalid_argument if burn-in leaves no samples
     */
    static SummaryStatistics summarize(const Ensemble& ensemble,
                                       std::size_t burn_in_steps = 0);

    static RunStatistics summarizeRun(const Ensemble& ensemble, std::size_t run,
                                      std::size_t burn_in_steps = 0);

    static double mean(const double* data, std::size_t n);
    static double mean(const std::vector<double>& data);

    // Population standard deviation
    static double stdDev(const double* data, std::size_t n);
    static double stdDev(const std::vector<double>& data);

    // Sample standard deviation; zero for fewer than two values
    static double sampleStdDev(const std::vector<double>& data);

    /**
     * @throws UndefinedCoV when mean == 0 (run tags the exception)
     */
    static double coefficientOfVariation(double mean, double std_dev, int run = -1);

    // Linear interpolation, q in [0, 1]
    static double percentile(std::vector<double> data, double q);

    static DistributionSummary describe(const std::vector<double>& data);
};

} // namespace SEBM

#endif // ENSEMBLE_STATISTICS_HPP
