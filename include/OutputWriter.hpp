#ifndef OUTPUT_WRITER_HPP
#define OUTPUT_WRITER_HPP

#include "SEBM.hpp"
#include "EquilibriumSolver.hpp"
#include "StochasticEnsemble.hpp"
#include "EnsembleStatistics.hpp"
#include <string>
#include <vector>

namespace SEBM {

/**
 * @brief CSV files for the driver results
 *
 * Every writer throws std::runtime_error when the file cannot be opened or
 * written.
 */
class OutputWriter {
public:
    // time,temperature,albedo
    static void writeTrajectory(const std::string& filename, const Trajectory& traj);

    // temperature,albedo,residual,iterations,stable
    static void writeEquilibria(const std::string& filename,
                                const std::vector<EquilibriumPoint>& roots);

    // One row per run: temporal statistics and final temperature
    static void writeRunStatistics(const std::string& filename,
                                   const SummaryStatistics& stats);

    // Long format: run,step,time,temperature,albedo
    static void writeEnsemble(const std::string& filename, const Ensemble& ensemble);
};

} // namespace SEBM

#endif // OUTPUT_WRITER_HPP
