#include "OutputWriter.hpp"
#include <fstream>
#include <stdexcept>

namespace SEBM {

namespace {

std::ofstream openCSV(const std::string& filename) {
    std::ofstream csv(filename);
    if (!csv.is_open()) {
        throw std::runtime_error("OutputWriter: cannot open " + filename);
    }
    csv.precision(12);
    return csv;
}

void finish(std::ofstream& csv, const std::string& filename) {
    csv.flush();
    if (!csv) {
        throw std::runtime_error("OutputWriter: write failed for " + filename);
    }
}

} // namespace

void OutputWriter::writeTrajectory(const std::string& filename, const Trajectory& traj) {
    std::ofstream csv = openCSV(filename);

    csv << "time,temperature,albedo\n";
    for (size_t i = 0; i < traj.size(); ++i) {
        csv << traj.times[i] << ","
            << traj.states[i].temperature << ","
            << traj.states[i].albedo << "\n";
    }

    finish(csv, filename);
}

void OutputWriter::writeEquilibria(const std::string& filename,
                                   const std::vector<EquilibriumPoint>& roots) {
    std::ofstream csv = openCSV(filename);

    csv << "temperature,albedo,residual,iterations,stable\n";
    for (const auto& r : roots) {
        csv << r.temperature << ","
            << r.albedo << ","
            << r.residual << ","
            << r.iterations << ","
            << (r.stable ? 1 : 0) << "\n";
    }

    finish(csv, filename);
}

void OutputWriter::writeRunStatistics(const std::string& filename,
                                      const SummaryStatistics& stats) {
    std::ofstream csv = openCSV(filename);

    csv << "run,temperature_mean,temperature_std,temperature_cov,"
        << "albedo_mean,albedo_std,final_temperature\n";
    for (size_t r = 0; r < stats.runs.size(); ++r) {
        const RunStatistics& s = stats.runs[r];
        csv << r << ","
            << s.temperature_mean << ","
            << s.temperature_std << ","
            << s.temperature_cov << ","
            << s.albedo_mean << ","
            << s.albedo_std << ","
            << stats.final_temperatures[r] << "\n";
    }

    finish(csv, filename);
}

void OutputWriter::writeEnsemble(const std::string& filename, const Ensemble& ensemble) {
    std::ofstream csv = openCSV(filename);

    csv << "run,step,time,temperature,albedo\n";
    const std::vector<double>& times = ensemble.times();
    for (size_t r = 0; r < ensemble.numRuns(); ++r) {
        const double* T = ensemble.temperatureRun(r);
        const double* a = ensemble.albedoRun(r);
        for (size_t i = 0; i < ensemble.numSteps(); ++i) {
            csv << r << "," << i << "," << times[i] << ","
                << T[i] << "," << a[i] << "\n";
        }
    }

    finish(csv, filename);
}

} // namespace SEBM
